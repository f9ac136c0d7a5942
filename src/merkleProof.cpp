#include "merkleProof.h"

#include "crypto.h"

Digest HashPair(const Digest& a, const Digest& b) {
    if (a < b) {
        return Keccak256Hash(a.data(), a.size(), b.data(), b.size());
    }
    return Keccak256Hash(b.data(), b.size(), a.data(), a.size());
}

bool VerifyMerkleProof(const std::vector<Digest>& path, const Digest& root, const Digest& target) {
    Digest current = target;

    for (const Digest& sibling : path) {
        current = HashPair(current, sibling);
    }

    return current == root;
}

bool VerifyMerkleProof(const MerkleProof& proof) {
    return VerifyMerkleProof(proof.path, proof.merkleRoot, proof.leaf);
}
