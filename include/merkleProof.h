#ifndef MERKLE_PROOF_H
#define MERKLE_PROOF_H

#include <cstddef>
#include <vector>

#include "digest.h"

struct MerkleProof {
        Digest leaf;               // the leaf we want to prove
        size_t leafIndex;          // its position in the leaf set
        std::vector<Digest> path;  // partner hashes from the leaf level up to the root
        Digest merkleRoot;         // the expected destination
};

// keccak256 of the two nodes in ascending byte order, so HashPair(a, b) == HashPair(b, a)
Digest HashPair(const Digest& a, const Digest& b);

// folds the path into the target; no left/right tags are needed since pairing is sorted
bool VerifyMerkleProof(const std::vector<Digest>& path, const Digest& root, const Digest& target);

bool VerifyMerkleProof(const MerkleProof& proof);

#endif
