#include "merkleTree.h"

#include <algorithm>
#include <string>
#include <utility>

#include "errors.h"
#include "serialization.h"

MerkleTree::MerkleTree(const std::vector<Digest>& leaves) {
    if (leaves.empty()) {
        throw EmptyInputError("Cannot build Merkle tree from empty leaf list");
    }

    // level 0 keeps its own copy so the caller's vector is never touched
    levels.push_back(leaves);

    // reduce level by level until we reach the single root
    while (levels.back().size() > 1) {
        const std::vector<Digest>& currentLevel = levels.back();

        std::vector<Digest> nextLevel;
        nextLevel.reserve((currentLevel.size() + 1) / 2);
        for (size_t i = 0; i < currentLevel.size(); i += 2) {
            if (i + 1 < currentLevel.size()) {
                nextLevel.push_back(HashPair(currentLevel[i], currentLevel[i + 1]));
            } else {
                // odd one out moves up unchanged, it is neither duplicated nor hashed
                nextLevel.push_back(currentLevel[i]);
            }
        }

        levels.push_back(std::move(nextLevel));
    }
}

std::optional<size_t> MerkleTree::FindLeaf(const Digest& target) const {
    const std::vector<Digest>& leaves = levels[0];

    auto it = std::find(leaves.begin(), leaves.end(), target);
    if (it == leaves.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - leaves.begin());
}

MerkleProof MerkleTree::GenerateProof(const Digest& target) const {
    std::optional<size_t> index = FindLeaf(target);
    if (!index) {
        throw LeafNotFoundError("Target leaf " + DigestToHex(target) + " not found in tree");
    }
    return GenerateProof(*index);
}

MerkleProof MerkleTree::GenerateProof(size_t leafIndex) const {
    if (leafIndex >= levels[0].size()) {
        throw LeafNotFoundError("leafIndex " + std::to_string(leafIndex) +
                                " out of range (leaf level has " +
                                std::to_string(levels[0].size()) + " entries)");
    }

    MerkleProof proof;
    proof.leaf = levels[0][leafIndex];
    proof.leafIndex = leafIndex;
    proof.merkleRoot = GetRootHash();

    size_t idx = leafIndex;

    // walk from the leaf level up, collecting the partner at each level
    for (size_t level = 0; level + 1 < levels.size(); level++) {
        const std::vector<Digest>& currentLevel = levels[level];

        size_t siblingIdx = idx ^ 1;

        // a promoted node has no partner and contributes nothing at this level
        if (siblingIdx < currentLevel.size()) {
            proof.path.push_back(currentLevel[siblingIdx]);
        }

        idx /= 2;
    }

    return proof;
}
