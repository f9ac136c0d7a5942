#ifndef MERKLETREE_H
#define MERKLETREE_H

#include <cstddef>
#include <optional>
#include <vector>

#include "digest.h"
#include "merkleProof.h"

// the tree is stored as a flat list of levels:
// levels[0] = the leaves, in caller order
// levels[1] = sorted-pair hashes of consecutive leaves, an odd last leaf promoted as is
// levels[N] = [ root hash ]
class MerkleTree {
    private:
        std::vector<std::vector<Digest>> levels;

    public:
        explicit MerkleTree(const std::vector<Digest>& leaves);

        ~MerkleTree() = default;

        MerkleTree(const MerkleTree&) = default;
        MerkleTree& operator=(const MerkleTree&) = default;

        MerkleTree(MerkleTree&&) = default;
        MerkleTree& operator=(MerkleTree&&) = default;

        const Digest& GetRootHash() const { return levels.back()[0]; }
        const std::vector<Digest>& GetLeaves() const { return levels[0]; }
        size_t GetLeafCount() const { return levels[0].size(); }

        // number of levels above the leaves
        size_t GetDepth() const { return levels.size() - 1; }

        // first position holding target
        std::optional<size_t> FindLeaf(const Digest& target) const;

        MerkleProof GenerateProof(const Digest& target) const;
        MerkleProof GenerateProof(size_t leafIndex) const;
};

#endif
