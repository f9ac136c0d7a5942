#ifndef AIRDROP_H
#define AIRDROP_H

#include <cstddef>
#include <istream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "digest.h"
#include "merkleProof.h"
#include "merkleTree.h"

using json = nlohmann::json;

struct AirdropEntry {
        Address account;
        std::string amount;  // canonical base-10 text
        Digest leaf;         // HashAccountAmount(account, amount)
};

// rows are "address,amount[,...]" after a header row; bad rows are skipped with a warning
std::vector<AirdropEntry> ParseAirdropCSV(std::istream& in, const std::string& source);
std::vector<AirdropEntry> ReadAirdropCSV(const std::string& path);

// a claim tree over account/amount leaves in file order
class Airdrop {
    private:
        std::vector<AirdropEntry> entries;
        MerkleTree tree;

        static std::vector<Digest> collectLeaves(const std::vector<AirdropEntry>& entries);

    public:
        explicit Airdrop(std::vector<AirdropEntry> claims);

        const std::vector<AirdropEntry>& GetEntries() const { return entries; }
        const Digest& GetRoot() const { return tree.GetRootHash(); }

        // by position, so repeated rows each get the proof of their own slot
        MerkleProof GetProof(size_t index) const { return tree.GenerateProof(index); }

        json ToJson() const;

        // .root, .leaves, .proof and optionally .proofs.json beside source (or in -outdir)
        void WriteArtifacts(const std::string& source, bool allProofs) const;
};

#endif
