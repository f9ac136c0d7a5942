#include "airdrop.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "amount.h"
#include "config.h"
#include "errors.h"
#include "leafHash.h"
#include "serialization.h"

static std::string trimField(const std::string& field) {
    size_t begin = field.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = field.find_last_not_of(" \t\r\n");
    std::string trimmed = field.substr(begin, end - begin + 1);

    if (trimmed.size() >= 2 && trimmed.front() == '"' && trimmed.back() == '"') {
        trimmed = trimmed.substr(1, trimmed.size() - 2);
    }
    return trimmed;
}

static std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;

    while (std::getline(ss, field, ',')) {
        fields.push_back(trimField(field));
    }
    return fields;
}

static std::string formatPath(const std::vector<Digest>& path) {
    std::string out = "[";
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) {
            out += ",";
        }
        out += DigestToHex(path[i]);
    }
    return out + "]";
}

static bool writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

std::vector<AirdropEntry> ParseAirdropCSV(std::istream& in, const std::string& source) {
    std::vector<AirdropEntry> entries;
    std::string line;
    size_t rowNumber = 0;
    size_t dataRows = 0;

    while (std::getline(in, line)) {
        rowNumber++;

        // first row is the header
        if (rowNumber == 1 || trimField(line).empty()) {
            continue;
        }
        dataRows++;

        std::vector<std::string> fields = splitRow(line);
        if (fields.size() < 2) {
            std::cerr << "[airdrop] Warning: Skipping row " << rowNumber
                      << " (insufficient columns)" << std::endl;
            continue;
        }

        AirdropEntry entry;
        try {
            entry.account = HexToAddress(fields[0]);
        } catch (const InvalidEncodingError&) {
            std::cerr << "[airdrop] Warning: Skipping row " << rowNumber << " (invalid address: "
                      << fields[0] << ")" << std::endl;
            continue;
        }

        if (entry.account == Address{}) {
            std::cerr << "[airdrop] Warning: Skipping row " << rowNumber
                      << " (zero address)" << std::endl;
            continue;
        }

        try {
            BN_ptr amount = ParseAmount(fields[1]);
            entry.leaf = HashAccountAmount(entry.account, amount.get());
            entry.amount = AmountToString(amount.get());
        } catch (const InvalidEncodingError&) {
            std::cerr << "[airdrop] Warning: Skipping row " << rowNumber << " (invalid amount: "
                      << fields[1] << ")" << std::endl;
            continue;
        } catch (const AmountOverflowError&) {
            std::cerr << "[airdrop] Warning: Skipping row " << rowNumber
                      << " (amount exceeds uint256: " << fields[1] << ")" << std::endl;
            continue;
        }

        entries.push_back(std::move(entry));
    }

    if (dataRows == 0) {
        throw std::runtime_error("CSV " + source +
                                 " must have at least a header and one data row");
    }
    if (entries.empty()) {
        throw std::runtime_error("No valid entries found in CSV " + source);
    }

    std::cout << "Processed " << entries.size() << " valid entries out of " << dataRows
              << " total rows" << std::endl;
    return entries;
}

std::vector<AirdropEntry> ReadAirdropCSV(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + path);
    }
    return ParseAirdropCSV(file, path);
}

std::vector<Digest> Airdrop::collectLeaves(const std::vector<AirdropEntry>& entries) {
    std::vector<Digest> leaves;
    leaves.reserve(entries.size());
    for (const AirdropEntry& entry : entries) {
        leaves.push_back(entry.leaf);
    }
    return leaves;
}

Airdrop::Airdrop(std::vector<AirdropEntry> claims)
    : entries(std::move(claims)), tree(collectLeaves(entries)) {}

json Airdrop::ToJson() const {
    json claims = json::array();

    for (size_t i = 0; i < entries.size(); i++) {
        MerkleProof proof = GetProof(i);

        json path = json::array();
        for (const Digest& sibling : proof.path) {
            path.push_back(DigestToHex(sibling));
        }

        claims.push_back({{"address", AddressToHex(entries[i].account)},
                          {"amount", entries[i].amount},
                          {"leaf", DigestToHex(entries[i].leaf)},
                          {"index", i},
                          {"proof", path}});
    }

    return {{"root", DigestToHex(GetRoot())}, {"claims", claims}};
}

void Airdrop::WriteArtifacts(const std::string& source, bool allProofs) const {
    std::string rootFile = Config::GetArtifactPath(source, ".root");
    if (writeTextFile(rootFile, DigestToHex(GetRoot()))) {
        std::cout << "Merkle root saved to: " << rootFile << std::endl;
    } else {
        std::cerr << "[airdrop] Warning: Could not save root file: " << rootFile << std::endl;
    }

    if (entries.size() > Policy::MAX_LEAVES_FILE_ENTRIES) {
        std::cout << "Skipping leaves file generation for large dataset (" << entries.size()
                  << " entries)" << std::endl;
    } else {
        std::string leavesFile = Config::GetArtifactPath(source, ".leaves");
        std::string content = "address,amount,leaf\n";
        for (const AirdropEntry& entry : entries) {
            content += AddressToHex(entry.account) + "," + entry.amount + "," +
                       DigestToHex(entry.leaf) + "\n";
        }

        if (writeTextFile(leavesFile, content)) {
            std::cout << "All leaves saved to: " << leavesFile << std::endl;
        } else {
            std::cerr << "[airdrop] Warning: Could not save leaves file: " << leavesFile
                      << std::endl;
        }
    }

    // proof for the first entry
    const AirdropEntry& first = entries.front();
    MerkleProof proof = GetProof(0);
    std::string proofFile = Config::GetArtifactPath(source, ".proof");
    std::string proofContent = "address,amount,leaf,proof\n" + AddressToHex(first.account) +
                               "," + first.amount + "," + DigestToHex(first.leaf) + ",\"" +
                               formatPath(proof.path) + "\"\n";

    if (writeTextFile(proofFile, proofContent)) {
        std::cout << "First entry proof saved to: " << proofFile << std::endl;
    } else {
        std::cerr << "[airdrop] Warning: Could not save proof file: " << proofFile << std::endl;
    }

    if (allProofs) {
        std::string proofsFile = Config::GetArtifactPath(source, ".proofs.json");
        if (writeTextFile(proofsFile, ToJson().dump(2) + "\n")) {
            std::cout << "All proofs saved to: " << proofsFile << std::endl;
        } else {
            std::cerr << "[airdrop] Warning: Could not save proofs file: " << proofsFile
                      << std::endl;
        }
    }
}
