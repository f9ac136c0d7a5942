#include "cli.h"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "airdrop.h"
#include "amount.h"
#include "config.h"
#include "errors.h"
#include "leafHash.h"
#include "merkleProof.h"
#include "merkleTree.h"
#include "serialization.h"

using json = nlohmann::json;

static std::string trimArg(const std::string& arg) {
    size_t begin = arg.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = arg.find_last_not_of(" \t\r\n");
    return arg.substr(begin, end - begin + 1);
}

static std::string joinPath(const std::vector<Digest>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) {
            out += ", ";
        }
        out += DigestToHex(path[i]);
    }
    return out;
}

void CLI::printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  root LEAF... - Generate the Merkle root of the given leaves\n";
    std::cout << "  proof TARGET LEAF... - Generate a Merkle proof for TARGET as JSON\n";
    std::cout << "  verify ROOT TARGET [PROOF...] - Verify a Merkle proof\n";
    std::cout << "  hash DATA - Hash arbitrary data to bytes32 with keccak256\n";
    std::cout << "  hash-address-amount ADDRESS AMOUNT - Hash address + uint256 amount like "
                 "keccak256(abi.encodePacked(address, amount))\n";
    std::cout << "  airdrop -csv FILE [-verbose] [-allproofs] - Build a claim tree from "
                 "address,amount rows and save root, leaves and proofs\n";
    std::cout << "\nLeaves starting with 0x are read as bytes32, anything else is hashed first.\n";
    std::cout << "\nGlobal flags:\n";
    std::cout << "  -outdir DIR - Write generated files to DIR (default: beside the input)\n";
}

std::vector<Digest> CLI::parseLeaves(const std::vector<std::string>& args) {
    std::vector<Digest> leaves;
    leaves.reserve(args.size());

    for (size_t i = 0; i < args.size(); i++) {
        std::string arg = trimArg(args[i]);

        if (!HasHexPrefix(arg)) {
            leaves.push_back(HashData(arg));
            continue;
        }

        try {
            leaves.push_back(HexToDigest(arg));
        } catch (const InvalidEncodingError& e) {
            throw InvalidEncodingError("Invalid hex at position " + std::to_string(i) + ": " +
                                       e.what());
        }
    }

    return leaves;
}

void CLI::generateRoot(const std::vector<std::string>& leafArgs) {
    MerkleTree tree(parseLeaves(leafArgs));

    std::cout << "Merkle Root: " << DigestToHex(tree.GetRootHash()) << std::endl;
}

void CLI::generateProof(const std::string& targetArg, const std::vector<std::string>& leafArgs) {
    Digest target = parseLeaves({targetArg})[0];
    MerkleTree tree(parseLeaves(leafArgs));

    MerkleProof proof = tree.GenerateProof(target);

    json path = json::array();
    for (const Digest& sibling : proof.path) {
        path.push_back(DigestToHex(sibling));
    }

    // JSON for easy integration with contract tooling
    json result = {{"target", DigestToHex(proof.leaf)},
                   {"root", DigestToHex(proof.merkleRoot)},
                   {"proof", path}};

    std::cout << result.dump(2) << std::endl;
}

void CLI::verifyProof(const std::string& rootArg, const std::string& targetArg,
                      const std::vector<std::string>& proofArgs) {
    Digest root = parseLeaves({rootArg})[0];
    Digest target = parseLeaves({targetArg})[0];
    std::vector<Digest> path = parseLeaves(proofArgs);

    bool valid = VerifyMerkleProof(path, root, target);
    std::cout << "Proof is valid: " << std::boolalpha << valid << std::endl;
}

void CLI::hashData(const std::string& data) {
    std::cout << "Hash: " << DigestToHex(HashData(data)) << std::endl;
}

void CLI::hashAddressAmount(const std::string& address, const std::string& amount) {
    Address account = HexToAddress(trimArg(address));
    if (account == Address{}) {
        throw std::runtime_error("Invalid address: " + address);
    }

    BN_ptr value = ParseAmount(trimArg(amount));
    Digest leaf = HashAccountAmount(account, value.get());

    std::cout << "Address: " << AddressToHex(account) << std::endl;
    std::cout << "Amount: " << AmountToString(value.get()) << std::endl;
    std::cout << "Hash: " << DigestToHex(leaf) << std::endl;
}

void CLI::airdrop(const std::string& csvFile, bool verbose, bool allProofs) {
    std::vector<AirdropEntry> entries = ReadAirdropCSV(csvFile);

    std::cout << "=== Processing CSV: " << csvFile << " ===" << std::endl;
    std::cout << "Total entries: " << entries.size() << std::endl << std::endl;

    for (size_t i = 0; i < entries.size(); i++) {
        if (verbose || i < Policy::PREVIEW_ENTRIES || i == entries.size() - 1) {
            std::cout << "Entry " << i + 1 << ": " << AddressToHex(entries[i].account)
                      << " (amount: " << entries[i].amount
                      << ") -> Leaf: " << DigestToHex(entries[i].leaf) << std::endl;
        } else if (i == Policy::PREVIEW_ENTRIES) {
            std::cout << "... (showing first " << Policy::PREVIEW_ENTRIES
                      << " and last entry, use -verbose for all entries)" << std::endl;
        }
    }

    Airdrop drop(std::move(entries));
    const AirdropEntry& first = drop.GetEntries().front();

    std::cout << "\n=== Merkle Root ===" << std::endl;
    std::cout << "Root: " << DigestToHex(drop.GetRoot()) << std::endl << std::endl;

    MerkleProof proof = drop.GetProof(0);

    std::cout << "=== Proof for First Entry ===" << std::endl;
    std::cout << "Address: " << AddressToHex(first.account) << std::endl;
    std::cout << "Amount: " << first.amount << std::endl;
    std::cout << "Leaf: " << DigestToHex(first.leaf) << std::endl;
    std::cout << "Proof: [" << joinPath(proof.path) << "]" << std::endl;
    std::cout << "Proof verification: " << std::boolalpha << VerifyMerkleProof(proof) << std::endl
              << std::endl;

    // call shape expected by the claim contract
    std::cout << "=== Solidity Contract Call ===" << std::endl;
    std::cout << "verifyAddress([" << joinPath(proof.path) << "], " << DigestToHex(drop.GetRoot())
              << ", " << AddressToHex(first.account) << ", " << first.amount << ")" << std::endl;

    drop.WriteArtifacts(csvFile, allProofs);

    if (drop.GetEntries().size() > Policy::SAMPLE_VERIFY_INDEX) {
        size_t idx = Policy::SAMPLE_VERIFY_INDEX;
        const AirdropEntry& sample = drop.GetEntries()[idx];

        std::cout << "\n=== Verification Test ===" << std::endl;
        std::cout << "Verifying entry " << idx + 1 << ": " << AddressToHex(sample.account)
                  << " (amount: " << sample.amount << ")" << std::endl;
        std::cout << "Verification result: " << std::boolalpha
                  << VerifyMerkleProof(drop.GetProof(idx)) << std::endl;
    }
}

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    // parse global -outdir flag
    int cmdStart = 1;
    if (std::string(argv[1]) == "-outdir") {
        if (argc < 4) {
            std::cout << "Error: -outdir requires a value\n";
            printUsage();
            return 1;
        }
        Config::SetOutputDir(argv[2]);
        cmdStart = 3;
    }

    if (cmdStart >= argc) {
        printUsage();
        return 1;
    }

    std::string command = argv[cmdStart];
    std::vector<std::string> args(argv + cmdStart + 1, argv + argc);

    if (command == "root") {
        if (args.empty()) {
            std::cout << "Error: root requires at least one leaf\n";
            printUsage();
            return 1;
        }
        generateRoot(args);
    } else if (command == "proof") {
        if (args.size() < 2) {
            std::cout << "Error: proof requires a target and at least one leaf\n";
            printUsage();
            return 1;
        }
        generateProof(args[0], std::vector<std::string>(args.begin() + 1, args.end()));
    } else if (command == "verify") {
        if (args.size() < 2) {
            std::cout << "Error: verify requires a root and a target\n";
            printUsage();
            return 1;
        }
        verifyProof(args[0], args[1], std::vector<std::string>(args.begin() + 2, args.end()));
    } else if (command == "hash") {
        if (args.size() != 1) {
            std::cout << "Error: hash requires exactly one argument\n";
            printUsage();
            return 1;
        }
        hashData(args[0]);
    } else if (command == "hash-address-amount") {
        if (args.size() != 2) {
            std::cout << "Error: hash-address-amount requires ADDRESS and AMOUNT\n";
            printUsage();
            return 1;
        }
        hashAddressAmount(args[0], args[1]);
    } else if (command == "airdrop") {
        std::string csvFile;
        bool verbose = false;
        bool allProofs = false;

        // parse flags
        for (size_t i = 0; i < args.size(); i++) {
            const std::string& flag = args[i];
            if (flag == "-verbose") {
                verbose = true;
            } else if (flag == "-allproofs") {
                allProofs = true;
            } else if (flag == "-csv" && i + 1 < args.size()) {
                csvFile = args[++i];
            } else {
                std::cout << "Error: unknown or incomplete flag " << flag << "\n";
                printUsage();
                return 1;
            }
        }

        if (csvFile.empty()) {
            std::cout << "Error: airdrop requires -csv FILE\n";
            printUsage();
            return 1;
        }

        airdrop(csvFile, verbose, allProofs);
    } else {
        std::cout << "Error: unknown command '" << command << "'\n";
        printUsage();
        return 1;
    }

    return 0;
}
