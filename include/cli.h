#ifndef CLI_H
#define CLI_H

#include <string>
#include <vector>

#include "digest.h"

class CLI {
    private:
        void printUsage();

        // "0x..." is parsed as a bytes32, anything else is hashed as raw data
        static std::vector<Digest> parseLeaves(const std::vector<std::string>& args);

        void generateRoot(const std::vector<std::string>& leafArgs);
        void generateProof(const std::string& targetArg, const std::vector<std::string>& leafArgs);
        void verifyProof(const std::string& rootArg, const std::string& targetArg,
                         const std::vector<std::string>& proofArgs);
        void hashData(const std::string& data);
        void hashAddressAmount(const std::string& address, const std::string& amount);
        void airdrop(const std::string& csvFile, bool verbose, bool allProofs);

    public:
        CLI() = default;
        // returns the process exit code
        int run(int argc, char* argv[]);
};

#endif
