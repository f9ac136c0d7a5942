#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>
#include <string>

// fixed sizes of the on-chain encoding
namespace Encoding {

    inline constexpr size_t DIGEST_SIZE = 32;   // keccak256 output, bytes32
    inline constexpr size_t ADDRESS_SIZE = 20;  // account identifier
    inline constexpr size_t AMOUNT_SIZE = 32;   // uint256, big-endian

    inline const std::string HEX_PREFIX = "0x";

}  // namespace Encoding

// airdrop report policy
namespace Policy {

    inline constexpr size_t MAX_LEAVES_FILE_ENTRIES = 1'000;  // skip .leaves above this
    inline constexpr size_t PREVIEW_ENTRIES = 5;              // entries listed when not verbose
    inline constexpr size_t SAMPLE_VERIFY_INDEX = 100;        // re-verified entry in large sets

}  // namespace Policy

// output directory for generated artifacts
namespace Config {

    // empty means artifacts are written beside their input file
    void SetOutputDir(const std::string& dir);

    // back to writing beside the input file
    void ResetOutputDir();

    std::string GetArtifactPath(const std::string& source, const std::string& suffix);

}  // namespace Config

#endif
