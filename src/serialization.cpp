#include "serialization.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "errors.h"

static int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// decodes exactly N bytes from a "0x"-prefixed string
template <size_t N>
static std::array<uint8_t, N> parsePrefixedHex(const std::string& hex, const char* what) {
    if (!HasHexPrefix(hex)) {
        throw InvalidEncodingError(std::string("Invalid ") + what + " '" + hex +
                                   "': missing 0x prefix");
    }
    if (hex.size() != Encoding::HEX_PREFIX.size() + 2 * N) {
        throw InvalidEncodingError(std::string("Invalid ") + what + " '" + hex + "': expected " +
                                   std::to_string(2 * N) + " hex digits");
    }

    std::array<uint8_t, N> out{};
    std::vector<uint8_t> bytes = HexStringToByteArray(hex.substr(Encoding::HEX_PREFIX.size()));
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

std::string ByteArrayToHexString(const uint8_t* data, size_t len) {
    std::ostringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::vector<uint8_t> HexStringToByteArray(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw InvalidEncodingError("Hex string has odd length: " + std::to_string(hex.size()));
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexNibble(hex[i]);
        int lo = hexNibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw InvalidEncodingError("Invalid hex character at offset " + std::to_string(i));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::string DigestToHex(const Digest& digest) {
    return Encoding::HEX_PREFIX + ByteArrayToHexString(digest.data(), digest.size());
}

Digest HexToDigest(const std::string& hex) {
    return parsePrefixedHex<Encoding::DIGEST_SIZE>(hex, "digest");
}

std::string AddressToHex(const Address& address) {
    return Encoding::HEX_PREFIX + ByteArrayToHexString(address.data(), address.size());
}

Address HexToAddress(const std::string& hex) {
    return parsePrefixedHex<Encoding::ADDRESS_SIZE>(hex, "address");
}

bool HasHexPrefix(const std::string& str) {
    return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

std::vector<uint8_t> StringToBytes(const std::string& str) { return {str.begin(), str.end()}; }
