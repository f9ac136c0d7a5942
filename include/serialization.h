#ifndef SERIALIZATION_H
#define SERIALIZATION_H

#include <cstdint>
#include <string>
#include <vector>

#include "digest.h"

// hex string conversions, lowercase and unprefixed
std::string ByteArrayToHexString(const uint8_t* data, size_t len);
std::vector<uint8_t> HexStringToByteArray(const std::string& hex);

// "0x"-prefixed fixed width text, the only textual form of digests and addresses.
// parsing accepts either letter case and throws InvalidEncodingError on anything else.
std::string DigestToHex(const Digest& digest);
Digest HexToDigest(const std::string& hex);
std::string AddressToHex(const Address& address);
Address HexToAddress(const std::string& hex);

bool HasHexPrefix(const std::string& str);

std::vector<uint8_t> StringToBytes(const std::string& str);

#endif
