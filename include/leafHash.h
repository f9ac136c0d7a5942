#ifndef LEAFHASH_H
#define LEAFHASH_H

#include <openssl/bn.h>

#include <cstdint>
#include <string>
#include <vector>

#include "digest.h"

// keccak256 of opaque leaf content
Digest HashData(const std::vector<uint8_t>& data);
Digest HashData(const std::string& data);

// keccak256(abi.encodePacked(address, uint256)): 20 account bytes then 32 amount bytes
Digest HashAccountAmount(const Address& account, const BIGNUM* amount);
Digest HashAccountAmount(const Address& account, const std::string& decimalAmount);
Digest HashAccountAmount(const Address& account, uint64_t amount);

#endif
