#ifndef CRYPTO_H
#define CRYPTO_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "digest.h"

Digest Keccak256Hash(const uint8_t* data, size_t len);

Digest Keccak256Hash(const std::vector<uint8_t>& data);

// hashes the concatenation of both buffers without materializing it
Digest Keccak256Hash(const uint8_t* first, size_t firstLen, const uint8_t* second,
                     size_t secondLen);

#endif
