#ifndef DIGEST_H
#define DIGEST_H

#include <array>
#include <cstdint>

#include "config.h"

// every leaf, node, root and proof element is a bytes32.
// std::array compares lexicographically over uint8_t, which is the unsigned big-endian
// ordering the on-chain verifier uses.
using Digest = std::array<uint8_t, Encoding::DIGEST_SIZE>;

using Address = std::array<uint8_t, Encoding::ADDRESS_SIZE>;

#endif
