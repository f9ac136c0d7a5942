#ifndef AMOUNT_H
#define AMOUNT_H

#include <openssl/bn.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "config.h"

// RAII type alias for the BIGNUM holding an amount
using BN_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

// uint256 in big-endian, as abi.encodePacked lays it out
using AmountBytes = std::array<uint8_t, Encoding::AMOUNT_SIZE>;

// base-10 digits only; no sign, whitespace or 0x prefix
BN_ptr ParseAmount(const std::string& decimal);
BN_ptr AmountFromUint64(uint64_t value);

// left-pads to 32 bytes; throws AmountOverflowError instead of truncating
AmountBytes EncodeAmount(const BIGNUM* amount);

std::string AmountToString(const BIGNUM* amount);

#endif
