#include "amount.h"

#include <openssl/crypto.h>

#include <algorithm>
#include <stdexcept>

#include "errors.h"

static BN_ptr newBignum() {
    BN_ptr bn(BN_new(), BN_free);
    if (!bn) {
        throw std::runtime_error("Failed to allocate BIGNUM for amount");
    }
    return bn;
}

BN_ptr ParseAmount(const std::string& decimal) {
    if (decimal.empty()) {
        throw InvalidEncodingError("Amount cannot be empty");
    }
    if (!std::all_of(decimal.begin(), decimal.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw InvalidEncodingError("Invalid amount '" + decimal + "': expected decimal digits");
    }

    BIGNUM* raw = nullptr;
    int parsed = BN_dec2bn(&raw, decimal.c_str());
    BN_ptr amount(raw, BN_free);
    if (!amount || parsed != static_cast<int>(decimal.size())) {
        throw InvalidEncodingError("Failed to parse amount '" + decimal + "'");
    }

    return amount;
}

BN_ptr AmountFromUint64(uint64_t value) {
    uint8_t be[8];
    for (int i = 0; i < 8; i++) {
        be[7 - i] = static_cast<uint8_t>(value >> (8 * i));
    }

    BN_ptr amount = newBignum();
    if (!BN_bin2bn(be, sizeof(be), amount.get())) {
        throw std::runtime_error("Failed to convert amount to BIGNUM");
    }
    return amount;
}

AmountBytes EncodeAmount(const BIGNUM* amount) {
    if (!amount) {
        throw std::invalid_argument("Amount cannot be null");
    }
    if (BN_is_negative(amount)) {
        throw InvalidEncodingError("Amount cannot be negative");
    }
    if (BN_num_bytes(amount) > static_cast<int>(Encoding::AMOUNT_SIZE)) {
        throw AmountOverflowError("Amount needs " + std::to_string(BN_num_bytes(amount)) +
                                  " bytes, exceeds uint256");
    }

    AmountBytes out{};
    if (BN_bn2binpad(amount, out.data(), static_cast<int>(out.size())) < 0) {
        throw std::runtime_error("Failed to encode amount");
    }
    return out;
}

std::string AmountToString(const BIGNUM* amount) {
    if (!amount) {
        throw std::invalid_argument("Amount cannot be null");
    }

    std::unique_ptr<char, void (*)(char*)> dec(BN_bn2dec(amount),
                                               [](char* p) { OPENSSL_free(p); });
    if (!dec) {
        throw std::runtime_error("Failed to format amount");
    }
    return std::string(dec.get());
}
