#include "leafHash.h"

#include "amount.h"
#include "crypto.h"

Digest HashData(const std::vector<uint8_t>& data) { return Keccak256Hash(data); }

Digest HashData(const std::string& data) {
    return Keccak256Hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Digest HashAccountAmount(const Address& account, const BIGNUM* amount) {
    AmountBytes amountBytes = EncodeAmount(amount);

    // 20 + 32 = 52 bytes, no padding between the fields
    return Keccak256Hash(account.data(), account.size(), amountBytes.data(), amountBytes.size());
}

Digest HashAccountAmount(const Address& account, const std::string& decimalAmount) {
    BN_ptr amount = ParseAmount(decimalAmount);
    return HashAccountAmount(account, amount.get());
}

Digest HashAccountAmount(const Address& account, uint64_t amount) {
    BN_ptr value = AmountFromUint64(amount);
    return HashAccountAmount(account, value.get());
}
