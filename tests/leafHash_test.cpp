#include <gtest/gtest.h>

#include <string>

#include "amount.h"
#include "errors.h"
#include "leafHash.h"
#include "serialization.h"

static const std::string CLAIMER = "0x742d35Cc6634C0532925a3b8D4C9db96C4b4d8b6";

// keccak256(abi.encodePacked(address, uint256)) as computed by the claim contract
TEST(HashAccountAmount, MatchesContractVector) {
    Address account = HexToAddress(CLAIMER);
    Digest expected =
        HexToDigest("0x862d9f69cd1642f07c56ec6b92856ce141af9dfe404d2ab0c4685a334945ffe6");

    EXPECT_EQ(HashAccountAmount(account, std::string("1000000000000000000")), expected);
    EXPECT_EQ(HashAccountAmount(account, uint64_t{1000000000000000000ULL}), expected);

    BN_ptr amount = ParseAmount("1000000000000000000");
    EXPECT_EQ(HashAccountAmount(account, amount.get()), expected);
}

TEST(HashAccountAmount, ZeroAndMaxAmounts) {
    Address account = HexToAddress(CLAIMER);

    EXPECT_EQ(DigestToHex(HashAccountAmount(account, std::string("0"))),
              "0xda1992e793d9ac4f12ab80d7f6a31550c0754b6a109d14ac27a64e8c5c6c6511");
    EXPECT_EQ(DigestToHex(HashAccountAmount(
                  account, std::string("11579208923731619542357098500868790785326998466564056403"
                                       "9457584007913129639935"))),
              "0x05f2a8027af59422b77d4b7c6c50062eb5540fa904808145c86e5fdfbd537f6d");
}

TEST(HashAccountAmount, OverflowFailsInsteadOfTruncating) {
    Address account = HexToAddress(CLAIMER);

    EXPECT_THROW(HashAccountAmount(account,
                                   std::string("11579208923731619542357098500868790785326998466"
                                               "5640564039457584007913129639936")),
                 AmountOverflowError);
}

TEST(HashAccountAmount, DifferentFromRawDataHash) {
    Address account = HexToAddress("0x1234567890123456789012345678901234567890");
    Digest leaf = HashAccountAmount(account, std::string("2500000000000000000"));

    EXPECT_EQ(DigestToHex(leaf),
              "0x7e8e4cd4ddc525607795eb0b5d070dc2f0c8576f710762a0c79f50e3ca9be620");
    EXPECT_EQ(leaf, HashAccountAmount(account, std::string("2500000000000000000")));
    EXPECT_NE(leaf, HashData(AddressToHex(account) + "2500000000000000000"));
}

TEST(HashData, HashesRawBytes) {
    EXPECT_EQ(DigestToHex(HashData(std::string("alice"))),
              "0x9c0257114eb9399a2985f8e75dad7600c5d89fe3824ffa99ec1c3eb8bf3b0501");
    EXPECT_EQ(HashData(std::string("bob")), HashData(StringToBytes("bob")));
}
