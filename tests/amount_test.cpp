#include <gtest/gtest.h>

#include <string>

#include "amount.h"
#include "errors.h"
#include "serialization.h"

static const std::string UINT256_MAX =
    "115792089237316195423570985008687907853269984665640564039457584007913129639935";
static const std::string UINT256_MAX_PLUS_ONE =
    "115792089237316195423570985008687907853269984665640564039457584007913129639936";

TEST(Amount, EncodesBigEndianLeftPadded) {
    BN_ptr amount = ParseAmount("1000000000000000000");
    AmountBytes bytes = EncodeAmount(amount.get());

    // 10^18 = 0x0de0b6b3a7640000
    EXPECT_EQ(ByteArrayToHexString(bytes.data(), bytes.size()),
              "0000000000000000000000000000000000000000000000000de0b6b3a7640000");
}

TEST(Amount, ZeroEncodesAsAllZeroBytes) {
    BN_ptr amount = ParseAmount("0");
    EXPECT_EQ(EncodeAmount(amount.get()), AmountBytes{});
}

TEST(Amount, Uint256BoundaryIsExact) {
    BN_ptr max = ParseAmount(UINT256_MAX);
    AmountBytes bytes = EncodeAmount(max.get());
    for (uint8_t b : bytes) {
        EXPECT_EQ(b, 0xff);
    }

    BN_ptr tooBig = ParseAmount(UINT256_MAX_PLUS_ONE);
    EXPECT_THROW(EncodeAmount(tooBig.get()), AmountOverflowError);
}

TEST(Amount, RejectsNonDecimalText) {
    EXPECT_THROW(ParseAmount(""), InvalidEncodingError);
    EXPECT_THROW(ParseAmount("-1"), InvalidEncodingError);
    EXPECT_THROW(ParseAmount("12a"), InvalidEncodingError);
    EXPECT_THROW(ParseAmount(" 12"), InvalidEncodingError);
    EXPECT_THROW(ParseAmount("0x10"), InvalidEncodingError);
}

TEST(Amount, FromUint64MatchesDecimal) {
    BN_ptr fromInt = AmountFromUint64(2500000000000000000ULL);
    BN_ptr fromText = ParseAmount("2500000000000000000");

    EXPECT_EQ(EncodeAmount(fromInt.get()), EncodeAmount(fromText.get()));
    EXPECT_EQ(AmountToString(fromInt.get()), "2500000000000000000");
}

TEST(Amount, ToStringDropsLeadingZeros) {
    BN_ptr amount = ParseAmount("000042");
    EXPECT_EQ(AmountToString(amount.get()), "42");
}
