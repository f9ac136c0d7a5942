#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "crypto.h"
#include "serialization.h"

static std::string keccakHex(const std::string& input) {
    return DigestToHex(Keccak256Hash(StringToBytes(input)));
}

TEST(Keccak256, KnownAnswers) {
    EXPECT_EQ(keccakHex(""), "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    EXPECT_EQ(keccakHex("abc"),
              "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

// SHA3-256("") is a7ffc6f8...; the legacy padding must not produce it
TEST(Keccak256, IsNotSha3) {
    EXPECT_NE(keccakHex(""), "0xa7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

// 200 bytes spans one full 136-byte block plus a partial one
TEST(Keccak256, InputLongerThanRate) {
    EXPECT_EQ(keccakHex(std::string(200, 'a')),
              "0x96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d");
}

TEST(Keccak256, TwoPartOverloadHashesConcatenation) {
    std::vector<uint8_t> a = StringToBytes("ab");
    std::vector<uint8_t> b = StringToBytes("c");

    EXPECT_EQ(Keccak256Hash(a.data(), a.size(), b.data(), b.size()),
              Keccak256Hash(StringToBytes("abc")));
}

TEST(Keccak256, TwoPartSplitAcrossBlockBoundary) {
    std::vector<uint8_t> data = StringToBytes(std::string(200, 'a'));

    for (size_t split : {0u, 1u, 135u, 136u, 137u, 200u}) {
        EXPECT_EQ(Keccak256Hash(data.data(), split, data.data() + split, data.size() - split),
                  Keccak256Hash(data))
            << "split at " << split;
    }
}
