/**
 * @file test_sha256.cpp
 * @brief SHA-256 one-shot and streaming digests
 */

#include <gtest/gtest.h>
#include "SHA256.h"
#include "MockStores.h"

using namespace ChunkVault;

TEST(SHA256Test, KnownVectors) {
    EXPECT_EQ(SHA256::hash(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(SHA256::hash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, DigestIsLowercaseHex) {
    std::string digest = SHA256::hash("chunk");
    ASSERT_EQ(digest.size(), SHA256::DIGEST_HEX_LENGTH);
    EXPECT_EQ(digest.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(SHA256Test, BytesMatchString) {
    std::string text = "The quick brown fox";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(SHA256::hashBytes(bytes), SHA256::hash(text));
    EXPECT_EQ(SHA256::hashBytes(bytes.data(), bytes.size()), SHA256::hash(text));
}

TEST(SHA256Test, StreamingMatchesOneShot) {
    auto data = makePayload(100000);

    SHA256::Hasher hasher;
    std::size_t offset = 0;
    std::size_t step = 1;
    while (offset < data.size()) {
        std::size_t length = std::min(step, data.size() - offset);
        ASSERT_TRUE(hasher.update(data.data() + offset, length));
        offset += length;
        step = step * 3 + 1;
    }

    EXPECT_EQ(hasher.finalize(), SHA256::hashBytes(data));
}

TEST(SHA256Test, SingleByteChangeChangesDigest) {
    auto data = makePayload(4096);
    std::string before = SHA256::hashBytes(data);
    data[2048] ^= 0x01;
    EXPECT_NE(SHA256::hashBytes(data), before);
}
