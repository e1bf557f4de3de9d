#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "sha1.h"
#include "pw_types.h"
#include <string>
#include <vector>
#include <algorithm>

using namespace peerwire;

class SHA1Test : public ::testing::Test {
protected:
    static std::vector<uint8_t> bytes_of(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
};

// Test empty input hashing
TEST_F(SHA1Test, EmptyInput) {
    SHA1 sha1;
    EXPECT_EQ(sha1.finalize(), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_F(SHA1Test, ShortString) {
    EXPECT_EQ(SHA1::hash("hello"), "aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d");
}

TEST_F(SHA1Test, QuickBrownFox) {
    EXPECT_EQ(SHA1::hash("The quick brown fox jumps over the lazy dog"),
              "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

// 56 bytes forces the length into a second padding block
TEST_F(SHA1Test, TwoBlockPadding) {
    EXPECT_EQ(SHA1::hash("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST_F(SHA1Test, MillionA) {
    SHA1 sha1;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        sha1.update(chunk);
    }
    EXPECT_EQ(sha1.finalize(), "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

TEST_F(SHA1Test, IncrementalMatchesOneShot) {
    std::vector<uint8_t> data(1000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 7 + 3);
    }

    // Uneven chunk sizes straddle the 64-byte block boundary
    SHA1 sha1;
    size_t offset = 0;
    size_t step = 1;
    while (offset < data.size()) {
        size_t n = std::min(step, data.size() - offset);
        sha1.update(data.data() + offset, n);
        offset += n;
        step = step * 3 + 1;
    }

    EXPECT_EQ(sha1.digest(), SHA1::hash_bytes(data));
}

TEST_F(SHA1Test, DigestMatchesHexForm) {
    auto data = bytes_of("peerwire");
    Sha1Digest digest = SHA1::hash_bytes(data);

    SHA1 sha1;
    sha1.update(data);
    EXPECT_EQ(to_hex(digest), sha1.finalize());
}

TEST_F(SHA1Test, UpdateAfterFinalizeIsIgnored) {
    SHA1 sha1;
    sha1.update(std::string("abc"));
    std::string first = sha1.finalize();
    sha1.update(std::string("more"));
    EXPECT_EQ(sha1.finalize(), first);
    EXPECT_EQ(first, "a9993e364706816aba3e25717850c26c9cd0d89d");
}
