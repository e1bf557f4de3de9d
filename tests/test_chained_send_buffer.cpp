#include <gtest/gtest.h>
#include "chained_send_buffer.h"
#include <cstring>
#include <vector>
#include <algorithm>

using namespace peerwire;

TEST(ChainedSendBufferTest, Construction) {
    ChainedSendBuffer buf;

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_EQ(buf.chunk_count(), 0u);
    EXPECT_EQ(buf.front_data(), nullptr);
    EXPECT_EQ(buf.front_size(), 0u);
}

TEST(ChainedSendBufferTest, AppendVector) {
    ChainedSendBuffer buf;

    buf.append(std::vector<uint8_t>{1, 2, 3, 4, 5});

    EXPECT_EQ(buf.size(), 5u);
    EXPECT_EQ(buf.chunk_count(), 1u);
    EXPECT_EQ(buf.front_size(), 5u);
    EXPECT_EQ(buf.front_data()[0], 1);
}

TEST(ChainedSendBufferTest, AppendPointer) {
    ChainedSendBuffer buf;
    const char* text = "Hello";

    buf.append(reinterpret_cast<const uint8_t*>(text), 5);

    EXPECT_EQ(buf.size(), 5u);
    EXPECT_EQ(std::memcmp(buf.front_data(), text, 5), 0);
}

TEST(ChainedSendBufferTest, EmptyAppendIgnored) {
    ChainedSendBuffer buf;

    buf.append(std::vector<uint8_t>());
    buf.append(nullptr, 0);

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.chunk_count(), 0u);
}

TEST(ChainedSendBufferTest, PartialPop) {
    ChainedSendBuffer buf;
    buf.append(std::vector<uint8_t>{1, 2, 3, 4, 5});

    buf.pop_front(2);

    EXPECT_EQ(buf.size(), 3u);
    EXPECT_EQ(buf.front_size(), 3u);
    EXPECT_EQ(buf.front_data()[0], 3);
}

TEST(ChainedSendBufferTest, PopAcrossChunks) {
    ChainedSendBuffer buf;
    buf.append(std::vector<uint8_t>{1, 2, 3});
    buf.append(std::vector<uint8_t>{4, 5, 6});
    buf.append(std::vector<uint8_t>{7, 8, 9});

    buf.pop_front(4);

    EXPECT_EQ(buf.size(), 5u);
    EXPECT_EQ(buf.chunk_count(), 2u);
    EXPECT_EQ(buf.front_size(), 2u);
    EXPECT_EQ(buf.front_data()[0], 5);
}

TEST(ChainedSendBufferTest, PopMoreThanAvailable) {
    ChainedSendBuffer buf;
    buf.append(std::vector<uint8_t>{1, 2, 3});

    buf.pop_front(100);

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.chunk_count(), 0u);
}

TEST(ChainedSendBufferTest, TakeAllConcatenatesInOrder) {
    ChainedSendBuffer buf;
    buf.append(std::vector<uint8_t>{1, 2, 3});
    buf.append(std::vector<uint8_t>{4, 5});
    buf.pop_front(1);

    std::vector<uint8_t> out = buf.take_all();

    EXPECT_EQ(out, (std::vector<uint8_t>{2, 3, 4, 5}));
    EXPECT_TRUE(buf.empty());
}

TEST(ChainedSendBufferTest, TakeAllSingleChunk) {
    ChainedSendBuffer buf;
    buf.append(std::vector<uint8_t>{9, 8, 7});

    EXPECT_EQ(buf.take_all(), (std::vector<uint8_t>{9, 8, 7}));
    EXPECT_TRUE(buf.empty());
}

TEST(ChainedSendBufferTest, DrainWithSmallWrites) {
    ChainedSendBuffer buf;
    std::vector<uint8_t> expected;
    for (int i = 0; i < 10; ++i) {
        std::vector<uint8_t> chunk(13, static_cast<uint8_t>(i));
        expected.insert(expected.end(), chunk.begin(), chunk.end());
        buf.append(std::move(chunk));
    }

    // Writer that accepts at most 7 bytes at a time
    std::vector<uint8_t> written;
    while (!buf.empty()) {
        size_t n = std::min<size_t>(7, buf.front_size());
        written.insert(written.end(), buf.front_data(), buf.front_data() + n);
        buf.pop_front(n);
    }

    EXPECT_EQ(written, expected);
}

TEST(ChainedSendBufferTest, Clear) {
    ChainedSendBuffer buf;
    buf.append(std::vector<uint8_t>{1, 2, 3});
    buf.append(std::vector<uint8_t>{4});

    buf.clear();

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.chunk_count(), 0u);
}
