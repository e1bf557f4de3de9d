#include <gtest/gtest.h>
#include "receive_buffer.h"
#include <cstring>
#include <vector>

using namespace peerwire;

TEST(ReceiveBufferTest, Construction) {
    ReceiveBuffer buf(1024);

    EXPECT_EQ(buf.capacity(), 1024u);
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.front_waste(), 0u);
}

TEST(ReceiveBufferTest, DefaultConstruction) {
    ReceiveBuffer buf;

    EXPECT_EQ(buf.capacity(), 4096u);
    EXPECT_TRUE(buf.empty());
}

TEST(ReceiveBufferTest, AppendAndRead) {
    ReceiveBuffer buf(1024);

    const char* test_data = "Hello, World!";
    size_t len = strlen(test_data);
    buf.append(reinterpret_cast<const uint8_t*>(test_data), len);

    EXPECT_EQ(buf.size(), len);
    EXPECT_FALSE(buf.empty());
    EXPECT_EQ(std::memcmp(buf.data(), test_data, len), 0);
}

TEST(ReceiveBufferTest, ConsumeLeavesFrontWaste) {
    ReceiveBuffer buf(1024);

    std::vector<uint8_t> data(100);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    buf.append(data.data(), data.size());

    buf.consume(50);

    EXPECT_EQ(buf.size(), 50u);
    EXPECT_EQ(buf.front_waste(), 50u);
    EXPECT_EQ(buf.data()[0], 50);
}

TEST(ReceiveBufferTest, ConsumeAllResets) {
    ReceiveBuffer buf(1024);

    std::vector<uint8_t> data(100, 0xCD);
    buf.append(data.data(), data.size());
    buf.consume(100);

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.front_waste(), 0u);
}

TEST(ReceiveBufferTest, Normalize) {
    ReceiveBuffer buf(1024);

    std::vector<uint8_t> data(500, 0xEF);
    data[400] = 0x42;
    buf.append(data.data(), data.size());

    buf.consume(400);
    EXPECT_EQ(buf.front_waste(), 400u);

    buf.normalize();

    EXPECT_EQ(buf.front_waste(), 0u);
    EXPECT_EQ(buf.size(), 100u);
    EXPECT_EQ(buf.data()[0], 0x42);
}

TEST(ReceiveBufferTest, AppendGrowsCapacity) {
    ReceiveBuffer buf(100);

    std::vector<uint8_t> data(1000, 0x11);
    buf.append(data.data(), data.size());

    EXPECT_GE(buf.capacity(), 1000u);
    EXPECT_EQ(buf.size(), 1000u);
    EXPECT_EQ(std::memcmp(buf.data(), data.data(), data.size()), 0);
}

TEST(ReceiveBufferTest, AppendReclaimsFrontBeforeGrowing) {
    ReceiveBuffer buf(200);

    std::vector<uint8_t> first(150, 0x11);
    buf.append(first.data(), first.size());
    buf.consume(140);

    std::vector<uint8_t> second(100, 0x22);
    buf.append(second.data(), second.size());

    EXPECT_EQ(buf.capacity(), 200u);
    EXPECT_EQ(buf.front_waste(), 0u);
    ASSERT_EQ(buf.size(), 110u);
    EXPECT_EQ(buf.data()[9], 0x11);
    EXPECT_EQ(buf.data()[10], 0x22);
}

TEST(ReceiveBufferTest, InterleavedAppendConsume) {
    ReceiveBuffer buf(64);
    std::vector<uint8_t> expected;
    uint8_t next = 0;

    for (int round = 0; round < 50; ++round) {
        std::vector<uint8_t> chunk(37);
        for (auto& b : chunk) {
            b = next++;
        }
        buf.append(chunk.data(), chunk.size());
        expected.insert(expected.end(), chunk.begin(), chunk.end());

        size_t take = 29;
        ASSERT_EQ(std::memcmp(buf.data(), expected.data(), take), 0);
        buf.consume(take);
        expected.erase(expected.begin(), expected.begin() + take);
        ASSERT_EQ(buf.size(), expected.size());
    }
}

TEST(ReceiveBufferTest, Clear) {
    ReceiveBuffer buf(64);
    std::vector<uint8_t> data(10, 1);
    buf.append(data.data(), data.size());
    buf.consume(3);

    buf.clear();

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.front_waste(), 0u);
}
