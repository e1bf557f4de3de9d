#include <gtest/gtest.h>
#include "pw_transport.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>

using namespace peerwire;

//=============================================================================
// Helper Functions
//=============================================================================

namespace {

bool write_text(Stream& stream, const std::string& text) {
    return stream.write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/// Read until count bytes arrived or a read stops returning data
std::string read_text(Stream& stream, size_t count, int timeout_ms = 1000) {
    std::string out;
    uint8_t buffer[256];
    while (out.size() < count) {
        size_t want = std::min(sizeof(buffer), count - out.size());
        ReadResult result = stream.read(buffer, want, timeout_ms);
        if (result.status != ReadStatus::Data) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buffer), result.bytes);
    }
    return out;
}

} // namespace

//=============================================================================
// PeerAddress
//=============================================================================

TEST(PeerAddressTest, Parse) {
    auto address = PeerAddress::parse("127.0.0.1:6881");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ip, "127.0.0.1");
    EXPECT_EQ(address->port, 6881);
    EXPECT_EQ(address->to_string(), "127.0.0.1:6881");

    EXPECT_FALSE(PeerAddress::parse("127.0.0.1").has_value());
    EXPECT_FALSE(PeerAddress::parse(":80").has_value());
    EXPECT_FALSE(PeerAddress::parse("host:").has_value());
    EXPECT_FALSE(PeerAddress::parse("host:0").has_value());
    EXPECT_FALSE(PeerAddress::parse("host:70000").has_value());
    EXPECT_FALSE(PeerAddress::parse("host:12a").has_value());
}

TEST(PeerAddressTest, Ordering) {
    PeerAddress a("10.0.0.1", 1);
    PeerAddress b("10.0.0.1", 2);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, PeerAddress("10.0.0.1", 1));
}

//=============================================================================
// MemoryStream
//=============================================================================

TEST(MemoryStreamTest, PairCarriesBytesBothWays) {
    auto pair = MemoryStream::create_pair();

    EXPECT_EQ(pair.first->remote_address(), "mem:b");
    EXPECT_EQ(pair.second->remote_address(), "mem:a");

    ASSERT_TRUE(write_text(*pair.first, "ping"));
    EXPECT_EQ(read_text(*pair.second, 4), "ping");

    ASSERT_TRUE(write_text(*pair.second, "pong"));
    EXPECT_EQ(read_text(*pair.first, 4), "pong");
}

TEST(MemoryStreamTest, ReadTimesOutWhenIdle) {
    auto pair = MemoryStream::create_pair();
    uint8_t buffer[8];

    ReadResult result = pair.first->read(buffer, sizeof(buffer), 10);
    EXPECT_EQ(result.status, ReadStatus::Timeout);
    EXPECT_EQ(result.bytes, 0u);
}

TEST(MemoryStreamTest, PartialReads) {
    auto pair = MemoryStream::create_pair();
    write_text(*pair.first, "abcdef");

    uint8_t buffer[4];
    ReadResult result = pair.second->read(buffer, 4, 100);
    ASSERT_EQ(result.status, ReadStatus::Data);
    EXPECT_EQ(result.bytes, 4u);
    EXPECT_EQ(std::memcmp(buffer, "abcd", 4), 0);
    EXPECT_EQ(read_text(*pair.second, 2), "ef");
}

TEST(MemoryStreamTest, CloseDrainsThenEof) {
    auto pair = MemoryStream::create_pair();
    write_text(*pair.first, "last");
    pair.first->close();

    EXPECT_EQ(read_text(*pair.second, 4), "last");

    uint8_t buffer[4];
    EXPECT_EQ(pair.second->read(buffer, 4, 100).status, ReadStatus::Eof);
    EXPECT_FALSE(write_text(*pair.second, "x"));
    EXPECT_FALSE(write_text(*pair.first, "x"));
}

TEST(MemoryStreamTest, DestroyingOneEndClosesOther) {
    auto pair = MemoryStream::create_pair();
    pair.first.reset();

    uint8_t buffer[4];
    EXPECT_EQ(pair.second->read(buffer, 4, 100).status, ReadStatus::Eof);
}

TEST(MemoryStreamTest, CloseWakesBlockedReader) {
    auto pair = MemoryStream::create_pair();
    ReadStatus status = ReadStatus::Data;

    std::thread reader([&] {
        uint8_t buffer[4];
        status = pair.second->read(buffer, 4, 5000).status;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pair.first->close();
    reader.join();
    EXPECT_EQ(status, ReadStatus::Eof);
}

TEST(MemoryStreamTest, WakeInterruptsBlockedRead) {
    auto pair = MemoryStream::create_pair();
    ReadStatus status = ReadStatus::Data;
    auto started = std::chrono::steady_clock::now();

    std::thread reader([&] {
        uint8_t buffer[4];
        status = pair.second->read(buffer, 4, 5000).status;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pair.second->wake();
    reader.join();

    EXPECT_EQ(status, ReadStatus::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2000));
}

TEST(MemoryStreamTest, WakeBeforeReadIsKept) {
    auto pair = MemoryStream::create_pair();
    uint8_t buffer[4];

    pair.second->wake();
    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(pair.second->read(buffer, 4, 5000).status, ReadStatus::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2000));

    // Consumed by the read above
    ASSERT_TRUE(write_text(*pair.first, "ab"));
    EXPECT_EQ(read_text(*pair.second, 2), "ab");
}

//=============================================================================
// MemoryTransport
//=============================================================================

TEST(MemoryTransportTest, ConnectReachesListener) {
    MemoryTransport transport;
    auto listener = transport.listen("10.0.0.1", 6881);
    ASSERT_NE(listener, nullptr);
    EXPECT_EQ(listener->port(), 6881);

    auto dialer = transport.connect(PeerAddress("10.0.0.1", 6881), 100);
    ASSERT_NE(dialer, nullptr);
    auto accepted = listener->accept(100);
    ASSERT_NE(accepted, nullptr);

    EXPECT_EQ(dialer->remote_address(), "10.0.0.1:6881");
    EXPECT_EQ(accepted->remote_address(), "mem:1");
    EXPECT_EQ(transport.connect_count(), 1u);

    write_text(*dialer, "hello");
    EXPECT_EQ(read_text(*accepted, 5), "hello");
}

TEST(MemoryTransportTest, ConnectWithoutListenerFails) {
    MemoryTransport transport;
    EXPECT_EQ(transport.connect(PeerAddress("10.0.0.1", 1), 100), nullptr);
    EXPECT_EQ(transport.connect_count(), 0u);
}

TEST(MemoryTransportTest, PortZeroPicksFreePort) {
    MemoryTransport transport;
    auto a = transport.listen("h", 0);
    auto b = transport.listen("h", 0);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a->port(), 0);
    EXPECT_NE(a->port(), b->port());
}

TEST(MemoryTransportTest, DuplicateListenRejected) {
    MemoryTransport transport;
    auto a = transport.listen("h", 7000);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(transport.listen("h", 7000), nullptr);
    EXPECT_NE(transport.listen("other", 7000), nullptr);
}

TEST(MemoryTransportTest, ClosedListenerUnregisters) {
    MemoryTransport transport;
    auto listener = transport.listen("h", 7000);
    listener->close();

    EXPECT_EQ(transport.connect(PeerAddress("h", 7000), 100), nullptr);
    EXPECT_EQ(listener->accept(10), nullptr);
    EXPECT_NE(transport.listen("h", 7000), nullptr);
}

TEST(MemoryTransportTest, AcceptTimesOut) {
    MemoryTransport transport;
    auto listener = transport.listen("h", 7000);
    EXPECT_EQ(listener->accept(10), nullptr);
}

//=============================================================================
// TCP
//=============================================================================

TEST(TcpTransportTest, LoopbackExchange) {
    TcpTransport transport;
    auto listener = transport.listen("127.0.0.1", 0);
    ASSERT_NE(listener, nullptr);
    ASSERT_NE(listener->port(), 0);

    auto client = transport.connect(PeerAddress("127.0.0.1", listener->port()), 2000);
    ASSERT_NE(client, nullptr);
    auto server = listener->accept(2000);
    ASSERT_NE(server, nullptr);

    EXPECT_EQ(client->remote_address(), "127.0.0.1:" + std::to_string(listener->port()));

    ASSERT_TRUE(write_text(*client, "over tcp"));
    EXPECT_EQ(read_text(*server, 8), "over tcp");

    uint8_t buffer[4];
    EXPECT_EQ(server->read(buffer, 4, 20).status, ReadStatus::Timeout);

    client->close();
    EXPECT_EQ(server->read(buffer, 4, 1000).status, ReadStatus::Eof);
    EXPECT_EQ(client->read(buffer, 4, 10).status, ReadStatus::Error);
    EXPECT_FALSE(write_text(*client, "x"));
}

TEST(TcpTransportTest, WakeInterruptsBlockedRead) {
    TcpTransport transport;
    auto listener = transport.listen("127.0.0.1", 0);
    ASSERT_NE(listener, nullptr);
    auto client = transport.connect(PeerAddress("127.0.0.1", listener->port()), 2000);
    ASSERT_NE(client, nullptr);
    auto server = listener->accept(2000);
    ASSERT_NE(server, nullptr);

    ReadStatus status = ReadStatus::Data;
    auto started = std::chrono::steady_clock::now();
    std::thread reader([&] {
        uint8_t buffer[4];
        status = server->read(buffer, 4, 5000).status;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    server->wake();
    reader.join();

    EXPECT_EQ(status, ReadStatus::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2000));

    ASSERT_TRUE(write_text(*client, "after"));
    EXPECT_EQ(read_text(*server, 5), "after");
}

TEST(TcpTransportTest, ConnectRefused) {
    TcpTransport transport;
    auto listener = transport.listen("127.0.0.1", 0);
    ASSERT_NE(listener, nullptr);
    uint16_t port = listener->port();
    listener->close();

    EXPECT_EQ(transport.connect(PeerAddress("127.0.0.1", port), 1000), nullptr);
    EXPECT_EQ(listener->accept(10), nullptr);
}
