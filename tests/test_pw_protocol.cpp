#include <gtest/gtest.h>
#include "pw_protocol.h"

#include <algorithm>
#include <random>

using namespace peerwire;

//=============================================================================
// Helper Functions
//=============================================================================

namespace {

InfoHash make_hash(uint8_t seed) {
    InfoHash hash{};
    for (size_t i = 0; i < hash.size(); ++i) {
        hash[i] = static_cast<uint8_t>(seed + i);
    }
    return hash;
}

std::string describe(const ProtocolEvent& event) {
    if (auto hs = std::get_if<HandshakeCompleted>(&event)) {
        return "handshake:" + peer_id_to_string(hs->peer_id);
    }
    if (auto received = std::get_if<MessageReceived>(&event)) {
        auto bytes = encode_message(received->message);
        return std::string("message:") + message_name(received->message) + ":" +
               std::to_string(bytes.size());
    }
    const auto& v = std::get<ProtocolViolation>(event);
    return std::string("violation:") + violation_kind_to_string(v.kind);
}

std::vector<std::string> describe_all(const std::vector<ProtocolEvent>& events) {
    std::vector<std::string> out;
    for (const auto& event : events) {
        out.push_back(describe(event));
    }
    return out;
}

} // namespace

class ProtocolEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        info_hash_ = make_hash(1);
        local_id_ = generate_peer_id("-LO0001-");
        remote_id_ = generate_peer_id("-RE0001-");
    }

    std::vector<uint8_t> remote_handshake() const {
        return encode_handshake(info_hash_, remote_id_);
    }

    /// Responder that already accepted the remote handshake
    ProtocolEngine established_responder(uint32_t num_pieces = 8) {
        ProtocolEngine engine(info_hash_, local_id_, Role::Responder, num_pieces);
        engine.receive(remote_handshake());
        engine.take_outbound();
        return engine;
    }

    InfoHash info_hash_;
    PeerID local_id_;
    PeerID remote_id_;
};

//=============================================================================
// Handshake
//=============================================================================

TEST_F(ProtocolEngineTest, InitiatorQueuesHandshakeAtConstruction) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Initiator);

    EXPECT_EQ(engine.state(), EngineState::AwaitingHandshake);
    EXPECT_TRUE(engine.handshake_sent());
    EXPECT_EQ(engine.take_outbound(), encode_handshake(info_hash_, local_id_));
}

TEST_F(ProtocolEngineTest, ResponderWaitsForRemoteHandshake) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Responder);
    EXPECT_FALSE(engine.has_outbound());

    auto events = engine.receive(remote_handshake());

    ASSERT_EQ(events.size(), 1u);
    auto hs = std::get_if<HandshakeCompleted>(&events[0]);
    ASSERT_NE(hs, nullptr);
    EXPECT_EQ(hs->peer_id, remote_id_);
    EXPECT_TRUE(engine.is_established());
    EXPECT_EQ(engine.take_outbound(), encode_handshake(info_hash_, local_id_));
}

TEST_F(ProtocolEngineTest, InitiatorDoesNotRepeatHandshake) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Initiator);
    engine.take_outbound();

    engine.receive(remote_handshake());

    EXPECT_TRUE(engine.is_established());
    EXPECT_FALSE(engine.has_outbound());
    EXPECT_EQ(engine.send(msg::Handshake(info_hash_, local_id_)), SendStatus::HandshakeAlreadySent);
}

TEST_F(ProtocolEngineTest, HandshakeSendUsesOwnIdentity) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Responder);

    EXPECT_EQ(engine.send(msg::Handshake(make_hash(99), remote_id_)), SendStatus::Queued);
    EXPECT_EQ(engine.take_outbound(), encode_handshake(info_hash_, local_id_));

    // Already sent, so accepting the remote handshake queues nothing more
    engine.receive(remote_handshake());
    EXPECT_FALSE(engine.has_outbound());
}

TEST_F(ProtocolEngineTest, PartialHandshakeProducesNoEvents) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Responder);
    auto bytes = remote_handshake();

    auto events = engine.receive(bytes.data(), 40);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(engine.state(), EngineState::AwaitingHandshake);
    EXPECT_EQ(engine.pending_inbound(), 40u);

    events = engine.receive(bytes.data() + 40, bytes.size() - 40);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(engine.is_established());
}

TEST_F(ProtocolEngineTest, InfoHashMismatchCloses) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Responder);

    auto events = engine.receive(encode_handshake(make_hash(50), remote_id_));

    ASSERT_EQ(events.size(), 1u);
    auto v = std::get_if<ProtocolViolation>(&events[0]);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->kind, ViolationKind::InfoHashMismatch);
    EXPECT_TRUE(engine.is_closed());
    EXPECT_FALSE(engine.has_outbound());
}

TEST_F(ProtocolEngineTest, MalformedHandshakeCloses) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Initiator);
    std::vector<uint8_t> junk = {'H', 'T', 'T', 'P'};

    auto events = engine.receive(junk);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<ProtocolViolation>(events[0]).kind, ViolationKind::MalformedHandshake);
    EXPECT_TRUE(engine.is_closed());
}

TEST_F(ProtocolEngineTest, UnexpectedPeerIdCloses) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Initiator);
    engine.set_expected_peer_id(generate_peer_id("-XX0001-"));

    auto events = engine.receive(remote_handshake());

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<ProtocolViolation>(events[0]).kind, ViolationKind::UnexpectedPeerId);
    EXPECT_TRUE(engine.is_closed());
}

TEST_F(ProtocolEngineTest, ExpectedPeerIdAccepted) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Initiator);
    engine.set_expected_peer_id(remote_id_);

    auto events = engine.receive(remote_handshake());

    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<HandshakeCompleted>(events[0]));
}

//=============================================================================
// Frames
//=============================================================================

TEST_F(ProtocolEngineTest, HandshakeAndFramesInOneRead) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Responder, 8);

    auto bytes = remote_handshake();
    encode_message_into(msg::Bitfield(std::vector<uint8_t>{0xFF}), bytes);
    encode_message_into(msg::Unchoke{}, bytes);

    auto events = engine.receive(bytes);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<HandshakeCompleted>(events[0]));
    EXPECT_EQ(std::get<MessageReceived>(events[1]).message,
              Message(msg::Bitfield(std::vector<uint8_t>{0xFF})));
    EXPECT_EQ(std::get<MessageReceived>(events[2]).message, Message(msg::Unchoke{}));
    EXPECT_EQ(engine.messages_received(), 2u);
}

TEST_F(ProtocolEngineTest, ArbitrarySplitsMatchWholeFeed) {
    auto bytes = remote_handshake();
    encode_message_into(msg::Bitfield(std::vector<uint8_t>{0xF0}), bytes);
    encode_message_into(msg::Interested{}, bytes);
    encode_message_into(msg::KeepAlive{}, bytes);
    encode_message_into(msg::Request(3, 0, 16384), bytes);
    encode_message_into(msg::Piece(2, 16384, std::vector<uint8_t>(300, 0x5A)), bytes);
    encode_message_into(msg::Have{7}, bytes);

    ProtocolEngine whole(info_hash_, local_id_, Role::Responder, 8);
    auto expected = describe_all(whole.receive(bytes));
    ASSERT_EQ(expected.size(), 7u);

    std::mt19937 rng(1234);
    for (int round = 0; round < 50; ++round) {
        ProtocolEngine split(info_hash_, local_id_, Role::Responder, 8);
        std::vector<std::string> got;

        size_t offset = 0;
        while (offset < bytes.size()) {
            size_t max_chunk = std::min<size_t>(bytes.size() - offset, 97);
            size_t chunk = 1 + rng() % max_chunk;
            auto events = split.receive(bytes.data() + offset, chunk);
            auto described = describe_all(events);
            got.insert(got.end(), described.begin(), described.end());
            offset += chunk;
        }

        ASSERT_EQ(got, expected) << "round " << round;
    }
}

TEST_F(ProtocolEngineTest, ByteAtATime) {
    auto bytes = remote_handshake();
    encode_message_into(msg::Have{1}, bytes);

    ProtocolEngine engine(info_hash_, local_id_, Role::Responder, 8);
    size_t count = 0;
    for (uint8_t b : bytes) {
        count += engine.receive(&b, 1).size();
    }
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(engine.pending_inbound(), 0u);
}

TEST_F(ProtocolEngineTest, InvalidTypeAfterValidFramesKeepsEarlierEvents) {
    auto engine = established_responder();

    std::vector<uint8_t> bytes;
    encode_message_into(msg::Choke{}, bytes);
    bytes.insert(bytes.end(), {0, 0, 0, 1, 42});
    encode_message_into(msg::Unchoke{}, bytes);

    auto events = engine.receive(bytes);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<MessageReceived>(events[0]).message, Message(msg::Choke{}));
    EXPECT_EQ(std::get<ProtocolViolation>(events[1]).kind, ViolationKind::InvalidMessageType);
    EXPECT_TRUE(engine.is_closed());
}

TEST_F(ProtocolEngineTest, OutOfRangeIndexIsViolation) {
    auto engine = established_responder(4);

    auto events = engine.receive(encode_message(msg::Have{4}));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<ProtocolViolation>(events[0]).kind, ViolationKind::MalformedPayload);
}

TEST_F(ProtocolEngineTest, BadBitfieldLengthIsViolation) {
    auto engine = established_responder(4);

    auto events = engine.receive(encode_message(msg::Bitfield(std::vector<uint8_t>{0xF0, 0x00})));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<ProtocolViolation>(events[0]).kind, ViolationKind::MalformedPayload);
}

TEST_F(ProtocolEngineTest, SecondHandshakeIsViolation) {
    auto engine = established_responder();

    auto bytes = encode_message(msg::Have{1});
    encode_message_into(msg::Handshake(info_hash_, remote_id_), bytes);

    auto events = engine.receive(bytes);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<MessageReceived>(events[0]).message, Message(msg::Have{1}));
    EXPECT_EQ(std::get<ProtocolViolation>(events[1]).kind, ViolationKind::MalformedPayload);
    EXPECT_TRUE(engine.is_closed());
    EXPECT_EQ(engine.messages_received(), 1u);
}

//=============================================================================
// Sending
//=============================================================================

TEST_F(ProtocolEngineTest, SendBeforeEstablishedRejected) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Initiator);
    size_t before = engine.outbound_size();

    EXPECT_EQ(engine.send(msg::Interested{}), SendStatus::NotEstablished);
    EXPECT_EQ(engine.outbound_size(), before);
}

TEST_F(ProtocolEngineTest, SendQueuesEncodedFrames) {
    auto engine = established_responder();

    EXPECT_EQ(engine.send(msg::Interested{}), SendStatus::Queued);
    EXPECT_EQ(engine.send(msg::Request(1, 0, 16384)), SendStatus::Queued);

    std::vector<uint8_t> expected;
    encode_message_into(msg::Interested{}, expected);
    encode_message_into(msg::Request(1, 0, 16384), expected);
    EXPECT_EQ(engine.take_outbound(), expected);
}

TEST_F(ProtocolEngineTest, CloseIsTerminal) {
    auto engine = established_responder();
    engine.send(msg::Unchoke{});

    engine.close();

    EXPECT_TRUE(engine.is_closed());
    EXPECT_FALSE(engine.has_outbound());
    EXPECT_EQ(engine.send(msg::Choke{}), SendStatus::Closed);
    EXPECT_TRUE(engine.receive(encode_message(msg::Have{1})).empty());
    EXPECT_EQ(engine.pending_inbound(), 0u);

    engine.close();
    EXPECT_TRUE(engine.is_closed());
}

TEST_F(ProtocolEngineTest, InputAfterViolationIgnored) {
    ProtocolEngine engine(info_hash_, local_id_, Role::Responder);
    engine.receive(encode_handshake(make_hash(77), remote_id_));
    ASSERT_TRUE(engine.is_closed());

    EXPECT_TRUE(engine.receive(remote_handshake()).empty());
}

TEST_F(ProtocolEngineTest, Counters) {
    auto engine = established_responder();
    EXPECT_EQ(engine.bytes_received(), PW_HANDSHAKE_SIZE);
    EXPECT_EQ(engine.bytes_queued(), PW_HANDSHAKE_SIZE);

    engine.send(msg::Have{2});
    EXPECT_EQ(engine.bytes_queued(), PW_HANDSHAKE_SIZE + 9);
}
