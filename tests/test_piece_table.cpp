#include <gtest/gtest.h>
#include "piece_table.h"

#include <memory>
#include <set>

using namespace peerwire;

//=============================================================================
// Helper Functions
//=============================================================================

namespace {

std::vector<uint8_t> make_content(size_t size) {
    std::vector<uint8_t> content(size);
    for (size_t i = 0; i < size; ++i) {
        content[i] = static_cast<uint8_t>((i * 13 + i / 251) & 0xFF);
    }
    return content;
}

std::vector<uint8_t> slice(const std::vector<uint8_t>& content, uint64_t offset, uint32_t length) {
    return std::vector<uint8_t>(content.begin() + offset, content.begin() + offset + length);
}

} // namespace

class PieceTableTest : public ::testing::Test {
protected:
    // 3 pieces of 4 blocks of 1 KiB, the last piece 1.5 KiB
    void SetUp() override {
        content_ = make_content(4096 * 2 + 1536);
        meta_ = std::make_unique<TorrentMeta>(TorrentMeta::from_content(content_, 4096, "t"));
        table_ = std::make_unique<PieceTable>(*meta_, 1024);
        all_ = Bitfield(3, true);
    }

    BlockWriteResult deliver(const BlockInfo& block) {
        return table_->write_block(block.piece_index, block.offset,
                                   slice(content_, meta_->piece_offset(block.piece_index) + block.offset,
                                         block.length));
    }

    std::vector<uint8_t> content_;
    std::unique_ptr<TorrentMeta> meta_;
    std::unique_ptr<PieceTable> table_;
    Bitfield all_;
};

//=============================================================================
// Scheduling
//=============================================================================

TEST_F(PieceTableTest, InitialState) {
    EXPECT_EQ(table_->num_pieces(), 3u);
    EXPECT_EQ(table_->num_verified(), 0u);
    EXPECT_FALSE(table_->is_complete());
    EXPECT_EQ(table_->requested_count(), 0u);
    for (uint32_t i = 0; i < 3; ++i) {
        EXPECT_EQ(table_->state(i), PieceState::Missing);
    }
    EXPECT_EQ(table_->received_blocks(2).size(), 2u);
}

TEST_F(PieceTableTest, PickIsSequential) {
    auto first = table_->pick_block(all_);
    auto second = table_->pick_block(all_);

    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, BlockInfo(0, 0, 1024));
    EXPECT_EQ(*second, BlockInfo(0, 1024, 1024));
    EXPECT_TRUE(table_->is_requested(*first));
    EXPECT_EQ(table_->requested_count(), 2u);
}

TEST_F(PieceTableTest, PickRespectsPeerPieces) {
    Bitfield peer(3);
    peer.set_bit(2);

    auto a = table_->pick_block(peer);
    auto b = table_->pick_block(peer);
    auto c = table_->pick_block(peer);

    ASSERT_TRUE(a && b);
    EXPECT_EQ(*a, BlockInfo(2, 0, 1024));
    EXPECT_EQ(*b, BlockInfo(2, 1024, 512));
    EXPECT_FALSE(c.has_value());

    EXPECT_FALSE(table_->pick_block(Bitfield(3)).has_value());
}

TEST_F(PieceTableTest, NoBlockAssignedTwice) {
    std::set<BlockInfo> seen;
    while (auto block = table_->pick_block(all_)) {
        EXPECT_TRUE(seen.insert(*block).second);
    }
    EXPECT_EQ(seen.size(), 10u);
    EXPECT_EQ(table_->requested_count(), 10u);
}

TEST_F(PieceTableTest, ReleaseMakesBlockAssignableAgain) {
    auto block = table_->pick_block(all_);
    ASSERT_TRUE(block);

    table_->release_block(*block);
    EXPECT_FALSE(table_->is_requested(*block));
    EXPECT_EQ(table_->requested_count(), 0u);

    auto again = table_->pick_block(all_);
    ASSERT_TRUE(again);
    EXPECT_EQ(*again, *block);

    // Releasing twice or releasing junk is harmless
    table_->release_block(*block);
    table_->release_block(*block);
    table_->release_block(BlockInfo(9, 0, 1024));
    EXPECT_EQ(table_->requested_count(), 0u);
}

//=============================================================================
// Data
//=============================================================================

TEST_F(PieceTableTest, CompletingPieceVerifiesIt) {
    for (uint32_t b = 0; b < 3; ++b) {
        auto result = deliver(BlockInfo(0, b * 1024, 1024));
        EXPECT_EQ(result.outcome, BlockOutcome::Stored);
        EXPECT_EQ(table_->state(0), PieceState::InProgress);
    }

    auto result = deliver(BlockInfo(0, 3072, 1024));
    EXPECT_EQ(result.outcome, BlockOutcome::PieceVerified);
    EXPECT_EQ(result.piece_data, slice(content_, 0, 4096));
    EXPECT_TRUE(table_->is_verified(0));
    EXPECT_TRUE(table_->verified_pieces().get_bit(0));
    EXPECT_EQ(table_->num_verified(), 1u);
}

TEST_F(PieceTableTest, OutOfOrderBlocksAndShortLastPiece) {
    EXPECT_EQ(deliver(BlockInfo(2, 1024, 512)).outcome, BlockOutcome::Stored);
    auto result = deliver(BlockInfo(2, 0, 1024));
    EXPECT_EQ(result.outcome, BlockOutcome::PieceVerified);
    EXPECT_EQ(result.piece_data.size(), 1536u);
}

TEST_F(PieceTableTest, DuplicateBlock) {
    deliver(BlockInfo(1, 0, 1024));
    EXPECT_EQ(deliver(BlockInfo(1, 0, 1024)).outcome, BlockOutcome::Duplicate);
    EXPECT_EQ(table_->blocks_received(1), 1u);
}

TEST_F(PieceTableTest, ReceivedBlockClearsRequest) {
    auto block = table_->pick_block(all_);
    ASSERT_TRUE(block);
    deliver(*block);

    EXPECT_EQ(table_->requested_count(), 0u);
    EXPECT_TRUE(table_->received_blocks(0).get_bit(0));

    // Releasing after receipt keeps the data
    table_->release_block(*block);
    EXPECT_EQ(table_->blocks_received(0), 1u);
    auto next = table_->pick_block(all_);
    ASSERT_TRUE(next);
    EXPECT_NE(*next, *block);
}

TEST_F(PieceTableTest, InvalidBlocksRejected) {
    std::vector<uint8_t> kb(1024, 0);
    EXPECT_EQ(table_->write_block(3, 0, kb).outcome, BlockOutcome::Rejected);
    EXPECT_EQ(table_->write_block(0, 100, kb).outcome, BlockOutcome::Rejected);
    EXPECT_EQ(table_->write_block(0, 4096, kb).outcome, BlockOutcome::Rejected);
    EXPECT_EQ(table_->write_block(0, 0, std::vector<uint8_t>(512)).outcome, BlockOutcome::Rejected);
    EXPECT_EQ(table_->write_block(2, 1024, kb).outcome, BlockOutcome::Rejected);
    EXPECT_EQ(table_->state(0), PieceState::Missing);
}

TEST_F(PieceTableTest, HashMismatchResetsPiece) {
    deliver(BlockInfo(1, 0, 1024));
    deliver(BlockInfo(1, 1024, 1024));
    deliver(BlockInfo(1, 2048, 1024));
    table_->pick_block(all_);

    std::vector<uint8_t> corrupt(1024, 0xEE);
    auto result = table_->write_block(1, 3072, corrupt);

    EXPECT_EQ(result.outcome, BlockOutcome::HashMismatch);
    EXPECT_TRUE(result.piece_data.empty());
    EXPECT_EQ(table_->state(1), PieceState::Missing);
    EXPECT_EQ(table_->blocks_received(1), 0u);
    EXPECT_FALSE(table_->is_verified(1));

    // Piece can be downloaded again from scratch
    for (uint32_t b = 0; b < 3; ++b) {
        deliver(BlockInfo(1, b * 1024, 1024));
    }
    EXPECT_EQ(deliver(BlockInfo(1, 3072, 1024)).outcome, BlockOutcome::PieceVerified);
}

TEST_F(PieceTableTest, VerifiedPieceIsFinal) {
    for (uint32_t b = 0; b < 4; ++b) {
        deliver(BlockInfo(0, b * 1024, 1024));
    }
    ASSERT_TRUE(table_->is_verified(0));

    EXPECT_EQ(deliver(BlockInfo(0, 0, 1024)).outcome, BlockOutcome::Rejected);
    EXPECT_TRUE(table_->is_verified(0));

    Bitfield only_zero(3);
    only_zero.set_bit(0);
    EXPECT_FALSE(table_->pick_block(only_zero).has_value());
}

TEST_F(PieceTableTest, MarkVerified) {
    auto block = table_->pick_block(all_);
    ASSERT_TRUE(block);

    table_->mark_verified(0);
    table_->mark_verified(1);
    table_->mark_verified(2);
    table_->mark_verified(42);

    EXPECT_TRUE(table_->is_complete());
    EXPECT_EQ(table_->requested_count(), 0u);
    EXPECT_FALSE(table_->pick_block(all_).has_value());
}

TEST_F(PieceTableTest, WantsAny) {
    Bitfield peer(3);
    EXPECT_FALSE(table_->wants_any(peer));

    peer.set_bit(1);
    EXPECT_TRUE(table_->wants_any(peer));

    table_->mark_verified(1);
    EXPECT_FALSE(table_->wants_any(peer));
}

TEST_F(PieceTableTest, FullDownloadCompletes) {
    while (auto block = table_->pick_block(all_)) {
        auto outcome = deliver(*block).outcome;
        EXPECT_TRUE(outcome == BlockOutcome::Stored || outcome == BlockOutcome::PieceVerified);
    }
    EXPECT_TRUE(table_->is_complete());
    EXPECT_EQ(table_->requested_count(), 0u);
}
