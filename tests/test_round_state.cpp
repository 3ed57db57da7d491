/**
 * Unit tests for the round account decoder
 *
 * Covers:
 * - Field offsets of the 584-byte record
 * - Rejection of short inputs
 * - Tolerance of trailing account padding
 * - Encoder/decoder agreement
 */

#include "round/round_state.h"
#include <gtest/gtest.h>
#include <cstring>

using namespace oreminer::round;
using oreminer::common::Bytes;

namespace {

void put_u64(Bytes &buffer, size_t offset, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer[offset + i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

RoundState sample_round() {
    RoundState round;
    round.id = 4242;
    for (size_t i = 0; i < TILE_COUNT; ++i) {
        round.deployed[i] = (i + 1) * 1000003ULL;
        round.counts[i] = i * 7;
    }
    for (size_t i = 0; i < KEY_SIZE; ++i) {
        round.slot_hash[i] = static_cast<uint8_t>(i);
        round.rent_payer[i] = static_cast<uint8_t>(0xA0 + i);
        round.top_miner[i] = static_cast<uint8_t>(0xFF - i);
    }
    round.expires_at = 987654321ULL;
    round.motherlode = 5000000000ULL;
    round.top_miner_reward = 123;
    round.total_deployed = 0xFFFFFFFFFFFFFFFFULL;
    round.total_vaulted = 77;
    round.total_winnings = 1ULL << 40;
    return round;
}

} // namespace

// ============================================================================
// Layout
// ============================================================================

TEST(RoundStateTest, RecordSizeConstants) {
    EXPECT_EQ(ROUND_STATE_SIZE, 584u);
    EXPECT_EQ(ROUND_FIELDS_SIZE + ROUND_RESERVED_SIZE, ROUND_STATE_SIZE);
}

TEST(RoundStateTest, DecodesExampleRound) {
    Bytes blob(ROUND_STATE_SIZE, 0);
    put_u64(blob, 0, 7);
    put_u64(blob, 8, 1000000000ULL);
    put_u64(blob, 448, 5000000000ULL);

    auto result = decode_round_state(blob);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.round.id, 7u);
    EXPECT_EQ(result.round.deployed[0], 1000000000ULL);
    for (size_t i = 1; i < TILE_COUNT; ++i) {
        EXPECT_EQ(result.round.deployed[i], 0u) << "tile index " << i;
    }
    EXPECT_EQ(result.round.motherlode, 5000000000ULL);
}

TEST(RoundStateTest, FieldOffsets) {
    Bytes blob(ROUND_STATE_SIZE, 0);
    put_u64(blob, 0, 1);                 // id
    put_u64(blob, 8 + 24 * 8, 2);        // deployed[24]
    blob[208] = 0x11;                    // slot_hash[0]
    blob[239] = 0x22;                    // slot_hash[31]
    put_u64(blob, 240, 3);               // counts[0]
    put_u64(blob, 432, 4);               // counts[24]
    put_u64(blob, 440, 5);               // expires_at
    put_u64(blob, 448, 6);               // motherlode
    blob[456] = 0x33;                    // rent_payer[0]
    blob[488] = 0x44;                    // top_miner[0]
    put_u64(blob, 520, 7);               // top_miner_reward
    put_u64(blob, 528, 8);               // total_deployed
    put_u64(blob, 536, 9);               // total_vaulted
    put_u64(blob, 544, 10);              // total_winnings

    auto result = decode_round_state(blob);
    ASSERT_TRUE(result.is_ok());
    const RoundState &round = result.round;
    EXPECT_EQ(round.id, 1u);
    EXPECT_EQ(round.deployed[24], 2u);
    EXPECT_EQ(round.slot_hash[0], 0x11);
    EXPECT_EQ(round.slot_hash[31], 0x22);
    EXPECT_EQ(round.counts[0], 3u);
    EXPECT_EQ(round.counts[24], 4u);
    EXPECT_EQ(round.expires_at, 5u);
    EXPECT_EQ(round.motherlode, 6u);
    EXPECT_EQ(round.rent_payer[0], 0x33);
    EXPECT_EQ(round.top_miner[0], 0x44);
    EXPECT_EQ(round.top_miner_reward, 7u);
    EXPECT_EQ(round.total_deployed, 8u);
    EXPECT_EQ(round.total_vaulted, 9u);
    EXPECT_EQ(round.total_winnings, 10u);
}

TEST(RoundStateTest, ReservedTailIsIgnored) {
    Bytes blob = encode_round_state(sample_round());
    for (size_t i = ROUND_FIELDS_SIZE; i < ROUND_STATE_SIZE; ++i) {
        blob[i] = 0xEE;
    }

    auto result = decode_round_state(blob);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.round, sample_round());
}

// ============================================================================
// Short inputs
// ============================================================================

TEST(RoundStateTest, RejectsEveryShortLength) {
    Bytes blob(ROUND_STATE_SIZE - 1, 0xAB);
    for (size_t len = 0; len < ROUND_STATE_SIZE; ++len) {
        auto result = decode_round_state(blob.data(), len);
        EXPECT_FALSE(result.is_ok()) << "length " << len;
        EXPECT_EQ(result.error, RoundDecodeError::TOO_SHORT) << "length " << len;
    }
}

TEST(RoundStateTest, ShortHeapBufferIsNotOverread) {
    // Exact-size allocation so sanitizers catch any read past the end
    Bytes blob(100, 0x01);
    auto result = decode_round_state(blob);
    EXPECT_EQ(result.error, RoundDecodeError::TOO_SHORT);
    EXPECT_EQ(result.round, RoundState{});
}

TEST(RoundStateTest, NullInputIsTooShort) {
    auto result = decode_round_state(nullptr, 1000);
    EXPECT_EQ(result.error, RoundDecodeError::TOO_SHORT);
}

TEST(RoundStateTest, ErrorNames) {
    EXPECT_EQ(to_string(RoundDecodeError::TOO_SHORT), "TooShort");
    EXPECT_EQ(to_string(RoundDecodeError::LAYOUT_MISMATCH), "LayoutMismatch");
}

// ============================================================================
// Trailing bytes and round trip
// ============================================================================

TEST(RoundStateTest, TrailingBytesDoNotChangeResult) {
    Bytes exact = encode_round_state(sample_round());
    auto baseline = decode_round_state(exact);
    ASSERT_TRUE(baseline.is_ok());

    for (size_t extra : {1u, 8u, 64u, 1000u}) {
        Bytes padded = exact;
        padded.resize(exact.size() + extra, 0x5A);
        auto result = decode_round_state(padded);
        ASSERT_TRUE(result.is_ok()) << "extra " << extra;
        EXPECT_EQ(result.round, baseline.round) << "extra " << extra;
    }
}

TEST(RoundStateTest, EncodeThenDecodePreservesAllFields) {
    RoundState original = sample_round();
    Bytes encoded = encode_round_state(original);
    ASSERT_EQ(encoded.size(), ROUND_STATE_SIZE);

    for (size_t i = ROUND_FIELDS_SIZE; i < ROUND_STATE_SIZE; ++i) {
        EXPECT_EQ(encoded[i], 0) << "reserved byte " << i;
    }

    auto decoded = decode_round_state(encoded);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.round, original);
}

TEST(RoundStateTest, ByteReaderStopsAtEnd) {
    uint8_t data[12] = {1, 0, 0, 0, 0, 0, 0, 0, 9, 9, 9, 9};
    ByteReader reader(data, sizeof(data));

    uint64_t value = 0;
    EXPECT_TRUE(reader.read_u64(value));
    EXPECT_EQ(value, 1u);
    EXPECT_FALSE(reader.read_u64(value));
    EXPECT_EQ(reader.offset(), 8u);
    EXPECT_EQ(reader.remaining(), 4u);
    EXPECT_FALSE(reader.skip(5));
    EXPECT_TRUE(reader.skip(4));
    EXPECT_EQ(reader.remaining(), 0u);
}
