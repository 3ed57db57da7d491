#pragma once

#include "common/types.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace oreminer {
namespace round {

using namespace oreminer::common;

/// Number of tiles on the round board
constexpr size_t TILE_COUNT = 25;

/// Width of on-chain account identifiers and slot hashes
constexpr size_t KEY_SIZE = 32;

/// Bytes occupied by the decoded fields
constexpr size_t ROUND_FIELDS_SIZE = 8 + TILE_COUNT * 8 + KEY_SIZE +
                                     TILE_COUNT * 8 + 8 + 8 + KEY_SIZE +
                                     KEY_SIZE + 8 + 8 + 8 + 8;

/// Unused tail of the record, written as zeros and never interpreted
constexpr size_t ROUND_RESERVED_SIZE = 32;

/// Size of a round record; shorter accounts are never decoded
constexpr size_t ROUND_STATE_SIZE = ROUND_FIELDS_SIZE + ROUND_RESERVED_SIZE;
static_assert(ROUND_FIELDS_SIZE == 552, "round fields occupy 552 bytes");
static_assert(ROUND_STATE_SIZE == 584, "round account record is 584 bytes");

/**
 * One decoded ORE round account.
 *
 * Mirrors the on-chain layout field for field; all integers are little-endian
 * u64 and all amounts are in lamports.
 */
struct RoundState {
  uint64_t id = 0;
  std::array<uint64_t, TILE_COUNT> deployed{};
  std::array<uint8_t, KEY_SIZE> slot_hash{};
  std::array<uint64_t, TILE_COUNT> counts{};
  uint64_t expires_at = 0;
  uint64_t motherlode = 0;
  std::array<uint8_t, KEY_SIZE> rent_payer{};
  std::array<uint8_t, KEY_SIZE> top_miner{};
  uint64_t top_miner_reward = 0;
  uint64_t total_deployed = 0;
  uint64_t total_vaulted = 0;
  uint64_t total_winnings = 0;

  bool operator==(const RoundState &other) const;
  bool operator!=(const RoundState &other) const { return !(*this == other); }
};

/**
 * Round decode failures
 */
enum class RoundDecodeError {
  NONE,
  TOO_SHORT,      ///< fewer than ROUND_STATE_SIZE bytes supplied
  LAYOUT_MISMATCH ///< cursor did not land on ROUND_STATE_SIZE
};

/**
 * Outcome of decoding one account blob
 */
struct RoundDecodeResult {
  RoundDecodeError error = RoundDecodeError::NONE;
  RoundState round;

  bool is_ok() const { return error == RoundDecodeError::NONE; }
};

/**
 * Bounds-checked little-endian reader over a byte slice.
 *
 * Every read checks the remaining length first; a read that would cross the end
 * of the slice fails and leaves the cursor unchanged.
 */
class ByteReader {
public:
  ByteReader(const uint8_t *data, size_t size)
      : data_(data), size_(size), offset_(0) {}

  bool read_u64(uint64_t &out);
  bool skip(size_t count);
  template <size_t N> bool read_bytes(std::array<uint8_t, N> &out);
  template <size_t N> bool read_u64_array(std::array<uint64_t, N> &out) {
    for (auto &value : out) {
      if (!read_u64(value))
        return false;
    }
    return true;
  }

  size_t offset() const { return offset_; }
  size_t remaining() const { return size_ - offset_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t offset_;
};

template <size_t N> bool ByteReader::read_bytes(std::array<uint8_t, N> &out) {
  if (remaining() < N)
    return false;
  for (size_t i = 0; i < N; ++i) {
    out[i] = data_[offset_ + i];
  }
  offset_ += N;
  return true;
}

/**
 * Decode a round account.
 *
 * Consumes exactly the first ROUND_STATE_SIZE bytes (fields, then the reserved
 * tail); any trailing bytes (account padding) are ignored. Inputs shorter than
 * ROUND_STATE_SIZE are rejected with TOO_SHORT before any field is read.
 */
RoundDecodeResult decode_round_state(const uint8_t *data, size_t size);
RoundDecodeResult decode_round_state(const Bytes &data);

/// Serialize a round into its 584-byte record, reserved tail zeroed
Bytes encode_round_state(const RoundState &round);

std::string to_string(RoundDecodeError error);

} // namespace round
} // namespace oreminer
