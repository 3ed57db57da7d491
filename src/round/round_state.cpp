#include "round/round_state.h"

namespace oreminer {
namespace round {

namespace {

void write_u64(Bytes &out, uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

template <size_t N>
void write_bytes(Bytes &out, const std::array<uint8_t, N> &value) {
  out.insert(out.end(), value.begin(), value.end());
}

} // namespace

bool RoundState::operator==(const RoundState &other) const {
  return id == other.id && deployed == other.deployed &&
         slot_hash == other.slot_hash && counts == other.counts &&
         expires_at == other.expires_at && motherlode == other.motherlode &&
         rent_payer == other.rent_payer && top_miner == other.top_miner &&
         top_miner_reward == other.top_miner_reward &&
         total_deployed == other.total_deployed &&
         total_vaulted == other.total_vaulted &&
         total_winnings == other.total_winnings;
}

bool ByteReader::read_u64(uint64_t &out) {
  if (remaining() < 8)
    return false;
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(data_[offset_ + i]) << (i * 8);
  }
  out = value;
  offset_ += 8;
  return true;
}

bool ByteReader::skip(size_t count) {
  if (remaining() < count)
    return false;
  offset_ += count;
  return true;
}

RoundDecodeResult decode_round_state(const uint8_t *data, size_t size) {
  RoundDecodeResult result;
  if (data == nullptr || size < ROUND_STATE_SIZE) {
    result.error = RoundDecodeError::TOO_SHORT;
    return result;
  }

  // Restrict the cursor to the struct so padding can never be consumed
  ByteReader reader(data, ROUND_STATE_SIZE);
  RoundState &round = result.round;

  bool ok = reader.read_u64(round.id) &&
            reader.read_u64_array(round.deployed) &&
            reader.read_bytes(round.slot_hash) &&
            reader.read_u64_array(round.counts) &&
            reader.read_u64(round.expires_at) &&
            reader.read_u64(round.motherlode) &&
            reader.read_bytes(round.rent_payer) &&
            reader.read_bytes(round.top_miner) &&
            reader.read_u64(round.top_miner_reward) &&
            reader.read_u64(round.total_deployed) &&
            reader.read_u64(round.total_vaulted) &&
            reader.read_u64(round.total_winnings) &&
            reader.offset() == ROUND_FIELDS_SIZE &&
            reader.skip(ROUND_RESERVED_SIZE);

  if (!ok || reader.offset() != ROUND_STATE_SIZE) {
    result.error = RoundDecodeError::LAYOUT_MISMATCH;
    result.round = RoundState{};
  }
  return result;
}

RoundDecodeResult decode_round_state(const Bytes &data) {
  return decode_round_state(data.data(), data.size());
}

Bytes encode_round_state(const RoundState &round) {
  Bytes out;
  out.reserve(ROUND_STATE_SIZE);

  write_u64(out, round.id);
  for (uint64_t value : round.deployed)
    write_u64(out, value);
  write_bytes(out, round.slot_hash);
  for (uint64_t value : round.counts)
    write_u64(out, value);
  write_u64(out, round.expires_at);
  write_u64(out, round.motherlode);
  write_bytes(out, round.rent_payer);
  write_bytes(out, round.top_miner);
  write_u64(out, round.top_miner_reward);
  write_u64(out, round.total_deployed);
  write_u64(out, round.total_vaulted);
  write_u64(out, round.total_winnings);
  out.resize(ROUND_STATE_SIZE, 0);

  return out;
}

std::string to_string(RoundDecodeError error) {
  switch (error) {
  case RoundDecodeError::NONE:
    return "none";
  case RoundDecodeError::TOO_SHORT:
    return "TooShort";
  case RoundDecodeError::LAYOUT_MISMATCH:
    return "LayoutMismatch";
  default:
    return "unknown";
  }
}

} // namespace round
} // namespace oreminer
