#include "wallet/transfer.h"

namespace oreminer {
namespace wallet {

namespace {

constexpr size_t KEY_SIZE = 32;
constexpr uint32_t SYSTEM_TRANSFER_INSTRUCTION = 2;

void append_u32_le(Bytes &out, uint32_t value) {
  for (int i = 0; i < 4; ++i)
    out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
}

void append_u64_le(Bytes &out, uint64_t value) {
  for (int i = 0; i < 8; ++i)
    out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
}

} // namespace

PublicKey system_program_id() { return PublicKey(KEY_SIZE, 0); }

void append_compact_u16(Bytes &out, uint16_t value) {
  uint32_t rem = value;
  while (true) {
    uint8_t byte = rem & 0x7F;
    rem >>= 7;
    if (rem == 0) {
      out.push_back(byte);
      return;
    }
    out.push_back(byte | 0x80);
  }
}

Result<Bytes> build_transfer_message(const PublicKey &from, const PublicKey &to,
                                     Lamports lamports,
                                     const Bytes &recent_blockhash) {
  if (from.size() != KEY_SIZE || to.size() != KEY_SIZE) {
    return Result<Bytes>("Transfer keys must be 32 bytes");
  }
  if (recent_blockhash.size() != KEY_SIZE) {
    return Result<Bytes>("Recent blockhash must be 32 bytes");
  }

  std::vector<PublicKey> keys{from};
  uint8_t to_index = 0;
  if (to != from) {
    keys.push_back(to);
    to_index = 1;
  }
  keys.push_back(system_program_id());
  uint8_t program_index = static_cast<uint8_t>(keys.size() - 1);

  Bytes message;
  // Header: 1 required signature, 0 read-only signed, 1 read-only unsigned
  message.push_back(1);
  message.push_back(0);
  message.push_back(1);

  append_compact_u16(message, static_cast<uint16_t>(keys.size()));
  for (const auto &key : keys) {
    message.insert(message.end(), key.begin(), key.end());
  }

  message.insert(message.end(), recent_blockhash.begin(),
                 recent_blockhash.end());

  append_compact_u16(message, 1);
  message.push_back(program_index);
  append_compact_u16(message, 2);
  message.push_back(0);
  message.push_back(to_index);

  Bytes data;
  append_u32_le(data, SYSTEM_TRANSFER_INSTRUCTION);
  append_u64_le(data, lamports);
  append_compact_u16(message, static_cast<uint16_t>(data.size()));
  message.insert(message.end(), data.begin(), data.end());

  return Result<Bytes>(std::move(message));
}

Result<Bytes> build_signed_transfer(const Keypair &payer, const PublicKey &to,
                                    Lamports lamports,
                                    const Bytes &recent_blockhash) {
  auto message =
      build_transfer_message(payer.public_key(), to, lamports, recent_blockhash);
  if (message.is_err()) {
    return message;
  }

  auto signature = payer.sign(message.value());
  if (signature.is_err()) {
    return Result<Bytes>("Signing failed: " + signature.error());
  }

  Bytes transaction;
  append_compact_u16(transaction, 1);
  transaction.insert(transaction.end(), signature.value().begin(),
                     signature.value().end());
  transaction.insert(transaction.end(), message.value().begin(),
                     message.value().end());
  return Result<Bytes>(std::move(transaction));
}

} // namespace wallet
} // namespace oreminer
