#pragma once

#include "common/types.h"
#include "wallet/keypair.h"

namespace oreminer {
namespace wallet {

using namespace oreminer::common;

/// System program id (all zero bytes, "11111111111111111111111111111111")
PublicKey system_program_id();

/// Append a Solana compact-u16 (shortvec) length prefix
void append_compact_u16(Bytes &out, uint16_t value);

/**
 * @brief Serialize a legacy transaction message holding one System Program
 * Transfer instruction
 *
 * Account order is payer (signer, writable), recipient (writable), system
 * program (read-only). A transfer to self collapses to a single account key.
 */
Result<Bytes> build_transfer_message(const PublicKey &from, const PublicKey &to,
                                     Lamports lamports,
                                     const Bytes &recent_blockhash);

/**
 * @brief Build, sign and serialize a transfer transaction from `payer`
 * @return wire bytes ready for sendTransaction
 */
Result<Bytes> build_signed_transfer(const Keypair &payer, const PublicKey &to,
                                    Lamports lamports,
                                    const Bytes &recent_blockhash);

} // namespace wallet
} // namespace oreminer
