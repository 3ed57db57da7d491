#pragma once

#include "common/types.h"
#include <string>

namespace oreminer {
namespace common {

/**
 * Text encodings used on the Solana JSON-RPC wire.
 *
 * Base64 carries account data and signed transactions; base58 carries public
 * keys, blockhashes and signatures.
 */

/// Encode bytes as standard padded base64 without line breaks
std::string base64_encode(const Bytes &data);

/// Decode standard base64; invalid characters or truncated input are errors
Result<Bytes> base64_decode(const std::string &encoded);

/// Encode bytes with the Bitcoin/Solana base58 alphabet
std::string base58_encode(const Bytes &data);

/// Decode base58; characters outside the alphabet are errors
Result<Bytes> base58_decode(const std::string &encoded);

} // namespace common
} // namespace oreminer
