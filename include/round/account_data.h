#pragma once

#include "common/types.h"
#include <optional>
#include <string>
#include <variant>

namespace oreminer {
namespace round {

using namespace oreminer::common;

/**
 * Account data field shapes returned by an account source.
 *
 * RPC nodes return `["<base64>", "base64"]`; some clients wrap that pair in an
 * object under a `data` key; in-process sources hand over raw bytes. Anything
 * else is carried as Unrecognized so the normalizer can reject it explicitly.
 */
struct Base64Pair {
  std::string encoded;
  std::string encoding = "base64"; ///< anything else is rejected
};

struct KeyedWrapper {
  /// Inner `data` member, absent when it was missing or not a base64 pair
  std::optional<Base64Pair> data;
};

struct RawBytes {
  Bytes bytes;
};

struct Unrecognized {
  std::string description;
};

using AccountDataField =
    std::variant<Base64Pair, KeyedWrapper, RawBytes, Unrecognized>;

/**
 * Normalizer rejection reasons
 */
enum class NormalizeError {
  NONE,
  UNRECOGNIZED_ENCODING,
  MISSING_INNER_DATA,
  INVALID_BASE64
};

struct NormalizeResult {
  NormalizeError error = NormalizeError::NONE;
  Bytes bytes;
  std::string detail;

  bool is_ok() const { return error == NormalizeError::NONE; }
};

/**
 * Turn one account data field into raw bytes, or reject it.
 *
 * Pure: no logging, the caller decides how to report a rejection.
 */
NormalizeResult normalize_account_data(const AccountDataField &field);

std::string to_string(NormalizeError error);

} // namespace round
} // namespace oreminer
