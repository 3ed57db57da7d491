#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace oreminer {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout the ORE miner
 *
 * This header defines the byte and currency aliases shared by every module and
 * the Result<T> wrapper used for fallible operations.
 */

/// @brief Raw byte buffer
using Bytes = std::vector<uint8_t>;

/// @brief Ed25519 public key representation (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Ed25519 signature representation (64 bytes)
using Signature = std::vector<uint8_t>;

/// @brief Native token amount in smallest unit (1 SOL = 1,000,000,000 lamports)
using Lamports = uint64_t;

/// @brief Number of lamports in one SOL
constexpr Lamports LAMPORTS_PER_SOL = 1000000000ULL;

/// @brief Convert a lamport amount to SOL
inline double lamports_to_sol(Lamports lamports) {
  return static_cast<double>(lamports) / static_cast<double>(LAMPORTS_PER_SOL);
}

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or an error message. Operations at component
 * boundaries return this instead of throwing so that a single failing account,
 * tile or ledger write can be reported and skipped by the caller.
 *
 * @tparam T The type of the success value
 *
 * Example usage:
 * @code
 * auto bytes = base64_decode(encoded);
 * if (bytes.is_ok()) {
 *     use(bytes.value());
 * } else {
 *     LOG_WARN("round", "decode failed: ", bytes.error());
 * }
 * @endcode
 */
template <typename T> class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error) : success_(false), value_(), error_(error) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error String describing the error
   */
  explicit Result(const std::string &error)
      : success_(false), value_(), error_(error) {}

  /**
   * @brief Check if the result represents success
   */
  bool is_ok() const noexcept { return success_; }

  /**
   * @brief Check if the result represents failure
   */
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /// Move the success value out of an rvalue result
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error message
   * @warning Only meaningful if is_err() returns true
   */
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /**
   * @brief Get value or return default on error
   */
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace oreminer
