#pragma once

#include "common/types.h"
#include <string>

namespace oreminer {
namespace wallet {

using namespace oreminer::common;

/**
 * @brief Ed25519 signing keypair in the Solana CLI file format
 *
 * The keypair file is a JSON array of 64 integers: the 32-byte secret seed
 * followed by the 32-byte public key.
 */
class Keypair {
public:
  /**
   * @brief Load a keypair from a Solana CLI JSON file
   * @param path path to the keypair file
   * @return the keypair, or an error if the file is missing, malformed, or the
   * stored public key does not match the seed
   */
  static Result<Keypair> load_from_file(const std::string &path);

  /**
   * @brief Build a keypair from the 64 raw bytes of a keypair file
   */
  static Result<Keypair> from_bytes(const Bytes &bytes);

  /**
   * @brief Sign a message
   * @return 64-byte Ed25519 signature, or an error from OpenSSL
   */
  Result<Signature> sign(const Bytes &message) const;

  const PublicKey &public_key() const { return public_key_; }

  /// Base58 address of the public key
  std::string address() const;

  Keypair() = default;

private:
  Bytes seed_;
  PublicKey public_key_;
};

/**
 * @brief Verify an Ed25519 signature
 */
bool verify_signature(const Bytes &message, const Signature &signature,
                      const PublicKey &public_key);

} // namespace wallet
} // namespace oreminer
