#include "wallet/keypair.h"
#include "common/encoding.h"
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

using json = nlohmann::json;

namespace oreminer {
namespace wallet {

namespace {

constexpr size_t SEED_SIZE = 32;
constexpr size_t PUBLIC_KEY_SIZE = 32;
constexpr size_t SIGNATURE_SIZE = 64;

struct PkeyDeleter {
  void operator()(EVP_PKEY *pkey) const { EVP_PKEY_free(pkey); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr private_key_from_seed(const Bytes &seed) {
  return PkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              seed.data(), seed.size()));
}

} // namespace

Result<Keypair> Keypair::load_from_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<Keypair>("Cannot open keypair file: " + path);
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::exception &e) {
    return Result<Keypair>("Keypair file is not valid JSON: " +
                           std::string(e.what()));
  }

  if (!j.is_array()) {
    return Result<Keypair>("Keypair file must contain a JSON array");
  }

  Bytes bytes;
  bytes.reserve(j.size());
  for (const auto &value : j) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > 255) {
      return Result<Keypair>("Keypair file contains a non-byte value");
    }
    bytes.push_back(static_cast<uint8_t>(value.get<int64_t>()));
  }
  return from_bytes(bytes);
}

Result<Keypair> Keypair::from_bytes(const Bytes &bytes) {
  if (bytes.size() != SEED_SIZE + PUBLIC_KEY_SIZE) {
    return Result<Keypair>("Keypair must be 64 bytes, got " +
                           std::to_string(bytes.size()));
  }

  Keypair keypair;
  keypair.seed_.assign(bytes.begin(), bytes.begin() + SEED_SIZE);
  keypair.public_key_.assign(bytes.begin() + SEED_SIZE, bytes.end());

  PkeyPtr pkey = private_key_from_seed(keypair.seed_);
  if (!pkey) {
    return Result<Keypair>("OpenSSL rejected the Ed25519 seed");
  }

  Bytes derived(PUBLIC_KEY_SIZE);
  size_t derived_len = derived.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), derived.data(), &derived_len) !=
          1 ||
      derived_len != PUBLIC_KEY_SIZE) {
    return Result<Keypair>("Failed to derive public key from seed");
  }
  if (derived != keypair.public_key_) {
    return Result<Keypair>("Keypair public key does not match its seed");
  }

  return Result<Keypair>(std::move(keypair));
}

Result<Signature> Keypair::sign(const Bytes &message) const {
  if (seed_.size() != SEED_SIZE) {
    return Result<Signature>("Keypair is empty");
  }

  PkeyPtr pkey = private_key_from_seed(seed_);
  if (!pkey) {
    return Result<Signature>("OpenSSL rejected the Ed25519 seed");
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return Result<Signature>("Failed to allocate signing context");
  }

  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return Result<Signature>("EVP_DigestSignInit failed");
  }

  Signature signature(SIGNATURE_SIZE);
  size_t sig_len = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(),
                     message.size()) != 1 ||
      sig_len != SIGNATURE_SIZE) {
    return Result<Signature>("EVP_DigestSign failed");
  }

  return Result<Signature>(std::move(signature));
}

std::string Keypair::address() const { return base58_encode(public_key_); }

bool verify_signature(const Bytes &message, const Signature &signature,
                      const PublicKey &public_key) {
  if (signature.size() != SIGNATURE_SIZE ||
      public_key.size() != PUBLIC_KEY_SIZE) {
    return false;
  }

  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                           public_key.data(),
                                           public_key.size()));
  if (!pkey) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return false;
  }

  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return false;
  }

  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

} // namespace wallet
} // namespace oreminer
