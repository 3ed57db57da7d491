#include "common/encoding.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <openssl/evp.h>

namespace oreminer {
namespace common {

namespace {

const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const std::array<int, 256> &base58_map() {
  static const std::array<int, 256> map = [] {
    std::array<int, 256> m{};
    m.fill(-1);
    for (int i = 0; i < 58; ++i) {
      m[static_cast<unsigned char>(BASE58_ALPHABET[i])] = i;
    }
    return m;
  }();
  return map;
}

bool is_base64_char(unsigned char c) {
  return std::isalnum(c) || c == '+' || c == '/';
}

// EVP_DecodeUpdate skips whitespace and stops at '-', so the shape of the
// input is checked here: full quads of alphabet characters with at most two
// '=' at the very end.
bool is_canonical_base64(const std::string &encoded) {
  if (encoded.size() % 4 != 0)
    return false;

  size_t padding = 0;
  while (padding < 2 && padding < encoded.size() &&
         encoded[encoded.size() - 1 - padding] == '=') {
    padding++;
  }

  for (size_t i = 0; i < encoded.size() - padding; ++i) {
    if (!is_base64_char(static_cast<unsigned char>(encoded[i])))
      return false;
  }
  return true;
}

struct EncodeCtxDeleter {
  void operator()(EVP_ENCODE_CTX *ctx) const { EVP_ENCODE_CTX_free(ctx); }
};

} // namespace

std::string base64_encode(const Bytes &data) {
  if (data.empty())
    return "";

  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                data.data(), static_cast<int>(data.size()));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return out;
}

Result<Bytes> base64_decode(const std::string &encoded) {
  if (encoded.empty())
    return Result<Bytes>(Bytes{});

  if (encoded.size() % 4 != 0)
    return Result<Bytes>("Truncated base64 input");
  if (!is_canonical_base64(encoded))
    return Result<Bytes>("Invalid base64 input");

  std::unique_ptr<EVP_ENCODE_CTX, EncodeCtxDeleter> ctx(EVP_ENCODE_CTX_new());
  if (!ctx)
    return Result<Bytes>("Failed to allocate base64 decode context");

  EVP_DecodeInit(ctx.get());

  Bytes out(encoded.size() / 4 * 3 + 3);
  int out_len = 0;
  if (EVP_DecodeUpdate(ctx.get(), out.data(), &out_len,
                       reinterpret_cast<const unsigned char *>(encoded.data()),
                       static_cast<int>(encoded.size())) < 0) {
    return Result<Bytes>("Invalid base64 input");
  }

  int final_len = 0;
  if (EVP_DecodeFinal(ctx.get(), out.data() + out_len, &final_len) < 0) {
    return Result<Bytes>("Truncated base64 input");
  }

  out.resize(static_cast<size_t>(out_len + final_len));
  return Result<Bytes>(std::move(out));
}

std::string base58_encode(const Bytes &data) {
  if (data.empty())
    return "";

  // Little-endian base58 digits of the big-endian input number
  std::vector<uint8_t> digits;
  for (uint8_t byte : data) {
    uint32_t carry = byte;
    for (size_t j = 0; j < digits.size(); ++j) {
      carry += static_cast<uint32_t>(digits[j]) << 8;
      digits[j] = carry % 58;
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  std::string result;
  for (uint8_t byte : data) {
    if (byte != 0)
      break;
    result += BASE58_ALPHABET[0];
  }

  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += BASE58_ALPHABET[*it];
  }

  return result;
}

Result<Bytes> base58_decode(const std::string &encoded) {
  if (encoded.empty())
    return Result<Bytes>(Bytes{});

  const auto &map = base58_map();

  // Little-endian base256 accumulator
  Bytes result;
  for (char c : encoded) {
    int digit = map[static_cast<unsigned char>(c)];
    if (digit < 0) {
      return Result<Bytes>(std::string("Invalid base58 character '") + c +
                           "'");
    }

    uint32_t carry = static_cast<uint32_t>(digit);
    for (size_t j = 0; j < result.size(); ++j) {
      carry += static_cast<uint32_t>(result[j]) * 58;
      result[j] = carry & 0xFF;
      carry >>= 8;
    }
    while (carry > 0) {
      result.push_back(carry & 0xFF);
      carry >>= 8;
    }
  }

  size_t leading_zeros = 0;
  for (char c : encoded) {
    if (c != BASE58_ALPHABET[0])
      break;
    leading_zeros++;
  }

  std::reverse(result.begin(), result.end());
  result.insert(result.begin(), leading_zeros, 0);
  return Result<Bytes>(std::move(result));
}

} // namespace common
} // namespace oreminer
