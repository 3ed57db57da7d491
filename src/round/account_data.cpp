#include "round/account_data.h"
#include "common/encoding.h"

namespace oreminer {
namespace round {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

NormalizeResult reject(NormalizeError error, std::string detail) {
  NormalizeResult result;
  result.error = error;
  result.detail = std::move(detail);
  return result;
}

NormalizeResult decode_pair(const Base64Pair &pair) {
  if (pair.encoding != "base64") {
    return reject(NormalizeError::UNRECOGNIZED_ENCODING,
                  "unsupported encoding: " + pair.encoding);
  }
  auto decoded = base64_decode(pair.encoded);
  if (decoded.is_err()) {
    return reject(NormalizeError::INVALID_BASE64, decoded.error());
  }
  NormalizeResult result;
  result.bytes = std::move(decoded).value();
  return result;
}

} // namespace

NormalizeResult normalize_account_data(const AccountDataField &field) {
  return std::visit(
      overloaded{
          [](const Base64Pair &pair) { return decode_pair(pair); },
          [](const KeyedWrapper &wrapper) {
            if (!wrapper.data) {
              return reject(NormalizeError::MISSING_INNER_DATA,
                            "keyed wrapper has no base64 data member");
            }
            return decode_pair(*wrapper.data);
          },
          [](const RawBytes &raw) {
            NormalizeResult result;
            result.bytes = raw.bytes;
            return result;
          },
          [](const Unrecognized &unknown) {
            return reject(NormalizeError::UNRECOGNIZED_ENCODING,
                          "unrecognized encoding: " + unknown.description);
          }},
      field);
}

std::string to_string(NormalizeError error) {
  switch (error) {
  case NormalizeError::NONE:
    return "none";
  case NormalizeError::UNRECOGNIZED_ENCODING:
    return "unrecognized encoding";
  case NormalizeError::MISSING_INNER_DATA:
    return "missing inner data";
  case NormalizeError::INVALID_BASE64:
    return "invalid base64";
  default:
    return "unknown";
  }
}

} // namespace round
} // namespace oreminer
