#include "common/encoding.h"
#include "round/account_data.h"
#include <gtest/gtest.h>

using namespace oreminer::round;
using namespace oreminer::common;

namespace {

const Bytes PAYLOAD{0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01};

} // namespace

TEST(AccountDataTest, Base64PairIsDecoded) {
    AccountDataField field = Base64Pair{base64_encode(PAYLOAD), "base64"};
    auto result = normalize_account_data(field);
    ASSERT_TRUE(result.is_ok()) << result.detail;
    EXPECT_EQ(result.bytes, PAYLOAD);
}

TEST(AccountDataTest, KeyedWrapperIsDecoded) {
    KeyedWrapper wrapper;
    wrapper.data = Base64Pair{base64_encode(PAYLOAD), "base64"};
    auto result = normalize_account_data(AccountDataField{wrapper});
    ASSERT_TRUE(result.is_ok()) << result.detail;
    EXPECT_EQ(result.bytes, PAYLOAD);
}

TEST(AccountDataTest, RawBytesPassThrough) {
    auto result = normalize_account_data(AccountDataField{RawBytes{PAYLOAD}});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.bytes, PAYLOAD);
}

TEST(AccountDataTest, EmptyRawBytesAreStillBytes) {
    auto result = normalize_account_data(AccountDataField{RawBytes{}});
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.bytes.empty());
}

TEST(AccountDataTest, UnrecognizedShapeIsRejected) {
    auto result =
        normalize_account_data(AccountDataField{Unrecognized{"number"}});
    EXPECT_FALSE(result.is_ok());
    EXPECT_EQ(result.error, NormalizeError::UNRECOGNIZED_ENCODING);
    EXPECT_NE(result.detail.find("unrecognized encoding"), std::string::npos);
    EXPECT_TRUE(result.bytes.empty());
}

TEST(AccountDataTest, WrapperWithoutInnerDataIsRejected) {
    auto result = normalize_account_data(AccountDataField{KeyedWrapper{}});
    EXPECT_EQ(result.error, NormalizeError::MISSING_INNER_DATA);
}

TEST(AccountDataTest, InvalidBase64IsRejected) {
    auto pair = normalize_account_data(AccountDataField{Base64Pair{"@@@@", "base64"}});
    EXPECT_EQ(pair.error, NormalizeError::INVALID_BASE64);

    KeyedWrapper wrapper;
    wrapper.data = Base64Pair{"%%%", "base64"};
    auto wrapped = normalize_account_data(AccountDataField{wrapper});
    EXPECT_EQ(wrapped.error, NormalizeError::INVALID_BASE64);
}

TEST(AccountDataTest, NonBase64EncodingIsRejected) {
    auto result = normalize_account_data(
        AccountDataField{Base64Pair{base64_encode(PAYLOAD), "base58"}});
    EXPECT_EQ(result.error, NormalizeError::UNRECOGNIZED_ENCODING);
    EXPECT_NE(result.detail.find("base58"), std::string::npos);

    KeyedWrapper wrapper;
    wrapper.data = Base64Pair{base64_encode(PAYLOAD), "jsonParsed"};
    EXPECT_EQ(normalize_account_data(AccountDataField{wrapper}).error,
              NormalizeError::UNRECOGNIZED_ENCODING);
}

TEST(AccountDataTest, ErrorNames) {
    EXPECT_EQ(to_string(NormalizeError::UNRECOGNIZED_ENCODING),
              "unrecognized encoding");
    EXPECT_EQ(to_string(NormalizeError::INVALID_BASE64), "invalid base64");
}
