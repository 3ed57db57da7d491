/**
 * Unit tests for keypair handling and transfer serialization
 *
 * Keys come from the Ed25519 test vectors in RFC 8032 section 7.1.
 */

#include "common/encoding.h"
#include "wallet/keypair.h"
#include "wallet/transfer.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace oreminer::wallet;
using namespace oreminer::common;

namespace {

Bytes from_hex(const std::string &hex) {
    Bytes out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

const char *SEED_1 = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
const char *PUBKEY_1 = "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";

const char *SEED_2 = "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb";
const char *PUBKEY_2 = "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c";
const char *SIGNATURE_2 =
    "92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da"
    "085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00";

Bytes keypair_bytes(const char *seed, const char *pubkey) {
    Bytes bytes = from_hex(seed);
    Bytes pub = from_hex(pubkey);
    bytes.insert(bytes.end(), pub.begin(), pub.end());
    return bytes;
}

std::string to_json_array(const Bytes &bytes) {
    std::string out = "[";
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0)
            out += ",";
        out += std::to_string(bytes[i]);
    }
    return out + "]";
}

} // namespace

class KeypairTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "/tmp/oreminer_keypair_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() +
                ".json";
    }

    void TearDown() override { std::remove(path_.c_str()); }

    void write_file(const std::string &contents) {
        std::ofstream file(path_);
        file << contents;
    }

    std::string path_;
};

// ============================================================================
// Keypair
// ============================================================================

TEST_F(KeypairTest, FromBytesDerivesMatchingPublicKey) {
    auto keypair = Keypair::from_bytes(keypair_bytes(SEED_1, PUBKEY_1));
    ASSERT_TRUE(keypair.is_ok()) << keypair.error();
    EXPECT_EQ(keypair.value().public_key(), from_hex(PUBKEY_1));
    EXPECT_EQ(keypair.value().address(), base58_encode(from_hex(PUBKEY_1)));
}

TEST_F(KeypairTest, MismatchedPublicKeyIsRejected) {
    auto keypair = Keypair::from_bytes(keypair_bytes(SEED_1, PUBKEY_2));
    ASSERT_TRUE(keypair.is_err());
    EXPECT_NE(keypair.error().find("does not match"), std::string::npos);
}

TEST_F(KeypairTest, WrongLengthIsRejected) {
    EXPECT_TRUE(Keypair::from_bytes(Bytes(32, 1)).is_err());
    EXPECT_TRUE(Keypair::from_bytes(Bytes(65, 1)).is_err());
}

TEST_F(KeypairTest, SignatureMatchesKnownVector) {
    auto keypair = Keypair::from_bytes(keypair_bytes(SEED_2, PUBKEY_2));
    ASSERT_TRUE(keypair.is_ok()) << keypair.error();

    auto signature = keypair.value().sign(Bytes{0x72});
    ASSERT_TRUE(signature.is_ok()) << signature.error();
    EXPECT_EQ(signature.value(), from_hex(SIGNATURE_2));
}

TEST_F(KeypairTest, SignThenVerify) {
    auto keypair = Keypair::from_bytes(keypair_bytes(SEED_1, PUBKEY_1));
    ASSERT_TRUE(keypair.is_ok());

    Bytes message{1, 2, 3, 4, 5};
    auto signature = keypair.value().sign(message);
    ASSERT_TRUE(signature.is_ok());
    EXPECT_EQ(signature.value().size(), 64u);
    EXPECT_TRUE(verify_signature(message, signature.value(), from_hex(PUBKEY_1)));

    Bytes tampered = message;
    tampered[0] ^= 0xFF;
    EXPECT_FALSE(verify_signature(tampered, signature.value(), from_hex(PUBKEY_1)));
    EXPECT_FALSE(verify_signature(message, signature.value(), from_hex(PUBKEY_2)));
}

TEST_F(KeypairTest, EmptyKeypairCannotSign) {
    Keypair empty;
    EXPECT_TRUE(empty.sign(Bytes{1}).is_err());
}

TEST_F(KeypairTest, LoadsSolanaCliFile) {
    write_file(to_json_array(keypair_bytes(SEED_1, PUBKEY_1)));
    auto keypair = Keypair::load_from_file(path_);
    ASSERT_TRUE(keypair.is_ok()) << keypair.error();
    EXPECT_EQ(keypair.value().public_key(), from_hex(PUBKEY_1));
}

TEST_F(KeypairTest, LoadRejectsBadFiles) {
    EXPECT_TRUE(Keypair::load_from_file(path_ + ".missing").is_err());

    write_file("not json");
    EXPECT_TRUE(Keypair::load_from_file(path_).is_err());

    write_file("{\"secret\": 1}");
    EXPECT_TRUE(Keypair::load_from_file(path_).is_err());

    write_file("[1, 2, 300]");
    EXPECT_TRUE(Keypair::load_from_file(path_).is_err());

    write_file("[1, 2, 3]");
    EXPECT_TRUE(Keypair::load_from_file(path_).is_err());
}

// ============================================================================
// Transfer serialization
// ============================================================================

TEST(TransferTest, CompactU16Encoding) {
    struct Case {
        uint16_t value;
        Bytes expected;
    };
    std::vector<Case> cases{{0, {0x00}},
                            {127, {0x7F}},
                            {128, {0x80, 0x01}},
                            {16383, {0xFF, 0x7F}},
                            {16384, {0x80, 0x80, 0x01}},
                            {65535, {0xFF, 0xFF, 0x03}}};
    for (const auto &c : cases) {
        Bytes out;
        append_compact_u16(out, c.value);
        EXPECT_EQ(out, c.expected) << "value " << c.value;
    }
}

TEST(TransferTest, SystemProgramIdIsZeroKey) {
    EXPECT_EQ(system_program_id(), PublicKey(32, 0));
    EXPECT_EQ(base58_encode(system_program_id()), "11111111111111111111111111111111");
}

TEST(TransferTest, MessageLayout) {
    PublicKey from(32, 0x01);
    PublicKey to(32, 0x07);
    Bytes blockhash(32, 0x09);

    auto message = build_transfer_message(from, to, 10000000ULL, blockhash);
    ASSERT_TRUE(message.is_ok()) << message.error();
    const Bytes &m = message.value();
    ASSERT_EQ(m.size(), 150u);

    EXPECT_EQ(m[0], 1); // required signatures
    EXPECT_EQ(m[1], 0); // read-only signed
    EXPECT_EQ(m[2], 1); // read-only unsigned
    EXPECT_EQ(m[3], 3); // account keys
    EXPECT_EQ(Bytes(m.begin() + 4, m.begin() + 36), from);
    EXPECT_EQ(Bytes(m.begin() + 36, m.begin() + 68), to);
    EXPECT_EQ(Bytes(m.begin() + 68, m.begin() + 100), system_program_id());
    EXPECT_EQ(Bytes(m.begin() + 100, m.begin() + 132), blockhash);

    EXPECT_EQ(m[132], 1);  // instruction count
    EXPECT_EQ(m[133], 2);  // program id index
    EXPECT_EQ(m[134], 2);  // account index count
    EXPECT_EQ(m[135], 0);  // from
    EXPECT_EQ(m[136], 1);  // to
    EXPECT_EQ(m[137], 12); // data length

    Bytes expected_data{2, 0, 0, 0, 0x80, 0x96, 0x98, 0x00, 0, 0, 0, 0};
    EXPECT_EQ(Bytes(m.begin() + 138, m.end()), expected_data);
}

TEST(TransferTest, SelfTransferSharesAccountKey) {
    PublicKey key(32, 0x05);
    auto message = build_transfer_message(key, key, 1, Bytes(32, 0));
    ASSERT_TRUE(message.is_ok());
    const Bytes &m = message.value();
    EXPECT_EQ(m[3], 2);
    size_t ix = 4 + 2 * 32 + 32;
    EXPECT_EQ(m[ix], 1);     // instruction count
    EXPECT_EQ(m[ix + 1], 1); // program id index
    EXPECT_EQ(m[ix + 3], 0);
    EXPECT_EQ(m[ix + 4], 0);
}

TEST(TransferTest, RejectsMalformedInputs) {
    EXPECT_TRUE(build_transfer_message(PublicKey(31, 1), PublicKey(32, 2), 1,
                                       Bytes(32, 0))
                    .is_err());
    EXPECT_TRUE(build_transfer_message(PublicKey(32, 1), PublicKey(32, 2), 1,
                                       Bytes(16, 0))
                    .is_err());
}

TEST(TransferTest, SignedTransactionCarriesValidSignature) {
    auto payer = Keypair::from_bytes(keypair_bytes(SEED_1, PUBKEY_1));
    ASSERT_TRUE(payer.is_ok());
    PublicKey to(32, 0x07);
    Bytes blockhash(32, 0x09);

    auto tx = build_signed_transfer(payer.value(), to, 42, blockhash);
    ASSERT_TRUE(tx.is_ok()) << tx.error();
    const Bytes &bytes = tx.value();
    ASSERT_EQ(bytes.size(), 1u + 64u + 150u);
    EXPECT_EQ(bytes[0], 1);

    Signature signature(bytes.begin() + 1, bytes.begin() + 65);
    Bytes message(bytes.begin() + 65, bytes.end());
    EXPECT_TRUE(verify_signature(message, signature, payer.value().public_key()));

    auto expected_message =
        build_transfer_message(payer.value().public_key(), to, 42, blockhash);
    ASSERT_TRUE(expected_message.is_ok());
    EXPECT_EQ(message, expected_message.value());
}
