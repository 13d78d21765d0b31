#include <gtest/gtest.h>
#include <pokewire/crypto.hpp>
#include <pokewire/error.hpp>
#include <pokewire/messages.hpp>
#include <memory>
#include <set>
#include <string>

using namespace pokewire;

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        key_ = std::make_unique<EcKeyPair>(EcKeyPair::Generate());
    }

    std::unique_ptr<EcKeyPair> key_;
};

TEST_F(CryptoTest, PublicKeyIsUncompressedPoint) {
    Bytes public_key = key_->PublicKeySec1();
    ASSERT_EQ(public_key.size(), 65u);
    EXPECT_EQ(public_key[0], 0x04);
    EXPECT_TRUE(IsValidPublicKey(public_key));
}

TEST_F(CryptoTest, SignAndVerify) {
    Bytes public_key = key_->PublicKeySec1();
    Bytes signature = key_->Sign(public_key);

    // DER SEQUENCE
    ASSERT_FALSE(signature.empty());
    EXPECT_EQ(signature[0], 0x30);
    EXPECT_LE(signature.size(), 72u);

    EXPECT_TRUE(VerifySignature(public_key, public_key, signature));
}

TEST_F(CryptoTest, TamperedDataFailsVerification) {
    Bytes public_key = key_->PublicKeySec1();
    Bytes data = {0x01, 0x02, 0x03};
    Bytes signature = key_->Sign(data);

    data[1] ^= 0xFF;
    EXPECT_FALSE(VerifySignature(public_key, data, signature));
}

TEST_F(CryptoTest, OtherKeyFailsVerification) {
    EcKeyPair other = EcKeyPair::Generate();
    Bytes data = {0x0A, 0x0B};
    Bytes signature = other.Sign(data);

    EXPECT_FALSE(VerifySignature(key_->PublicKeySec1(), data, signature));
    EXPECT_TRUE(VerifySignature(other.PublicKeySec1(), data, signature));
}

TEST_F(CryptoTest, MalformedInputs) {
    Bytes data = {0x01};
    Bytes signature = key_->Sign(data);

    EXPECT_FALSE(VerifySignature(Bytes{}, data, signature));
    EXPECT_FALSE(VerifySignature(Bytes(65, 0x04), data, signature));
    EXPECT_FALSE(VerifySignature(key_->PublicKeySec1(), data, Bytes{0x30, 0x00}));

    EXPECT_FALSE(IsValidPublicKey(Bytes{}));
    EXPECT_FALSE(IsValidPublicKey(Bytes{0x04, 0x01, 0x02}));
    EXPECT_FALSE(IsValidPublicKey(Bytes(65, 0x04)));
}

TEST_F(CryptoTest, KeysFitServerHello) {
    Bytes public_key = key_->PublicKeySec1();
    ServerHello hello = ServerHello::Create(public_key, key_->Sign(public_key), ChecksumConfig::None());

    ServerHello decoded = ServerHello::Decode(hello.Encode());
    EXPECT_TRUE(VerifySignature(decoded.public_key, decoded.public_key, decoded.signature));
}

TEST_F(CryptoTest, PeerKeyChecksAcceptGenuineKeys) {
    Bytes public_key = key_->PublicKeySec1();
    Bytes signature = key_->Sign(public_key);

    EXPECT_NO_THROW(RequireValidPublicKey(public_key, "server"));
    EXPECT_NO_THROW(RequireValidSignature(public_key, public_key, signature));
}

TEST_F(CryptoTest, PeerKeyChecksRejectForgedKeys) {
    try {
        RequireValidPublicKey(Bytes(65, 0x05), "client");
        FAIL() << "Expected CryptoError";
    } catch (const CryptoError& e) {
        EXPECT_NE(std::string(e.what()).find("client"), std::string::npos);
    }

    // Self-signature made by a different key
    EcKeyPair impostor = EcKeyPair::Generate();
    Bytes public_key = key_->PublicKeySec1();
    EXPECT_THROW(RequireValidSignature(public_key, public_key, impostor.Sign(public_key)), CryptoError);
    EXPECT_THROW(RequireValidSignature(public_key, public_key, Bytes{0x30, 0x44, 0x02, 0x20}), CryptoError);
}

TEST(RandomTest, ValuesVary) {
    std::set<int64_t> values;
    for (int i = 0; i < 16; ++i) {
        values.insert(RandomInt64());
    }
    EXPECT_GT(values.size(), 1u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
