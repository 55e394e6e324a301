/**
 * @file test_security_engine.cpp
 * @brief Key derivation, mode table and per-mode encryption
 */

#include <gtest/gtest.h>

#include "Crypto.h"
#include "MetricsCollector.h"
#include "SecurityEngine.h"

#include <string>
#include <vector>

using namespace CodeDrop;

class SecurityEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto derived = engine_.strengthenCode("delta-lima-tango-4821", "encryption");
        ASSERT_TRUE(derived.isOk());
        key_ = derived.value().key;
    }

    std::vector<uint8_t> sample(size_t n) const {
        std::vector<uint8_t> data(n);
        for (size_t i = 0; i < n; ++i) {
            data[i] = static_cast<uint8_t>(i * 31 + 7);
        }
        return data;
    }

    MetricsCollector metrics_;
    SecurityEngine engine_{&metrics_};
    std::vector<uint8_t> key_;
};

TEST_F(SecurityEngineTest, DerivationIsDeterministic) {
    auto a = engine_.strengthenCode("delta-lima-tango-4821", "encryption");
    auto b = engine_.strengthenCode("delta-lima-tango-4821", "encryption");
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());
    EXPECT_EQ(a.value().key, b.value().key);
    EXPECT_EQ(a.value().salt, b.value().salt);
    EXPECT_EQ(a.value().key.size(), 32u);
    EXPECT_EQ(a.value().salt.size(), 32u);
}

TEST_F(SecurityEngineTest, DerivationMatchesDocumentedConstruction) {
    const std::string code = "delta-lima-tango-4821";
    const std::string context = "encryption";
    auto salt = Crypto::sha256(code + context + "codedrop-v1-2024");
    auto key = Crypto::pbkdf2Sha256(code + context, salt, SecurityEngine::PBKDF2_ITERATIONS, 32);

    auto derived = engine_.strengthenCode(code, context);
    ASSERT_TRUE(derived.isOk());
    EXPECT_EQ(derived.value().salt, salt);
    EXPECT_EQ(derived.value().key, key);
}

TEST_F(SecurityEngineTest, ContextSeparatesKeys) {
    auto a = engine_.strengthenCode("delta-lima-tango-4821", "encryption");
    auto b = engine_.strengthenCode("delta-lima-tango-4821", "signing");
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());
    EXPECT_NE(a.value().key, b.value().key);
}

TEST_F(SecurityEngineTest, ShortCodeRejectedWithoutWork) {
    const auto before = metrics_.snapshot().security;
    auto result = engine_.strengthenCode("abc-12", "encryption");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::WeakCode);

    const auto after = metrics_.snapshot().security;
    EXPECT_EQ(after.weakCodesRejected, before.weakCodesRejected + 1);
    EXPECT_EQ(after.keysDerived, before.keysDerived);
}

TEST_F(SecurityEngineTest, EightCharacterCodeAccepted) {
    EXPECT_TRUE(engine_.strengthenCode("abcd-123", "encryption").isOk());
}

TEST_F(SecurityEngineTest, ModeTable) {
    const uint64_t MiB = 1024 * 1024;
    EXPECT_EQ(SecurityEngine::tableMode(1 * MiB, NetworkType::Open), EncryptionMode::ChaCha20Poly1305);
    EXPECT_EQ(SecurityEngine::tableMode(50 * MiB, NetworkType::Open), EncryptionMode::ChaCha20Poly1305);
    EXPECT_EQ(SecurityEngine::tableMode(150 * MiB, NetworkType::Open), EncryptionMode::GCM);

    EXPECT_EQ(SecurityEngine::tableMode(1 * MiB, NetworkType::Mobile), EncryptionMode::ChaCha20Poly1305);
    EXPECT_EQ(SecurityEngine::tableMode(10 * MiB, NetworkType::Mobile), EncryptionMode::ChaCha20Poly1305);
    EXPECT_EQ(SecurityEngine::tableMode(10 * MiB + 1, NetworkType::Mobile), EncryptionMode::GCM);

    EXPECT_EQ(SecurityEngine::tableMode(0, NetworkType::Restrictive), EncryptionMode::GCM);
    EXPECT_EQ(SecurityEngine::tableMode(0, NetworkType::Corporate), EncryptionMode::GCM);
}

TEST_F(SecurityEngineTest, InstitutionalLargePayloadAlwaysGcm) {
    auto institutional = parseNetworkType("institutional");
    ASSERT_TRUE(institutional.has_value());
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(engine_.selectMode(150ull * 1024 * 1024, *institutional), EncryptionMode::GCM);
    }
}

TEST_F(SecurityEngineTest, ForcedModeOverridesTable) {
    SecurityEngine forced(nullptr, EncryptionMode::Hybrid);
    EXPECT_EQ(forced.selectMode(10, NetworkType::Open), EncryptionMode::Hybrid);
    EXPECT_EQ(forced.forcedMode(), EncryptionMode::Hybrid);
}

TEST_F(SecurityEngineTest, RoundTripEveryModeIncludingEmpty) {
    const EncryptionMode modes[] = {EncryptionMode::CBC, EncryptionMode::GCM,
                                    EncryptionMode::ChaCha20Poly1305, EncryptionMode::Hybrid};
    for (auto mode : modes) {
        for (size_t size : {size_t(0), size_t(1), size_t(16), size_t(4097)}) {
            auto data = sample(size);
            auto ct = engine_.encrypt(data, key_, mode);
            ASSERT_TRUE(ct.isOk()) << toString(mode);
            EXPECT_TRUE(SecurityEngine::verifyIntegrity(ct.value(), mode).structurallyValid) << toString(mode);

            auto pt = engine_.decrypt(ct.value(), key_, mode);
            ASSERT_TRUE(pt.isOk()) << toString(mode) << " size " << size;
            EXPECT_EQ(pt.value(), data);
        }
    }
}

TEST_F(SecurityEngineTest, CiphertextLayouts) {
    auto data = sample(100);
    EXPECT_EQ(engine_.encrypt(data, key_, EncryptionMode::GCM).value().size(), 12u + 100u + 16u);
    EXPECT_EQ(engine_.encrypt(data, key_, EncryptionMode::ChaCha20Poly1305).value().size(), 12u + 100u + 16u);
    EXPECT_EQ(engine_.encrypt(data, key_, EncryptionMode::CBC).value().size(), 16u + 112u);
    EXPECT_EQ(engine_.encrypt(data, key_, EncryptionMode::Hybrid).value().size(), 2 * 28u + 100u);
}

TEST_F(SecurityEngineTest, AnyBitFlipFailsAuthenticatedModes) {
    auto data = sample(64);
    for (auto mode : {EncryptionMode::GCM, EncryptionMode::ChaCha20Poly1305, EncryptionMode::Hybrid}) {
        auto ct = engine_.encrypt(data, key_, mode).value();
        for (size_t byte = 0; byte < ct.size(); byte += 7) {
            auto tampered = ct;
            tampered[byte] ^= static_cast<uint8_t>(1u << (byte % 8));
            auto result = engine_.decrypt(tampered, key_, mode);
            ASSERT_TRUE(result.isError()) << toString(mode) << " byte " << byte;
            EXPECT_EQ(result.error().code, ErrorCode::IntegrityError);
        }
    }
}

TEST_F(SecurityEngineTest, CbcIsNotAuthenticated) {
    auto ct = engine_.encrypt(sample(48), key_, EncryptionMode::CBC).value();
    auto report = SecurityEngine::verifyIntegrity(ct, EncryptionMode::CBC);
    EXPECT_TRUE(report.structurallyValid);
    EXPECT_FALSE(report.authenticated);
    EXPECT_FALSE(isAuthenticated(EncryptionMode::CBC));

    // Flipping a bit in the first block only garbles output, padding survives
    auto tampered = ct;
    tampered[Crypto::IV_SIZE] ^= 0x01;
    auto result = engine_.decrypt(tampered, key_, EncryptionMode::CBC);
    ASSERT_TRUE(result.isOk());
    EXPECT_NE(result.value(), sample(48));
}

TEST_F(SecurityEngineTest, WrongKeyFails) {
    auto other = engine_.strengthenCode("other-code-9999", "encryption").value().key;
    auto ct = engine_.encrypt(sample(32), key_, EncryptionMode::GCM).value();
    auto result = engine_.decrypt(ct, other, EncryptionMode::GCM);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::IntegrityError);
}

TEST_F(SecurityEngineTest, TruncatedCiphertextIsIntegrityError) {
    std::vector<uint8_t> tiny(10, 0);
    auto result = engine_.decrypt(tiny, key_, EncryptionMode::ChaCha20Poly1305);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::IntegrityError);
    EXPECT_FALSE(SecurityEngine::verifyIntegrity(tiny, EncryptionMode::GCM).structurallyValid);
}

TEST_F(SecurityEngineTest, BadKeyLengthIsInvalidArgument) {
    auto result = engine_.encrypt(sample(4), std::vector<uint8_t>(16, 1), EncryptionMode::GCM);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SecurityEngineTest, PayloadsBeyondEvpLimitAreInvalidArgument) {
    EXPECT_TRUE(SecurityEngine::checkPayloadSize(0).isOk());
    EXPECT_TRUE(SecurityEngine::checkPayloadSize(SecurityEngine::MAX_PAYLOAD_SIZE).isOk());

    auto justOver = SecurityEngine::checkPayloadSize(SecurityEngine::MAX_PAYLOAD_SIZE + 1);
    ASSERT_TRUE(justOver.isError());
    EXPECT_EQ(justOver.error().code, ErrorCode::InvalidArgument);

    // 2^32 + 1 would wrap to 1 in an int cast
    auto wrapping = SecurityEngine::checkPayloadSize((1ull << 32) + 1);
    ASSERT_TRUE(wrapping.isError());
    EXPECT_EQ(wrapping.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(wrapping.error().message.find("4294967297"), std::string::npos);

    // Overhead of every layer still fits in an EVP int length
    EXPECT_LE(SecurityEngine::MAX_PAYLOAD_SIZE + 2 * (Crypto::NONCE_SIZE + Crypto::TAG_SIZE) + Crypto::IV_SIZE +
                  Crypto::BLOCK_SIZE,
              0x7FFFFFFFull);
}

TEST_F(SecurityEngineTest, SubKeysAreIndependent) {
    auto k1 = SecurityEngine::deriveSubKey(key_);
    auto k2 = SecurityEngine::deriveSubKey(k1);
    EXPECT_EQ(k1.size(), 32u);
    EXPECT_NE(k1, key_);
    EXPECT_NE(k1, k2);
    EXPECT_EQ(SecurityEngine::deriveSubKey(key_), k1);
}

TEST_F(SecurityEngineTest, DigestVerification) {
    auto data = sample(200);
    auto digest = SecurityEngine::digestHex(data);
    EXPECT_EQ(digest.size(), 64u);
    EXPECT_TRUE(SecurityEngine::verifyDigest(data, digest));
    data[3] ^= 1;
    EXPECT_FALSE(SecurityEngine::verifyDigest(data, digest));
    EXPECT_FALSE(SecurityEngine::verifyDigest(data, "not-hex"));
}

TEST(EncryptionModeTest, NamesRoundTrip) {
    for (auto mode : {EncryptionMode::CBC, EncryptionMode::GCM,
                      EncryptionMode::ChaCha20Poly1305, EncryptionMode::Hybrid}) {
        EXPECT_EQ(parseEncryptionMode(toString(mode)), mode);
    }
    EXPECT_EQ(parseEncryptionMode("chacha20"), EncryptionMode::ChaCha20Poly1305);
    EXPECT_FALSE(parseEncryptionMode("rot13").has_value());
}
