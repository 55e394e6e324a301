#include "SecurityEngine.h"
#include "Crypto.h"
#include "MetricsCollector.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace CodeDrop {

    namespace {
        const char* const kComponent = "SecurityEngine";

        const std::string kCodeSaltLabel = "codedrop-v1-2024";
        const std::string kSubKeySaltLabel = "codedrop-v1-salt";
        const std::string kSubKeyInfo = "codedrop-v1-secure-key-derivation";

        std::vector<uint8_t> concat(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
            std::vector<uint8_t> out;
            out.reserve(a.size() + b.size());
            out.insert(out.end(), a.begin(), a.end());
            out.insert(out.end(), b.begin(), b.end());
            return out;
        }
    }

    const char* toString(EncryptionMode mode) {
        switch (mode) {
            case EncryptionMode::CBC: return "AES-256-CBC";
            case EncryptionMode::GCM: return "AES-256-GCM";
            case EncryptionMode::ChaCha20Poly1305: return "ChaCha20-Poly1305";
            case EncryptionMode::Hybrid: return "Hybrid";
        }
        return "Unknown";
    }

    std::optional<EncryptionMode> parseEncryptionMode(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "aes-256-cbc" || lower == "cbc") return EncryptionMode::CBC;
        if (lower == "aes-256-gcm" || lower == "gcm") return EncryptionMode::GCM;
        if (lower == "chacha20-poly1305" || lower == "chacha20") return EncryptionMode::ChaCha20Poly1305;
        if (lower == "hybrid") return EncryptionMode::Hybrid;
        return std::nullopt;
    }

    bool isAuthenticated(EncryptionMode mode) {
        return mode != EncryptionMode::CBC;
    }

    void DerivedKey::wipe() {
        Crypto::secureClear(key);
        Crypto::secureClear(salt);
    }

    SecurityEngine::SecurityEngine(MetricsCollector* metrics, std::optional<EncryptionMode> forcedMode)
        : metrics_(metrics)
        , forcedMode_(forcedMode)
    {
        if (forcedMode_) {
            Logger::instance().log(LogLevel::INFO,
                std::string("Encryption mode forced to ") + toString(*forcedMode_), kComponent);
        }
    }

    Result<DerivedKey> SecurityEngine::strengthenCode(const std::string& code, const std::string& context) const {
        if (code.size() < MIN_CODE_LENGTH) {
            if (metrics_) metrics_->incrementWeakCodesRejected();
            return Error(ErrorCode::WeakCode,
                         "Transfer code must be at least " + std::to_string(MIN_CODE_LENGTH) + " characters",
                         kComponent);
        }

        SCOPED_TIMER_WARN("Key derivation", kComponent, std::chrono::milliseconds(2000));

        try {
            DerivedKey derived;
            derived.salt = Crypto::sha256(code + context + kCodeSaltLabel);
            derived.key = Crypto::pbkdf2Sha256(code + context, derived.salt, PBKDF2_ITERATIONS, Crypto::KEY_SIZE);
            if (metrics_) metrics_->incrementKeysDerived();
            return derived;
        } catch (const std::exception& e) {
            if (metrics_) metrics_->incrementEncryptionErrors();
            return Error(ErrorCode::CryptoFailure, std::string("Key derivation failed: ") + e.what(), kComponent);
        }
    }

    std::vector<uint8_t> SecurityEngine::deriveSubKey(const std::vector<uint8_t>& key) {
        auto salt = Crypto::sha256(concat(key, std::vector<uint8_t>(kSubKeySaltLabel.begin(), kSubKeySaltLabel.end())));
        std::vector<uint8_t> info(kSubKeyInfo.begin(), kSubKeyInfo.end());
        return Crypto::hkdfSha256(key, salt, info, Crypto::KEY_SIZE);
    }

    EncryptionMode SecurityEngine::selectMode(uint64_t payloadSize, NetworkType networkType) const {
        EncryptionMode mode = forcedMode_ ? *forcedMode_ : tableMode(payloadSize, networkType);
        if (mode == EncryptionMode::CBC) {
            Logger::instance().log(LogLevel::WARN,
                "AES-256-CBC selected: confidentiality only, no authentication tag", kComponent);
        }
        LOG_DEBUG_COMP_IF(std::string("Selected ") + toString(mode) + " for " + std::to_string(payloadSize) +
                          " bytes on " + toString(networkType) + " network", kComponent);
        return mode;
    }

    EncryptionMode SecurityEngine::tableMode(uint64_t payloadSize, NetworkType networkType) {
        switch (networkType) {
            case NetworkType::Restrictive:
            case NetworkType::Corporate:
                return EncryptionMode::GCM;
            case NetworkType::Mobile:
                return payloadSize > MOBILE_GCM_THRESHOLD ? EncryptionMode::GCM : EncryptionMode::ChaCha20Poly1305;
            case NetworkType::Open:
                break;
        }
        return payloadSize > LARGE_PAYLOAD_THRESHOLD ? EncryptionMode::GCM : EncryptionMode::ChaCha20Poly1305;
    }

    VoidResult SecurityEngine::checkPayloadSize(uint64_t size) {
        if (size > MAX_PAYLOAD_SIZE) {
            return Error(ErrorCode::InvalidArgument,
                         "Payload of " + std::to_string(size) + " bytes exceeds the " +
                         std::to_string(MAX_PAYLOAD_SIZE) + " byte limit",
                         kComponent);
        }
        return Ok();
    }

    // Output layout per mode: CBC iv|ct, AEAD nonce|ct|tag
    std::vector<uint8_t> SecurityEngine::encryptLayer(const std::vector<uint8_t>& data,
                                                      const std::vector<uint8_t>& subKey,
                                                      EncryptionMode mode) const {
        std::vector<uint8_t> prefix;
        std::vector<uint8_t> body;
        switch (mode) {
            case EncryptionMode::CBC:
                prefix = Crypto::generateIV();
                body = Crypto::encryptCbc(data, subKey, prefix);
                break;
            case EncryptionMode::GCM:
                prefix = Crypto::generateNonce();
                body = Crypto::encryptGcm(data, subKey, prefix);
                break;
            case EncryptionMode::ChaCha20Poly1305:
                prefix = Crypto::generateNonce();
                body = Crypto::encryptChaCha20(data, subKey, prefix);
                break;
            case EncryptionMode::Hybrid:
                throw std::logic_error("Hybrid is not a single layer");
        }
        return concat(prefix, body);
    }

    std::optional<std::vector<uint8_t>> SecurityEngine::decryptLayer(const std::vector<uint8_t>& ciphertext,
                                                                     const std::vector<uint8_t>& subKey,
                                                                     EncryptionMode mode) const {
        if (!verifyIntegrity(ciphertext, mode).structurallyValid) {
            return std::nullopt;
        }

        const size_t prefixLen = mode == EncryptionMode::CBC ? Crypto::IV_SIZE : Crypto::NONCE_SIZE;
        std::vector<uint8_t> prefix(ciphertext.begin(), ciphertext.begin() + static_cast<std::ptrdiff_t>(prefixLen));
        std::vector<uint8_t> body(ciphertext.begin() + static_cast<std::ptrdiff_t>(prefixLen), ciphertext.end());

        switch (mode) {
            case EncryptionMode::CBC:
                return Crypto::decryptCbc(body, subKey, prefix);
            case EncryptionMode::GCM:
                return Crypto::decryptGcm(body, subKey, prefix);
            case EncryptionMode::ChaCha20Poly1305:
                return Crypto::decryptChaCha20(body, subKey, prefix);
            case EncryptionMode::Hybrid:
                break;
        }
        throw std::logic_error("Hybrid is not a single layer");
    }

    Result<std::vector<uint8_t>> SecurityEngine::encrypt(const std::vector<uint8_t>& data,
                                                         const std::vector<uint8_t>& key,
                                                         EncryptionMode mode) const {
        if (key.size() != Crypto::KEY_SIZE) {
            return Error(ErrorCode::InvalidArgument, "Key must be 32 bytes", kComponent);
        }
        auto sized = checkPayloadSize(data.size());
        if (sized.isError()) {
            return sized.error();
        }

        try {
            if (mode == EncryptionMode::Hybrid) {
                auto key1 = deriveSubKey(key);
                auto key2 = deriveSubKey(key1);
                auto inner = encryptLayer(data, key1, EncryptionMode::ChaCha20Poly1305);
                auto outer = encryptLayer(inner, key2, EncryptionMode::GCM);
                Crypto::secureClear(key1);
                Crypto::secureClear(key2);
                return outer;
            }

            auto subKey = deriveSubKey(key);
            auto out = encryptLayer(data, subKey, mode);
            Crypto::secureClear(subKey);
            return out;
        } catch (const std::exception& e) {
            if (metrics_) metrics_->incrementEncryptionErrors();
            Logger::instance().log(LogLevel::ERROR,
                std::string(toString(mode)) + " encryption failed: " + e.what(), kComponent);
            return Error(ErrorCode::CryptoFailure, std::string("Encryption failed: ") + e.what(), kComponent);
        }
    }

    Result<std::vector<uint8_t>> SecurityEngine::decrypt(const std::vector<uint8_t>& ciphertext,
                                                         const std::vector<uint8_t>& key,
                                                         EncryptionMode mode) const {
        if (key.size() != Crypto::KEY_SIZE) {
            return Error(ErrorCode::InvalidArgument, "Key must be 32 bytes", kComponent);
        }

        std::optional<std::vector<uint8_t>> plaintext;
        try {
            if (mode == EncryptionMode::Hybrid) {
                auto key1 = deriveSubKey(key);
                auto key2 = deriveSubKey(key1);
                auto inner = decryptLayer(ciphertext, key2, EncryptionMode::GCM);
                if (inner) {
                    plaintext = decryptLayer(*inner, key1, EncryptionMode::ChaCha20Poly1305);
                }
                Crypto::secureClear(key1);
                Crypto::secureClear(key2);
            } else {
                auto subKey = deriveSubKey(key);
                plaintext = decryptLayer(ciphertext, subKey, mode);
                Crypto::secureClear(subKey);
            }
        } catch (const std::exception& e) {
            if (metrics_) metrics_->incrementEncryptionErrors();
            Logger::instance().log(LogLevel::ERROR,
                std::string(toString(mode)) + " decryption failed: " + e.what(), kComponent);
            return Error(ErrorCode::CryptoFailure, std::string("Decryption failed: ") + e.what(), kComponent);
        }

        if (!plaintext) {
            if (metrics_) metrics_->incrementIntegrityFailures();
            Logger::instance().log(LogLevel::WARN,
                std::string(toString(mode)) + " integrity check failed", kComponent);
            return Error(ErrorCode::IntegrityError,
                         isAuthenticated(mode) ? "Ciphertext failed authentication"
                                               : "Ciphertext padding is malformed",
                         kComponent);
        }
        return std::move(*plaintext);
    }

    VerifyReport SecurityEngine::verifyIntegrity(const std::vector<uint8_t>& ciphertext, EncryptionMode mode) {
        VerifyReport report;
        report.authenticated = isAuthenticated(mode);

        switch (mode) {
            case EncryptionMode::CBC: {
                const size_t body = ciphertext.size() >= Crypto::IV_SIZE ? ciphertext.size() - Crypto::IV_SIZE : 0;
                report.structurallyValid = ciphertext.size() >= Crypto::IV_SIZE + Crypto::BLOCK_SIZE &&
                                           body % Crypto::BLOCK_SIZE == 0;
                report.detail = report.structurallyValid
                    ? "block aligned; CBC cannot prove authenticity"
                    : "ciphertext is not IV plus whole blocks";
                break;
            }
            case EncryptionMode::GCM:
            case EncryptionMode::ChaCha20Poly1305:
                report.structurallyValid = ciphertext.size() >= Crypto::NONCE_SIZE + Crypto::TAG_SIZE;
                report.detail = report.structurallyValid
                    ? "length ok; successful decryption proves integrity"
                    : "shorter than nonce plus tag";
                break;
            case EncryptionMode::Hybrid:
                report.structurallyValid = ciphertext.size() >= 2 * (Crypto::NONCE_SIZE + Crypto::TAG_SIZE);
                report.detail = report.structurallyValid
                    ? "length ok; successful decryption of both layers proves integrity"
                    : "shorter than two AEAD envelopes";
                break;
        }
        return report;
    }

    std::string SecurityEngine::digestHex(const std::vector<uint8_t>& data) {
        return Crypto::toHex(Crypto::sha256(data));
    }

    bool SecurityEngine::verifyDigest(const std::vector<uint8_t>& data, const std::string& hexDigest) {
        std::vector<uint8_t> expected;
        try {
            expected = Crypto::fromHex(hexDigest);
        } catch (const std::exception&) {
            return false;
        }
        return Crypto::constantTimeCompare(Crypto::sha256(data), expected);
    }

}
