#pragma once

#include "Result.h"
#include "NetworkProfile.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace CodeDrop {

    class MetricsCollector;

    /**
     * @brief Symmetric encryption modes
     *
     * CBC carries no authentication tag; tampering is detected only when it
     * breaks the padding. GCM and ChaCha20Poly1305 are AEAD. Hybrid layers
     * ChaCha20-Poly1305 under AES-GCM with independent sub-keys.
     */
    enum class EncryptionMode {
        CBC,
        GCM,
        ChaCha20Poly1305,
        Hybrid
    };

    const char* toString(EncryptionMode mode);
    std::optional<EncryptionMode> parseEncryptionMode(const std::string& name);
    bool isAuthenticated(EncryptionMode mode);

    /**
     * @brief Key material derived from a transfer code. Never transmitted.
     */
    struct DerivedKey {
        std::vector<uint8_t> key;   // 32 bytes
        std::vector<uint8_t> salt;  // 32 bytes

        void wipe();
    };

    struct VerifyReport {
        bool structurallyValid{false};
        bool authenticated{false};
        std::string detail;
    };

    /**
     * @brief Turns transfer codes into keys and encrypts payloads
     *
     * Every decision is a pure function of its inputs so both peers reach it
     * independently.
     */
    class SecurityEngine {
    public:
        static constexpr size_t MIN_CODE_LENGTH = 8;
        static constexpr int PBKDF2_ITERATIONS = 100000;
        static constexpr uint64_t MOBILE_GCM_THRESHOLD = 10ull * 1024 * 1024;
        static constexpr uint64_t LARGE_PAYLOAD_THRESHOLD = 100ull * 1024 * 1024;
        // EVP takes int lengths; leaves room for nonce, tag and padding of both Hybrid layers
        static constexpr uint64_t MAX_PAYLOAD_SIZE = 0x7FFFFFFFull - 4096;

        explicit SecurityEngine(MetricsCollector* metrics = nullptr,
                                std::optional<EncryptionMode> forcedMode = std::nullopt);

        /**
         * @brief Derive the session key from a transfer code
         *
         * salt = SHA-256(code || context || "codedrop-v1-2024")
         * key  = PBKDF2-HMAC-SHA256(code || context, salt, 100000, 32)
         *
         * @return WeakCode for codes shorter than MIN_CODE_LENGTH, checked
         *         before any derivation work
         */
        Result<DerivedKey> strengthenCode(const std::string& code, const std::string& context) const;

        // HKDF-SHA256 with salt SHA-256(key || "codedrop-v1-salt")
        static std::vector<uint8_t> deriveSubKey(const std::vector<uint8_t>& key);

        /**
         * @brief Mode for a payload; the configured forced mode wins if set
         */
        EncryptionMode selectMode(uint64_t payloadSize, NetworkType networkType) const;

        // The fixed size / network table, without the forced override
        static EncryptionMode tableMode(uint64_t payloadSize, NetworkType networkType);

        // InvalidArgument for payloads above MAX_PAYLOAD_SIZE
        static VoidResult checkPayloadSize(uint64_t size);

        Result<std::vector<uint8_t>> encrypt(const std::vector<uint8_t>& data,
                                             const std::vector<uint8_t>& key,
                                             EncryptionMode mode) const;

        /**
         * @return IntegrityError when authentication or padding fails
         */
        Result<std::vector<uint8_t>> decrypt(const std::vector<uint8_t>& ciphertext,
                                             const std::vector<uint8_t>& key,
                                             EncryptionMode mode) const;

        /**
         * @brief Structural check only; for AEAD modes a successful decrypt is the proof
         */
        static VerifyReport verifyIntegrity(const std::vector<uint8_t>& ciphertext, EncryptionMode mode);

        static std::string digestHex(const std::vector<uint8_t>& data);

        // Constant-time comparison of SHA-256(data) against a hex digest
        static bool verifyDigest(const std::vector<uint8_t>& data, const std::string& hexDigest);

        std::optional<EncryptionMode> forcedMode() const { return forcedMode_; }

    private:
        std::vector<uint8_t> encryptLayer(const std::vector<uint8_t>& data,
                                          const std::vector<uint8_t>& subKey,
                                          EncryptionMode mode) const;
        std::optional<std::vector<uint8_t>> decryptLayer(const std::vector<uint8_t>& ciphertext,
                                                         const std::vector<uint8_t>& subKey,
                                                         EncryptionMode mode) const;

        MetricsCollector* metrics_;
        std::optional<EncryptionMode> forcedMode_;
    };

}
