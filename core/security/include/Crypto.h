#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace CodeDrop {

/**
 * @brief Cryptographic primitives backed by OpenSSL EVP
 *
 * Supports:
 * - AES-256-CBC with PKCS7 padding (confidentiality only)
 * - AES-256-GCM and ChaCha20-Poly1305 (AEAD)
 * - PBKDF2-HMAC-SHA256 and HKDF-SHA256 for key derivation
 *
 * Invalid parameters and OpenSSL failures throw std::runtime_error.
 * Authentication and padding failures return std::nullopt.
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;       // 256 bits
    static constexpr size_t IV_SIZE = 16;        // 128 bits for CBC
    static constexpr size_t NONCE_SIZE = 12;     // 96 bits for GCM / ChaCha20
    static constexpr size_t TAG_SIZE = 16;       // 128 bits auth tag
    static constexpr size_t BLOCK_SIZE = 16;     // AES block size
    static constexpr size_t SHA256_SIZE = 32;

    /**
     * @brief Cryptographically secure random bytes (RAND_bytes)
     */
    static std::vector<uint8_t> randomBytes(size_t count);

    static std::vector<uint8_t> generateIV() { return randomBytes(IV_SIZE); }
    static std::vector<uint8_t> generateNonce() { return randomBytes(NONCE_SIZE); }

    /**
     * @brief Encrypt using AES-256-CBC
     * @return Ciphertext with PKCS7 padding (no IV prefix)
     */
    static std::vector<uint8_t> encryptCbc(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& iv
    );

    /**
     * @brief Decrypt AES-256-CBC
     * @return Plaintext, or nullopt when the padding is malformed
     */
    static std::optional<std::vector<uint8_t>> decryptCbc(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& iv
    );

    /**
     * @brief Encrypt using AES-256-GCM
     * @return Ciphertext with appended 16-byte auth tag
     */
    static std::vector<uint8_t> encryptGcm(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    /**
     * @brief Decrypt AES-256-GCM, verifying the tag before returning
     * @return Plaintext, or nullopt on authentication failure
     */
    static std::optional<std::vector<uint8_t>> decryptGcm(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    static std::vector<uint8_t> encryptChaCha20(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    static std::optional<std::vector<uint8_t>> decryptChaCha20(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    /**
     * @brief PBKDF2-HMAC-SHA256
     */
    static std::vector<uint8_t> pbkdf2Sha256(
        const std::string& password,
        const std::vector<uint8_t>& salt,
        int iterations,
        size_t length
    );

    /**
     * @brief HKDF-SHA256 (extract and expand, RFC 5869)
     */
    static std::vector<uint8_t> hkdfSha256(
        const std::vector<uint8_t>& ikm,
        const std::vector<uint8_t>& salt,
        const std::vector<uint8_t>& info,
        size_t length
    );

    static std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> sha256(const std::string& data);

    /**
     * @brief Constant-time comparison to prevent timing attacks
     */
    static bool constantTimeCompare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    /**
     * @brief Overwrite key material in place (OPENSSL_cleanse)
     */
    static void secureClear(std::vector<uint8_t>& data);

    static std::string toHex(const std::vector<uint8_t>& data);

    /**
     * @throws std::runtime_error on odd length or non-hex characters
     */
    static std::vector<uint8_t> fromHex(const std::string& hex);

private:
    // PKCS7 padding
    static std::vector<uint8_t> addPadding(const std::vector<uint8_t>& data);
    static std::optional<std::vector<uint8_t>> removePadding(const std::vector<uint8_t>& data);
};

} // namespace CodeDrop
