#include "Crypto.h"
#include "Logger.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/kdf.h>
#include <openssl/crypto.h>  // For CRYPTO_memcmp, OPENSSL_cleanse
#include <memory>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <limits>

namespace CodeDrop {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx newCipherCtx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }
    return ctx;
}

// EVP length parameters are int
int evpLength(size_t size) {
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::length_error("Buffer of " + std::to_string(size) + " bytes is too large for EVP");
    }
    return static_cast<int>(size);
}

void checkKeyAndNonce(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce,
                      const char* cipherName) {
    auto& logger = Logger::instance();
    if (key.size() != Crypto::KEY_SIZE) {
        logger.log(LogLevel::ERROR, std::string("Invalid key size for ") + cipherName, "Crypto");
        throw std::runtime_error("Invalid key size");
    }
    if (nonce.size() != Crypto::NONCE_SIZE) {
        logger.log(LogLevel::ERROR, std::string("Invalid nonce size for ") + cipherName, "Crypto");
        throw std::runtime_error("Invalid nonce size (must be 12 bytes)");
    }
}

// Output layout: ciphertext | tag
std::vector<uint8_t> aeadEncrypt(
    const EVP_CIPHER* cipher,
    const char* cipherName,
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    checkKeyAndNonce(key, nonce, cipherName);

    auto ctx = newCipherCtx();

    if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error(std::string("Failed to initialize ") + cipherName);
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(Crypto::NONCE_SIZE), nullptr) != 1) {
        throw std::runtime_error("Failed to set AEAD nonce length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set AEAD key/nonce");
    }

    int len = 0;

    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), evpLength(aad.size())) != 1) {
            throw std::runtime_error("Failed to add AAD");
        }
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + Crypto::TAG_SIZE);
    int ciphertextLen = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                              plaintext.data(), evpLength(plaintext.size())) != 1) {
            throw std::runtime_error(std::string(cipherName) + " encryption failed");
        }
        ciphertextLen = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertextLen, &len) != 1) {
        throw std::runtime_error(std::string(cipherName) + " finalization failed");
    }
    ciphertextLen += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(Crypto::TAG_SIZE),
                            ciphertext.data() + ciphertextLen) != 1) {
        throw std::runtime_error("Failed to get AEAD tag");
    }
    ciphertextLen += static_cast<int>(Crypto::TAG_SIZE);

    ciphertext.resize(static_cast<size_t>(ciphertextLen));
    return ciphertext;
}

std::optional<std::vector<uint8_t>> aeadDecrypt(
    const EVP_CIPHER* cipher,
    const char* cipherName,
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    checkKeyAndNonce(key, nonce, cipherName);

    auto& logger = Logger::instance();
    if (ciphertext.size() < Crypto::TAG_SIZE) {
        logger.log(LogLevel::WARN, std::string("Ciphertext too short for ") + cipherName, "Crypto");
        return std::nullopt;
    }

    auto ctx = newCipherCtx();

    if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error(std::string("Failed to initialize ") + cipherName + " decryption");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(Crypto::NONCE_SIZE), nullptr) != 1) {
        throw std::runtime_error("Failed to set AEAD nonce length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set AEAD key/nonce");
    }

    int len = 0;

    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), evpLength(aad.size())) != 1) {
            throw std::runtime_error("Failed to add AAD");
        }
    }

    size_t bodyLen = ciphertext.size() - Crypto::TAG_SIZE;

    // Spare block keeps data() valid for an empty body
    std::vector<uint8_t> plaintext(bodyLen + Crypto::BLOCK_SIZE);
    int plaintextLen = 0;

    if (bodyLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext.data(), evpLength(bodyLen)) != 1) {
            return std::nullopt;
        }
        plaintextLen = len;
    }

    std::vector<uint8_t> tag(ciphertext.end() - static_cast<std::ptrdiff_t>(Crypto::TAG_SIZE), ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                            static_cast<int>(Crypto::TAG_SIZE), tag.data()) != 1) {
        return std::nullopt;
    }

    // Tag check happens here
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLen, &len) <= 0) {
        logger.log(LogLevel::WARN, std::string(cipherName) + " authentication failed", "Crypto");
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return std::nullopt;
    }
    plaintextLen += len;

    plaintext.resize(static_cast<size_t>(plaintextLen));
    return plaintext;
}

} // namespace

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        Logger::instance().log(LogLevel::ERROR, "Failed to generate random bytes", "Crypto");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::vector<uint8_t> Crypto::addPadding(const std::vector<uint8_t>& data) {
    size_t paddingLength = BLOCK_SIZE - (data.size() % BLOCK_SIZE);
    std::vector<uint8_t> padded = data;
    padded.insert(padded.end(), paddingLength, static_cast<uint8_t>(paddingLength));
    return padded;
}

std::optional<std::vector<uint8_t>> Crypto::removePadding(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::nullopt;
    }

    uint8_t paddingLength = data.back();
    if (paddingLength == 0 || paddingLength > BLOCK_SIZE || paddingLength > data.size()) {
        return std::nullopt;
    }

    for (size_t i = data.size() - paddingLength; i < data.size(); ++i) {
        if (data[i] != paddingLength) {
            return std::nullopt;
        }
    }

    return std::vector<uint8_t>(data.begin(), data.end() - paddingLength);
}

std::vector<uint8_t> Crypto::encryptCbc(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv
) {
    auto& logger = Logger::instance();

    if (key.size() != KEY_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid key size for encryption", "Crypto");
        throw std::runtime_error("Invalid key size");
    }
    if (iv.size() != IV_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid IV size for encryption", "Crypto");
        throw std::runtime_error("Invalid IV size");
    }

    auto padded = addPadding(plaintext);

    auto ctx = newCipherCtx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("Failed to initialize encryption");
    }

    // Padding is handled manually
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::vector<uint8_t> ciphertext(padded.size() + BLOCK_SIZE);
    int len = 0;
    int ciphertextLen = 0;

    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, padded.data(),
                          evpLength(padded.size())) != 1) {
        throw std::runtime_error("Encryption failed");
    }
    ciphertextLen = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + len, &len) != 1) {
        throw std::runtime_error("Encryption finalization failed");
    }
    ciphertextLen += len;

    ciphertext.resize(static_cast<size_t>(ciphertextLen));
    return ciphertext;
}

std::optional<std::vector<uint8_t>> Crypto::decryptCbc(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv
) {
    auto& logger = Logger::instance();

    if (key.size() != KEY_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid key size for decryption", "Crypto");
        throw std::runtime_error("Invalid key size");
    }
    if (iv.size() != IV_SIZE) {
        logger.log(LogLevel::ERROR, "Invalid IV size for decryption", "Crypto");
        throw std::runtime_error("Invalid IV size");
    }
    if (ciphertext.empty() || ciphertext.size() % BLOCK_SIZE != 0) {
        logger.log(LogLevel::WARN, "Invalid ciphertext size for decryption", "Crypto");
        return std::nullopt;
    }

    auto ctx = newCipherCtx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("Failed to initialize decryption");
    }

    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::vector<uint8_t> plaintext(ciphertext.size() + BLOCK_SIZE);
    int len = 0;
    int plaintextLen = 0;

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                          evpLength(ciphertext.size())) != 1) {
        throw std::runtime_error("Decryption failed");
    }
    plaintextLen = len;

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) != 1) {
        throw std::runtime_error("Decryption finalization failed");
    }
    plaintextLen += len;

    plaintext.resize(static_cast<size_t>(plaintextLen));

    auto unpadded = removePadding(plaintext);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    if (!unpadded) {
        logger.log(LogLevel::WARN, "CBC padding check failed", "Crypto");
    }
    return unpadded;
}

std::vector<uint8_t> Crypto::encryptGcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    return aeadEncrypt(EVP_aes_256_gcm(), "AES-256-GCM", plaintext, key, nonce, aad);
}

std::optional<std::vector<uint8_t>> Crypto::decryptGcm(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    return aeadDecrypt(EVP_aes_256_gcm(), "AES-256-GCM", ciphertext, key, nonce, aad);
}

std::vector<uint8_t> Crypto::encryptChaCha20(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    return aeadEncrypt(EVP_chacha20_poly1305(), "ChaCha20-Poly1305", plaintext, key, nonce, aad);
}

std::optional<std::vector<uint8_t>> Crypto::decryptChaCha20(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    return aeadDecrypt(EVP_chacha20_poly1305(), "ChaCha20-Poly1305", ciphertext, key, nonce, aad);
}

std::vector<uint8_t> Crypto::pbkdf2Sha256(
    const std::string& password,
    const std::vector<uint8_t>& salt,
    int iterations,
    size_t length
) {
    if (iterations <= 0 || length == 0) {
        throw std::runtime_error("Invalid PBKDF2 parameters");
    }

    std::vector<uint8_t> key(length);

    if (PKCS5_PBKDF2_HMAC(
        password.c_str(),
        static_cast<int>(password.length()),
        salt.data(),
        static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        static_cast<int>(length),
        key.data()
    ) != 1) {
        Logger::instance().log(LogLevel::ERROR, "PBKDF2 derivation failed", "Crypto");
        throw std::runtime_error("Key derivation failed");
    }

    return key;
}

std::vector<uint8_t> Crypto::hkdfSha256(
    const std::vector<uint8_t>& ikm,
    const std::vector<uint8_t>& salt,
    const std::vector<uint8_t>& info,
    size_t length
) {
    if (ikm.empty() || length == 0) {
        throw std::runtime_error("Invalid HKDF parameters");
    }

    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> pctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr), &EVP_PKEY_CTX_free);
    if (!pctx) {
        throw std::runtime_error("Failed to create HKDF context");
    }

    if (EVP_PKEY_derive_init(pctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), info.data(), static_cast<int>(info.size())) <= 0) {
        throw std::runtime_error("Failed to configure HKDF");
    }

    std::vector<uint8_t> out(length);
    size_t outLen = length;
    if (EVP_PKEY_derive(pctx.get(), out.data(), &outLen) <= 0 || outLen != length) {
        Logger::instance().log(LogLevel::ERROR, "HKDF derivation failed", "Crypto");
        throw std::runtime_error("HKDF derivation failed");
    }
    return out;
}

std::vector<uint8_t> Crypto::sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(SHA256_SIZE);
    unsigned int digestLen = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digestLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 computation failed");
    }
    digest.resize(digestLen);
    return digest;
}

std::vector<uint8_t> Crypto::sha256(const std::string& data) {
    return sha256(std::vector<uint8_t>(data.begin(), data.end()));
}

bool Crypto::constantTimeCompare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void Crypto::secureClear(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

std::vector<uint8_t> Crypto::fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::runtime_error("Invalid hex string length");
    }

    std::vector<uint8_t> data;
    data.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw std::runtime_error("Invalid hex character");
        }
        data.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }

    return data;
}

} // namespace CodeDrop
