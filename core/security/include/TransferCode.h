#pragma once

#include <string>

namespace CodeDrop {

    /**
     * @brief Human-readable transfer codes, e.g. "delta-lima-tango-4821"
     *
     * The code is the only shared secret between sender and receiver. It is
     * never transmitted; backends rendezvous on transferId() instead.
     */
    class TransferCode {
    public:
        static constexpr int DEFAULT_WORD_COUNT = 3;

        // Random words from the phonetic alphabet plus a four digit suffix
        static std::string generate(int wordCount = DEFAULT_WORD_COUNT);

        // Trim, lowercase, and collapse whitespace runs into '-'
        static std::string normalize(const std::string& code);

        // Lowercase words and digits separated by single dashes
        static bool isWellFormed(const std::string& code);

        /**
         * @brief Public rendezvous id for a code
         *
         * salt = SHA-256("codedrop-transfer-id" || code)
         * id   = hex(PBKDF2-HMAC-SHA256(code, salt, SecurityEngine::PBKDF2_ITERATIONS, 16))
         *
         * Stretched like the session key, so the id is no shortcut to the code.
         */
        static std::string transferId(const std::string& code);
    };

}
