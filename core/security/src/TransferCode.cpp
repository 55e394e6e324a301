#include "TransferCode.h"
#include "Crypto.h"
#include "SecurityEngine.h"

#include <array>
#include <cctype>
#include <stdexcept>

namespace CodeDrop {

    namespace {
        const std::array<const char*, 26> kWords = {
            "alpha", "bravo", "charlie", "delta", "echo", "foxtrot",
            "golf", "hotel", "india", "juliet", "kilo", "lima",
            "mike", "november", "oscar", "papa", "quebec", "romeo",
            "sierra", "tango", "uniform", "victor", "whiskey", "xray",
            "yankee", "zulu"
        };

        constexpr const char* kTransferIdLabel = "codedrop-transfer-id";
        constexpr size_t kTransferIdBytes = 16;

        uint16_t readU16(const std::vector<uint8_t>& bytes, size_t offset) {
            return static_cast<uint16_t>((bytes[offset] << 8) | bytes[offset + 1]);
        }
    }

    std::string TransferCode::generate(int wordCount) {
        if (wordCount < 1) {
            throw std::invalid_argument("wordCount must be positive");
        }

        // Two bytes per word plus two for the suffix
        auto entropy = Crypto::randomBytes(static_cast<size_t>(wordCount) * 2 + 2);

        std::string code;
        for (int i = 0; i < wordCount; ++i) {
            code += kWords[readU16(entropy, static_cast<size_t>(i) * 2) % kWords.size()];
            code += '-';
        }
        code += std::to_string(1000 + readU16(entropy, static_cast<size_t>(wordCount) * 2) % 9000);
        return code;
    }

    std::string TransferCode::normalize(const std::string& code) {
        std::string normalized;
        bool pendingDash = false;
        for (char c : code) {
            auto uc = static_cast<unsigned char>(c);
            if (std::isspace(uc)) {
                pendingDash = true;
                continue;
            }
            if (pendingDash && !normalized.empty() && normalized.back() != '-' && c != '-') {
                normalized += '-';
            }
            pendingDash = false;
            normalized += static_cast<char>(std::tolower(uc));
        }
        return normalized;
    }

    bool TransferCode::isWellFormed(const std::string& code) {
        if (code.empty() || code.front() == '-' || code.back() == '-') return false;

        char prev = '\0';
        for (char c : code) {
            auto uc = static_cast<unsigned char>(c);
            if (c == '-') {
                if (prev == '-') return false;
            } else if (!std::islower(uc) && !std::isdigit(uc)) {
                return false;
            }
            prev = c;
        }
        return true;
    }

    std::string TransferCode::transferId(const std::string& code) {
        // Backends see the id in the clear; guessing codes from it costs as much as guessing the key
        const auto salt = Crypto::sha256(std::string(kTransferIdLabel) + code);
        return Crypto::toHex(Crypto::pbkdf2Sha256(code, salt, SecurityEngine::PBKDF2_ITERATIONS, kTransferIdBytes));
    }

}
