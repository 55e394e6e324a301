#pragma once

#include "Result.h"

#include <json/json.h>

#include <cstdint>
#include <string>

namespace CodeDrop {

    /**
     * @brief Describes one transfer; serialized as the package header
     *
     * A receiver only knows transferId until the header has been parsed.
     */
    struct TransferMetadata {
        static constexpr int FORMAT_VERSION = 1;

        std::string transferId;
        std::string fileName;
        uint64_t fileSize{0};
        std::string digest;          // hex SHA-256 of the plaintext
        std::string encryptionMode;  // sender's decision, empty if unknown
        int formatVersion{FORMAT_VERSION};

        // Metadata a receiver can build from the code alone
        static TransferMetadata forReceive(const std::string& transferId);

        Json::Value toJson() const;
        std::string toJsonString() const;

        // Unknown fields are ignored, missing required fields are rejected
        static Result<TransferMetadata> fromJson(const Json::Value& json);
        static Result<TransferMetadata> parse(const std::string& text);
    };

}
