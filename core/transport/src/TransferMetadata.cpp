#include "TransferMetadata.h"

#include <memory>
#include <sstream>

namespace CodeDrop {

    namespace {
        const char* const kComponent = "TransferMetadata";

        Error missingField(const char* field) {
            return Error(ErrorCode::InvalidPackage,
                         std::string("Metadata field '") + field + "' is missing or has the wrong type",
                         kComponent);
        }
    }

    TransferMetadata TransferMetadata::forReceive(const std::string& transferId) {
        TransferMetadata metadata;
        metadata.transferId = transferId;
        return metadata;
    }

    Json::Value TransferMetadata::toJson() const {
        Json::Value json(Json::objectValue);
        json["transferId"] = transferId;
        json["fileName"] = fileName;
        json["fileSize"] = Json::UInt64(fileSize);
        json["digest"] = digest;
        json["encryptionMode"] = encryptionMode;
        json["formatVersion"] = formatVersion;
        return json;
    }

    std::string TransferMetadata::toJsonString() const {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, toJson());
    }

    Result<TransferMetadata> TransferMetadata::fromJson(const Json::Value& json) {
        if (!json.isObject()) {
            return Error(ErrorCode::InvalidPackage, "Metadata is not a JSON object", kComponent);
        }

        TransferMetadata metadata;

        const auto& transferId = json["transferId"];
        if (!transferId.isString() || transferId.asString().empty()) return missingField("transferId");
        metadata.transferId = transferId.asString();

        const auto& fileName = json["fileName"];
        if (!fileName.isString()) return missingField("fileName");
        metadata.fileName = fileName.asString();

        const auto& fileSize = json["fileSize"];
        if (!fileSize.isUInt64()) return missingField("fileSize");
        metadata.fileSize = fileSize.asUInt64();

        const auto& digest = json["digest"];
        if (!digest.isString()) return missingField("digest");
        metadata.digest = digest.asString();

        const auto& version = json["formatVersion"];
        if (!version.isInt()) return missingField("formatVersion");
        metadata.formatVersion = version.asInt();
        if (metadata.formatVersion > FORMAT_VERSION) {
            return Error(ErrorCode::InvalidPackage,
                         "Unsupported metadata format version " + std::to_string(metadata.formatVersion),
                         kComponent);
        }

        // Optional: receivers fall back to their own mode table
        const auto& mode = json["encryptionMode"];
        if (mode.isString()) {
            metadata.encryptionMode = mode.asString();
        }

        return metadata;
    }

    Result<TransferMetadata> TransferMetadata::parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value root;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
            return Error(ErrorCode::InvalidPackage, "Metadata is not valid JSON: " + errors, kComponent);
        }
        return fromJson(root);
    }

}
