#include "TransferPackage.h"

#include <cstring>
#include <string>

namespace CodeDrop {

    constexpr char TransferPackage::MAGIC[4];

    std::vector<uint8_t> TransferPackage::build(const TransferMetadata& metadata,
                                                const std::vector<uint8_t>& ciphertext) {
        const std::string header = metadata.toJsonString();
        const auto headerLen = static_cast<uint32_t>(header.size());

        std::vector<uint8_t> out;
        out.reserve(PREFIX_SIZE + header.size() + ciphertext.size());
        out.insert(out.end(), MAGIC, MAGIC + sizeof(MAGIC));
        out.push_back(static_cast<uint8_t>((headerLen >> 24) & 0xFF));
        out.push_back(static_cast<uint8_t>((headerLen >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((headerLen >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(headerLen & 0xFF));
        out.insert(out.end(), header.begin(), header.end());
        out.insert(out.end(), ciphertext.begin(), ciphertext.end());
        return out;
    }

    Result<TransferPackage::Parsed> TransferPackage::parse(const std::vector<uint8_t>& package) {
        if (package.size() < PREFIX_SIZE) {
            return Error(ErrorCode::InvalidPackage, "Package shorter than its prefix", "TransferPackage");
        }
        if (std::memcmp(package.data(), MAGIC, sizeof(MAGIC)) != 0) {
            return Error(ErrorCode::InvalidPackage, "Bad package magic", "TransferPackage");
        }

        const uint32_t headerLen = (static_cast<uint32_t>(package[4]) << 24) |
                                   (static_cast<uint32_t>(package[5]) << 16) |
                                   (static_cast<uint32_t>(package[6]) << 8) |
                                   static_cast<uint32_t>(package[7]);
        if (headerLen == 0 || headerLen > MAX_HEADER_SIZE) {
            return Error(ErrorCode::InvalidPackage,
                         "Header length out of range: " + std::to_string(headerLen), "TransferPackage");
        }
        if (package.size() - PREFIX_SIZE < headerLen) {
            return Error(ErrorCode::InvalidPackage, "Package truncated inside header", "TransferPackage");
        }

        const auto headerBegin = package.begin() + PREFIX_SIZE;
        const std::string header(headerBegin, headerBegin + headerLen);
        auto metadata = TransferMetadata::parse(header);
        if (metadata.isError()) {
            return metadata.error();
        }

        Parsed parsed;
        parsed.metadata = metadata.takeValue();
        parsed.ciphertext.assign(headerBegin + headerLen, package.end());
        return parsed;
    }

}
