#pragma once

#include "Result.h"
#include "TransferMetadata.h"

#include <cstdint>
#include <vector>

namespace CodeDrop {

    /**
     * @brief Byte string handed to a backend's send()
     *
     * Layout: "CDP1" | u32 big-endian header length | JSON metadata | ciphertext
     */
    class TransferPackage {
    public:
        static constexpr char MAGIC[4] = {'C', 'D', 'P', '1'};
        static constexpr size_t PREFIX_SIZE = 8;
        static constexpr uint32_t MAX_HEADER_SIZE = 64 * 1024;

        struct Parsed {
            TransferMetadata metadata;
            std::vector<uint8_t> ciphertext;
        };

        static std::vector<uint8_t> build(const TransferMetadata& metadata,
                                          const std::vector<uint8_t>& ciphertext);

        // InvalidPackage on bad magic, truncated data or an oversized header
        static Result<Parsed> parse(const std::vector<uint8_t>& package);
    };

}
