#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace blockvault::interfaces {

/// Position of one block inside an artifact plus its plaintext SHA-256.
struct BlockDescriptor {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::vector<uint8_t> digest;
};

/// Read side of an artifact. Must tolerate concurrent reads.
class IBlockSource {
public:
    virtual ~IBlockSource() = default;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, TransferFailure> ReadBlock(
        const BlockDescriptor& block) = 0;
};

/// Write side on the receiving node. Must tolerate concurrent writes of
/// distinct blocks.
class IBlockSink {
public:
    virtual ~IBlockSink() = default;

    [[nodiscard]] virtual Result<Unit, TransferFailure> WriteBlock(
        const std::string& session_id,
        uint32_t index,
        std::span<const uint8_t> plaintext) = 0;

    [[nodiscard]] virtual bool HasBlock(const std::string& session_id, uint32_t index) const = 0;
};

}
