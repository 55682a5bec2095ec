#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include <google/protobuf/message.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace blockvault::storage {

/// Creates @p directory (and parents) and restricts it to the owner (0700).
[[nodiscard]] Result<Unit, TransferFailure> EnsurePrivateDirectory(const std::filesystem::path& directory);

/// Writes <path>.tmp with mode 0600, fsyncs it, renames it over @p path and
/// fsyncs the parent directory. Readers see either the old or the new file.
[[nodiscard]] Result<Unit, TransferFailure> WriteFileAtomic(
    const std::filesystem::path& path,
    std::span<const uint8_t> contents);

/// Ok(nullopt) when the file does not exist.
[[nodiscard]] Result<std::optional<std::vector<uint8_t>>, TransferFailure> ReadFileIfExists(
    const std::filesystem::path& path);

[[nodiscard]] Result<Unit, TransferFailure> RemoveFile(const std::filesystem::path& path);

[[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> SerializeDeterministic(
    const google::protobuf::Message& message);

}  // namespace blockvault::storage
