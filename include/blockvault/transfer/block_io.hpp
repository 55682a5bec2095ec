#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/interfaces/i_block_io.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace blockvault::transfer {

/// Splits an artifact into fixed-size blocks and hashes each one.
class ArtifactChunker {
public:
    /// Blocks of @p block_size bytes (the last may be shorter) with their
    /// SHA-256 digests. An empty file is InvalidInput.
    [[nodiscard]] static Result<std::vector<interfaces::BlockDescriptor>, TransferFailure> Describe(
        const std::filesystem::path& path,
        size_t block_size);

    [[nodiscard]] static Result<std::vector<interfaces::BlockDescriptor>, TransferFailure> DescribeBytes(
        std::span<const uint8_t> artifact,
        size_t block_size);

private:
    ArtifactChunker() = delete;
};

/// Reads blocks from a file by offset with pread; safe for concurrent reads.
class FileBlockSource final : public interfaces::IBlockSource {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileBlockSource>, TransferFailure> Open(
        const std::filesystem::path& path);

    ~FileBlockSource() override;

    FileBlockSource(const FileBlockSource&) = delete;
    FileBlockSource& operator=(const FileBlockSource&) = delete;

    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> ReadBlock(
        const interfaces::BlockDescriptor& block) override;

private:
    FileBlockSource(std::filesystem::path path, int fd);

    std::filesystem::path path_;
    int fd_;
};

class MemoryBlockSource final : public interfaces::IBlockSource {
public:
    explicit MemoryBlockSource(std::vector<uint8_t> artifact);

    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> ReadBlock(
        const interfaces::BlockDescriptor& block) override;

    /// Overwrites one byte, e.g. to model a source that changed under a session.
    void CorruptByte(size_t offset);

private:
    mutable std::mutex lock_;
    std::vector<uint8_t> artifact_;
};

/// Writes each block to `<root>/<session_id>/<index>.blk` atomically.
class FileBlockSink final : public interfaces::IBlockSink {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileBlockSink>, TransferFailure> Open(
        std::filesystem::path root);

    [[nodiscard]] Result<Unit, TransferFailure> WriteBlock(
        const std::string& session_id,
        uint32_t index,
        std::span<const uint8_t> plaintext) override;

    [[nodiscard]] bool HasBlock(const std::string& session_id, uint32_t index) const override;

    /// Concatenates blocks 0..block_count-1 of @p session_id into @p output.
    [[nodiscard]] Result<Unit, TransferFailure> AssembleArtifact(
        const std::string& session_id,
        uint32_t block_count,
        const std::filesystem::path& output) const;

private:
    explicit FileBlockSink(std::filesystem::path root);

    [[nodiscard]] std::filesystem::path BlockPath(const std::string& session_id, uint32_t index) const;

    std::filesystem::path root_;
};

class MemoryBlockSink final : public interfaces::IBlockSink {
public:
    [[nodiscard]] Result<Unit, TransferFailure> WriteBlock(
        const std::string& session_id,
        uint32_t index,
        std::span<const uint8_t> plaintext) override;

    [[nodiscard]] bool HasBlock(const std::string& session_id, uint32_t index) const override;

    /// Blocks of @p session_id in index order, concatenated.
    [[nodiscard]] std::vector<uint8_t> Assemble(const std::string& session_id) const;

    /// How often block @p index of @p session_id was written.
    [[nodiscard]] uint32_t WriteCount(const std::string& session_id, uint32_t index) const;

private:
    struct StoredBlock {
        std::vector<uint8_t> data;
        uint32_t writes = 0;
    };

    mutable std::mutex lock_;
    std::unordered_map<std::string, std::map<uint32_t, StoredBlock>> sessions_;
};

}  // namespace blockvault::transfer
