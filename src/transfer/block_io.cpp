#include "blockvault/transfer/block_io.hpp"
#include "blockvault/core/atomic_file.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/transfer/block_codec.hpp"
#include "blockvault/transfer/constants.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace blockvault::transfer {

    namespace {
        constexpr const char* kComponent = "BlockIO";

        Result<Unit, TransferFailure> CheckBlockSize(const size_t block_size) {
            if (block_size == 0) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::InvalidInput("Block size must be positive"));
            }
            return Result<Unit, TransferFailure>::Ok(unit);
        }

        interfaces::BlockDescriptor MakeDescriptor(
            const uint32_t index,
            const uint64_t offset,
            std::span<const uint8_t> data) {
            const auto digest = BlockCodec::ComputeDigest(data);
            interfaces::BlockDescriptor descriptor;
            descriptor.index = index;
            descriptor.offset = offset;
            descriptor.size = data.size();
            descriptor.digest.assign(digest.begin(), digest.end());
            return descriptor;
        }

        Result<std::vector<uint8_t>, TransferFailure> ReadAt(
            const int fd,
            const std::filesystem::path& path,
            const uint64_t offset,
            const size_t size) {
            std::vector<uint8_t> buffer(size);
            size_t done = 0;
            while (done < size) {
                const ssize_t n = ::pread(fd, buffer.data() + done, size - done,
                                          static_cast<off_t>(offset + done));
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return Result<std::vector<uint8_t>, TransferFailure>::Err(
                        TransferFailure::Storage(
                            "Cannot read " + path.string() + ": " + std::strerror(errno)));
                }
                if (n == 0) {
                    break;
                }
                done += static_cast<size_t>(n);
            }
            buffer.resize(done);
            return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(buffer));
        }
    }

    // ========================================================================
    // ArtifactChunker
    // ========================================================================

    Result<std::vector<interfaces::BlockDescriptor>, TransferFailure> ArtifactChunker::Describe(
        const std::filesystem::path& path,
        const size_t block_size) {
        if (auto check = CheckBlockSize(block_size); check.IsErr()) {
            return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Err(check.UnwrapErr());
        }
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Err(
                TransferFailure::Storage("Cannot open " + path.string() + ": " + std::strerror(errno)));
        }

        std::vector<interfaces::BlockDescriptor> blocks;
        uint64_t offset = 0;
        while (true) {
            auto read_result = ReadAt(fd, path, offset, block_size);
            if (read_result.IsErr()) {
                ::close(fd);
                return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Err(
                    read_result.UnwrapErr());
            }
            const auto& chunk = read_result.Unwrap();
            if (chunk.empty()) {
                break;
            }
            if (blocks.size() > kMaxBlockIndex) {
                ::close(fd);
                return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Err(
                    TransferFailure::InvalidInput("Artifact has too many blocks"));
            }
            blocks.push_back(MakeDescriptor(static_cast<uint32_t>(blocks.size()), offset, chunk));
            offset += chunk.size();
            if (chunk.size() < block_size) {
                break;
            }
        }
        ::close(fd);

        if (blocks.empty()) {
            return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Artifact " + path.string() + " is empty"));
        }
        BLOCKVAULT_LOG_DEBUG(kComponent, "Described {} as {} blocks ({} bytes)",
            path.string(), blocks.size(), offset);
        return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Ok(std::move(blocks));
    }

    Result<std::vector<interfaces::BlockDescriptor>, TransferFailure> ArtifactChunker::DescribeBytes(
        std::span<const uint8_t> artifact,
        const size_t block_size) {
        if (auto check = CheckBlockSize(block_size); check.IsErr()) {
            return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Err(check.UnwrapErr());
        }
        if (artifact.empty()) {
            return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Artifact is empty"));
        }
        std::vector<interfaces::BlockDescriptor> blocks;
        for (uint64_t offset = 0; offset < artifact.size(); offset += block_size) {
            const size_t size = std::min<size_t>(block_size, artifact.size() - offset);
            blocks.push_back(MakeDescriptor(
                static_cast<uint32_t>(blocks.size()), offset, artifact.subspan(offset, size)));
        }
        return Result<std::vector<interfaces::BlockDescriptor>, TransferFailure>::Ok(std::move(blocks));
    }

    // ========================================================================
    // Sources
    // ========================================================================

    FileBlockSource::FileBlockSource(std::filesystem::path path, const int fd)
        : path_(std::move(path))
        , fd_(fd) {}

    FileBlockSource::~FileBlockSource() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    Result<std::unique_ptr<FileBlockSource>, TransferFailure> FileBlockSource::Open(
        const std::filesystem::path& path) {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            return Result<std::unique_ptr<FileBlockSource>, TransferFailure>::Err(
                TransferFailure::Storage("Cannot open " + path.string() + ": " + std::strerror(errno)));
        }
        return Result<std::unique_ptr<FileBlockSource>, TransferFailure>::Ok(
            std::unique_ptr<FileBlockSource>(new FileBlockSource(path, fd)));
    }

    Result<std::vector<uint8_t>, TransferFailure> FileBlockSource::ReadBlock(
        const interfaces::BlockDescriptor& block) {
        auto read_result = ReadAt(fd_, path_, block.offset, block.size);
        if (read_result.IsErr()) {
            return read_result;
        }
        if (read_result.Unwrap().size() != block.size) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::Storage(compat::format(
                    "Short read of block {} from {}", block.index, path_.string())));
        }
        return read_result;
    }

    MemoryBlockSource::MemoryBlockSource(std::vector<uint8_t> artifact)
        : artifact_(std::move(artifact)) {}

    Result<std::vector<uint8_t>, TransferFailure> MemoryBlockSource::ReadBlock(
        const interfaces::BlockDescriptor& block) {
        std::lock_guard<std::mutex> guard(lock_);
        if (block.offset > artifact_.size() || block.size > artifact_.size() - block.offset) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::InvalidInput(compat::format(
                    "Block {} lies outside the artifact", block.index)));
        }
        const auto begin = artifact_.begin() + static_cast<std::ptrdiff_t>(block.offset);
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(
            std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(block.size)));
    }

    void MemoryBlockSource::CorruptByte(const size_t offset) {
        std::lock_guard<std::mutex> guard(lock_);
        if (offset < artifact_.size()) {
            artifact_[offset] ^= 0xFF;
        }
    }

    // ========================================================================
    // Sinks
    // ========================================================================

    FileBlockSink::FileBlockSink(std::filesystem::path root)
        : root_(std::move(root)) {}

    Result<std::unique_ptr<FileBlockSink>, TransferFailure> FileBlockSink::Open(std::filesystem::path root) {
        auto dir_result = storage::EnsurePrivateDirectory(root);
        if (dir_result.IsErr()) {
            return Result<std::unique_ptr<FileBlockSink>, TransferFailure>::Err(dir_result.UnwrapErr());
        }
        return Result<std::unique_ptr<FileBlockSink>, TransferFailure>::Ok(
            std::unique_ptr<FileBlockSink>(new FileBlockSink(std::move(root))));
    }

    std::filesystem::path FileBlockSink::BlockPath(const std::string& session_id, const uint32_t index) const {
        return root_ / session_id / (std::to_string(index) + ".blk");
    }

    Result<Unit, TransferFailure> FileBlockSink::WriteBlock(
        const std::string& session_id,
        const uint32_t index,
        std::span<const uint8_t> plaintext) {
        if (session_id.empty() || session_id.find('/') != std::string::npos || session_id == "." ||
            session_id == "..") {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Session id is not usable as a directory name"));
        }
        auto dir_result = storage::EnsurePrivateDirectory(root_ / session_id);
        if (dir_result.IsErr()) {
            return dir_result;
        }
        return storage::WriteFileAtomic(BlockPath(session_id, index), plaintext);
    }

    bool FileBlockSink::HasBlock(const std::string& session_id, const uint32_t index) const {
        std::error_code ec;
        return std::filesystem::is_regular_file(BlockPath(session_id, index), ec);
    }

    Result<Unit, TransferFailure> FileBlockSink::AssembleArtifact(
        const std::string& session_id,
        const uint32_t block_count,
        const std::filesystem::path& output) const {
        std::vector<uint8_t> artifact;
        for (uint32_t index = 0; index < block_count; ++index) {
            auto read_result = storage::ReadFileIfExists(BlockPath(session_id, index));
            if (read_result.IsErr()) {
                return Result<Unit, TransferFailure>::Err(read_result.UnwrapErr());
            }
            const auto& block = read_result.Unwrap();
            if (!block.has_value()) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::NotFound(compat::format(
                        "Block {} of session {} is missing", index, session_id)));
            }
            artifact.insert(artifact.end(), block->begin(), block->end());
        }
        return storage::WriteFileAtomic(output, artifact);
    }

    Result<Unit, TransferFailure> MemoryBlockSink::WriteBlock(
        const std::string& session_id,
        const uint32_t index,
        std::span<const uint8_t> plaintext) {
        std::lock_guard<std::mutex> guard(lock_);
        auto& stored = sessions_[session_id][index];
        stored.data.assign(plaintext.begin(), plaintext.end());
        ++stored.writes;
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    bool MemoryBlockSink::HasBlock(const std::string& session_id, const uint32_t index) const {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = sessions_.find(session_id);
        return it != sessions_.end() && it->second.contains(index);
    }

    std::vector<uint8_t> MemoryBlockSink::Assemble(const std::string& session_id) const {
        std::lock_guard<std::mutex> guard(lock_);
        std::vector<uint8_t> artifact;
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return artifact;
        }
        for (const auto& [index, stored] : it->second) {
            artifact.insert(artifact.end(), stored.data.begin(), stored.data.end());
        }
        return artifact;
    }

    uint32_t MemoryBlockSink::WriteCount(const std::string& session_id, const uint32_t index) const {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return 0;
        }
        const auto block = it->second.find(index);
        return block == it->second.end() ? 0 : block->second.writes;
    }

}
