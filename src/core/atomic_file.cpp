#include "blockvault/core/atomic_file.hpp"
#include "blockvault/core/logging.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace blockvault::storage {

    namespace {
        std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path) {
            return what + " " + path.string() + ": " + std::strerror(errno);
        }

        bool WriteAll(const int fd, std::span<const uint8_t> contents) {
            size_t offset = 0;
            while (offset < contents.size()) {
                const ssize_t written = ::write(fd, contents.data() + offset, contents.size() - offset);
                if (written < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                offset += static_cast<size_t>(written);
            }
            return true;
        }

        void SyncDirectory(const std::filesystem::path& directory) {
            const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
            if (fd < 0) {
                return;
            }
            if (::fsync(fd) != 0) {
                BLOCKVAULT_LOG_WARN("storage", "fsync of directory {} failed: {}",
                    directory.string(), std::strerror(errno));
            }
            ::close(fd);
        }
    }

    Result<Unit, TransferFailure> EnsurePrivateDirectory(const std::filesystem::path& directory) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Storage(
                    "Cannot create directory " + directory.string() + ": " + ec.message()));
        }
        std::filesystem::permissions(directory, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Storage(
                    "Cannot restrict permissions of " + directory.string() + ": " + ec.message()));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> WriteFileAtomic(
        const std::filesystem::path& path,
        std::span<const uint8_t> contents) {
        std::filesystem::path temp_path = path;
        temp_path += ".tmp";

        const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (fd < 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Storage(ErrnoMessage("Cannot open", temp_path)));
        }
        // O_CREAT's mode is not applied to a pre-existing file.
        if (::fchmod(fd, 0600) != 0 || !WriteAll(fd, contents) || ::fsync(fd) != 0) {
            const std::string message = ErrnoMessage("Cannot write", temp_path);
            ::close(fd);
            ::unlink(temp_path.c_str());
            return Result<Unit, TransferFailure>::Err(TransferFailure::Storage(message));
        }
        if (::close(fd) != 0) {
            const std::string message = ErrnoMessage("Cannot close", temp_path);
            ::unlink(temp_path.c_str());
            return Result<Unit, TransferFailure>::Err(TransferFailure::Storage(message));
        }
        if (::rename(temp_path.c_str(), path.c_str()) != 0) {
            const std::string message = ErrnoMessage("Cannot replace", path);
            ::unlink(temp_path.c_str());
            return Result<Unit, TransferFailure>::Err(TransferFailure::Storage(message));
        }
        SyncDirectory(path.has_parent_path() ? path.parent_path() : std::filesystem::path("."));
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<std::optional<std::vector<uint8_t>>, TransferFailure> ReadFileIfExists(
        const std::filesystem::path& path) {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            if (errno == ENOENT) {
                return Result<std::optional<std::vector<uint8_t>>, TransferFailure>::Ok(std::nullopt);
            }
            return Result<std::optional<std::vector<uint8_t>>, TransferFailure>::Err(
                TransferFailure::Storage(ErrnoMessage("Cannot open", path)));
        }
        std::vector<uint8_t> contents;
        uint8_t buffer[64 * 1024];
        while (true) {
            const ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                const std::string message = ErrnoMessage("Cannot read", path);
                ::close(fd);
                return Result<std::optional<std::vector<uint8_t>>, TransferFailure>::Err(
                    TransferFailure::Storage(message));
            }
            if (n == 0) {
                break;
            }
            contents.insert(contents.end(), buffer, buffer + n);
        }
        ::close(fd);
        return Result<std::optional<std::vector<uint8_t>>, TransferFailure>::Ok(std::move(contents));
    }

    Result<Unit, TransferFailure> RemoveFile(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Storage("Cannot remove " + path.string() + ": " + ec.message()));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, TransferFailure> SerializeDeterministic(
        const google::protobuf::Message& message) {
        std::string output;
        {
            google::protobuf::io::StringOutputStream stream(&output);
            google::protobuf::io::CodedOutputStream coded_out(&stream);
            coded_out.SetSerializationDeterministic(true);
            if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                return Result<std::vector<uint8_t>, TransferFailure>::Err(
                    TransferFailure::Encode("Failed to serialize protobuf deterministically"));
            }
        }
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }

}
