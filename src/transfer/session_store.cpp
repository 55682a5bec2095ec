#include "blockvault/transfer/session_store.hpp"
#include "blockvault/core/atomic_file.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/transfer/constants.hpp"

#include <algorithm>
#include <system_error>

namespace blockvault::transfer {

    namespace {
        constexpr const char* kComponent = "SessionStore";

        bool IsSafeSessionId(const std::string& session_id) {
            return !session_id.empty() &&
                   std::all_of(session_id.begin(), session_id.end(), [](const char c) {
                       return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                              (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
                   });
        }

        Result<proto::transfer::SessionRecord, TransferFailure> ParseRecord(
            const std::vector<uint8_t>& contents,
            const std::filesystem::path& path) {
            proto::transfer::SessionRecord record;
            if (!record.ParseFromArray(contents.data(), static_cast<int>(contents.size()))) {
                return Result<proto::transfer::SessionRecord, TransferFailure>::Err(
                    TransferFailure::Decode("Session file is corrupt: " + path.string()));
            }
            if (record.version() != kStateFormatVersion) {
                return Result<proto::transfer::SessionRecord, TransferFailure>::Err(
                    TransferFailure::Decode(compat::format(
                        "Unsupported session record version {} in {}", record.version(), path.string())));
            }
            return Result<proto::transfer::SessionRecord, TransferFailure>::Ok(std::move(record));
        }
    }

    SessionStore::SessionStore(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    Result<std::unique_ptr<SessionStore>, TransferFailure> SessionStore::Open(std::filesystem::path directory) {
        auto dir_result = storage::EnsurePrivateDirectory(directory);
        if (dir_result.IsErr()) {
            return Result<std::unique_ptr<SessionStore>, TransferFailure>::Err(dir_result.UnwrapErr());
        }
        return Result<std::unique_ptr<SessionStore>, TransferFailure>::Ok(
            std::unique_ptr<SessionStore>(new SessionStore(std::move(directory))));
    }

    Result<std::filesystem::path, TransferFailure> SessionStore::PathFor(const std::string& session_id) const {
        if (!IsSafeSessionId(session_id)) {
            return Result<std::filesystem::path, TransferFailure>::Err(
                TransferFailure::InvalidInput("Session id is not usable as a file name"));
        }
        return Result<std::filesystem::path, TransferFailure>::Ok(
            directory_ / (session_id + std::string(kSessionFileExtension)));
    }

    Result<Unit, TransferFailure> SessionStore::Save(const proto::transfer::SessionRecord& record) const {
        auto path_result = PathFor(record.session_id());
        if (path_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(path_result.UnwrapErr());
        }
        auto bytes_result = storage::SerializeDeterministic(record);
        if (bytes_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(bytes_result.UnwrapErr());
        }
        return storage::WriteFileAtomic(path_result.Unwrap(), bytes_result.Unwrap());
    }

    Result<proto::transfer::SessionRecord, TransferFailure> SessionStore::Load(const std::string& session_id) const {
        auto path_result = PathFor(session_id);
        if (path_result.IsErr()) {
            return Result<proto::transfer::SessionRecord, TransferFailure>::Err(path_result.UnwrapErr());
        }
        const auto& path = path_result.Unwrap();
        auto read_result = storage::ReadFileIfExists(path);
        if (read_result.IsErr()) {
            return Result<proto::transfer::SessionRecord, TransferFailure>::Err(read_result.UnwrapErr());
        }
        const auto& contents = read_result.Unwrap();
        if (!contents.has_value()) {
            return Result<proto::transfer::SessionRecord, TransferFailure>::Err(
                TransferFailure::NotFound("No persisted session " + session_id));
        }
        return ParseRecord(*contents, path);
    }

    Result<std::vector<proto::transfer::SessionRecord>, TransferFailure> SessionStore::LoadAll() const {
        std::vector<std::filesystem::path> paths;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec) && it->path().extension() == std::filesystem::path(kSessionFileExtension)) {
                paths.push_back(it->path());
            }
        }
        if (ec) {
            return Result<std::vector<proto::transfer::SessionRecord>, TransferFailure>::Err(
                TransferFailure::Storage("Cannot list " + directory_.string() + ": " + ec.message()));
        }
        std::sort(paths.begin(), paths.end());

        std::vector<proto::transfer::SessionRecord> records;
        records.reserve(paths.size());
        for (const auto& path : paths) {
            auto read_result = storage::ReadFileIfExists(path);
            if (read_result.IsErr()) {
                BLOCKVAULT_LOG_WARN(kComponent, "Skipping {}: {}", path.string(), read_result.UnwrapErr().message);
                continue;
            }
            const auto& contents = read_result.Unwrap();
            if (!contents.has_value()) {
                continue;
            }
            auto record_result = ParseRecord(*contents, path);
            if (record_result.IsErr()) {
                BLOCKVAULT_LOG_WARN(kComponent, "Skipping {}", record_result.UnwrapErr().message);
                continue;
            }
            records.push_back(std::move(record_result).Unwrap());
        }
        BLOCKVAULT_LOG_DEBUG(kComponent, "Loaded {} of {} session files", records.size(), paths.size());
        return Result<std::vector<proto::transfer::SessionRecord>, TransferFailure>::Ok(std::move(records));
    }

    Result<Unit, TransferFailure> SessionStore::Remove(const std::string& session_id) const {
        auto path_result = PathFor(session_id);
        if (path_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(path_result.UnwrapErr());
        }
        return storage::RemoveFile(path_result.Unwrap());
    }

}
