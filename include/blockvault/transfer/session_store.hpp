#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "transfer/session_state.pb.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace blockvault::transfer {

/// One `<session_id>.session` file per session in a 0700 directory, each
/// replaced atomically on save. Safe for concurrent saves of different
/// sessions; saves of one session are serialized by its owner.
class SessionStore {
public:
    [[nodiscard]] static Result<std::unique_ptr<SessionStore>, TransferFailure> Open(
        std::filesystem::path directory);

    [[nodiscard]] Result<Unit, TransferFailure> Save(const proto::transfer::SessionRecord& record) const;

    [[nodiscard]] Result<proto::transfer::SessionRecord, TransferFailure> Load(const std::string& session_id) const;

    /// Every readable record in the directory. Corrupt files are skipped
    /// with a warning so one bad record cannot block recovery of the rest.
    [[nodiscard]] Result<std::vector<proto::transfer::SessionRecord>, TransferFailure> LoadAll() const;

    [[nodiscard]] Result<Unit, TransferFailure> Remove(const std::string& session_id) const;

    [[nodiscard]] const std::filesystem::path& GetDirectory() const noexcept { return directory_; }

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

private:
    explicit SessionStore(std::filesystem::path directory);

    [[nodiscard]] Result<std::filesystem::path, TransferFailure> PathFor(const std::string& session_id) const;

    std::filesystem::path directory_;
};

}  // namespace blockvault::transfer
