#pragma once
#include "blockvault/core/failures.hpp"
#include <cstdint>
#include <string>

namespace blockvault::interfaces {

/// Session-level notifications. Invoked on the progress dispatcher thread,
/// never while a session lock is held.
class ITransferEventHandler {
public:
    virtual ~ITransferEventHandler() = default;
    virtual void OnSessionCompleted(const std::string& session_id) = 0;
    virtual void OnSessionFailed(const std::string& session_id, const TransferFailure& failure) = 0;
    virtual void OnBlockRetry(const std::string& session_id, uint32_t block_index, uint32_t attempt) = 0;
};

}
