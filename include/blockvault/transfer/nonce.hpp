#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/transfer/constants.hpp"
#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace blockvault::transfer {

/// Per-session AES-GCM nonces: prefix(8) || attempt counter(4, LE).
///
/// The prefix is SHA-256(session id || random salt) truncated to eight
/// bytes, so sessions sharing a key draw from disjoint 64-bit spaces. Each
/// generator instance draws its own salt, including after a restart. The
/// counter advances on every attempt, retries included, and is persisted
/// with the session. Not thread-safe; the owning session serializes calls.
class NonceGenerator {
public:
    struct State {
        std::array<uint8_t, kNoncePrefixBytes> prefix{};
        uint64_t counter = 0;
    };

    [[nodiscard]] static Result<NonceGenerator, TransferFailure> Create(std::string_view session_id);

    /// Restores the counter under a fresh session-bound prefix.
    [[nodiscard]] static Result<NonceGenerator, TransferFailure> Resume(
        std::string_view session_id, uint64_t counter);

    [[nodiscard]] static Result<NonceGenerator, TransferFailure> FromState(const State& state);

    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Next();

    [[nodiscard]] State ExportState() const;

private:
    explicit NonceGenerator(State state);

    State state_{};
};

}  // namespace blockvault::transfer
