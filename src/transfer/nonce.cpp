#include "blockvault/transfer/nonce.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include <algorithm>

namespace blockvault::transfer {
    using crypto::SodiumInterop;

    namespace {
        constexpr size_t kNonceSize = kNoncePrefixBytes + kNonceCounterBytes;
        static_assert(kNonceSize == kAesGcmNonceBytes, "Nonce layout must match AES-GCM nonce size");
    }

    NonceGenerator::NonceGenerator(State state)
        : state_(state) {
    }

    Result<NonceGenerator, TransferFailure> NonceGenerator::Create(const std::string_view session_id) {
        return Resume(session_id, 0);
    }

    Result<NonceGenerator, TransferFailure> NonceGenerator::Resume(
        const std::string_view session_id,
        const uint64_t counter) {
        if (session_id.empty()) {
            return Result<NonceGenerator, TransferFailure>::Err(
                TransferFailure::InvalidInput("Nonce prefix requires a session id"));
        }
        auto salt = SodiumInterop::GetRandomBytes(kNonceSaltBytes);
        if (salt.size() != kNonceSaltBytes) {
            return Result<NonceGenerator, TransferFailure>::Err(
                TransferFailure::Generic("Failed to generate nonce salt"));
        }

        std::vector<uint8_t> material(session_id.begin(), session_id.end());
        material.insert(material.end(), salt.begin(), salt.end());
        const auto digest = SodiumInterop::Sha256(material);
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(salt)); (void)_wipe; }

        State state;
        std::copy_n(digest.begin(), kNoncePrefixBytes, state.prefix.begin());
        state.counter = counter;
        return FromState(state);
    }

    Result<NonceGenerator, TransferFailure> NonceGenerator::FromState(const State& state) {
        if (state.counter > kMaxNonceCounter) {
            return Result<NonceGenerator, TransferFailure>::Err(
                TransferFailure::InvalidState("Nonce counter exceeds maximum"));
        }
        return Result<NonceGenerator, TransferFailure>::Ok(NonceGenerator(state));
    }

    Result<std::vector<uint8_t>, TransferFailure> NonceGenerator::Next() {
        if (state_.counter > kMaxNonceCounter) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::InvalidState("Nonce counter overflow - replace the session key"));
        }

        std::vector<uint8_t> nonce(kAesGcmNonceBytes);
        std::copy(state_.prefix.begin(), state_.prefix.end(), nonce.begin());

        const uint32_t counter32 = static_cast<uint32_t>(state_.counter);
        for (size_t i = 0; i < kNonceCounterBytes; ++i) {
            nonce[kNoncePrefixBytes + i] = static_cast<uint8_t>((counter32 >> (i * 8)) & 0xFF);
        }

        state_.counter += 1;
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(nonce));
    }

    NonceGenerator::State NonceGenerator::ExportState() const {
        return state_;
    }

}
