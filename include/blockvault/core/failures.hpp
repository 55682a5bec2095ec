#pragma once
#include <string>
#include <string_view>
namespace blockvault {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class TransferFailureType {
    Generic,
    InvalidInput,
    InvalidState,
    NotFound,
    KeyGeneration,
    DeriveKey,
    Encode,
    Decode,
    Storage,
    TransportError,
    IntegrityError,
    HardwareUnavailable,
    HardwareMismatch,
    KeyRevoked,
    KeyExpired,
    RotationFailed,
    RetriesExhausted,
    Cancelled
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class TransferFailure {
public:
    TransferFailureType type;
    std::string message;
    TransferFailure(const TransferFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static TransferFailure Generic(std::string msg) {
        return {TransferFailureType::Generic, std::move(msg)};
    }
    static TransferFailure InvalidInput(std::string msg) {
        return {TransferFailureType::InvalidInput, std::move(msg)};
    }
    static TransferFailure InvalidState(std::string msg) {
        return {TransferFailureType::InvalidState, std::move(msg)};
    }
    static TransferFailure NotFound(std::string msg) {
        return {TransferFailureType::NotFound, std::move(msg)};
    }
    static TransferFailure KeyGeneration(std::string msg) {
        return {TransferFailureType::KeyGeneration, std::move(msg)};
    }
    static TransferFailure DeriveKey(std::string msg) {
        return {TransferFailureType::DeriveKey, std::move(msg)};
    }
    static TransferFailure Encode(std::string msg) {
        return {TransferFailureType::Encode, std::move(msg)};
    }
    static TransferFailure Decode(std::string msg) {
        return {TransferFailureType::Decode, std::move(msg)};
    }
    static TransferFailure Storage(std::string msg) {
        return {TransferFailureType::Storage, std::move(msg)};
    }
    static TransferFailure TransportError(std::string msg) {
        return {TransferFailureType::TransportError, std::move(msg)};
    }
    static TransferFailure IntegrityError(std::string msg) {
        return {TransferFailureType::IntegrityError, std::move(msg)};
    }
    static TransferFailure HardwareUnavailable(std::string msg) {
        return {TransferFailureType::HardwareUnavailable, std::move(msg)};
    }
    static TransferFailure HardwareMismatch(std::string msg) {
        return {TransferFailureType::HardwareMismatch, std::move(msg)};
    }
    static TransferFailure KeyRevoked(std::string msg) {
        return {TransferFailureType::KeyRevoked, std::move(msg)};
    }
    static TransferFailure KeyExpired(std::string msg) {
        return {TransferFailureType::KeyExpired, std::move(msg)};
    }
    static TransferFailure RotationFailed(std::string msg) {
        return {TransferFailureType::RotationFailed, std::move(msg)};
    }
    static TransferFailure RetriesExhausted(std::string msg) {
        return {TransferFailureType::RetriesExhausted, std::move(msg)};
    }
    static TransferFailure Cancelled(std::string msg) {
        return {TransferFailureType::Cancelled, std::move(msg)};
    }
    static TransferFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

[[nodiscard]] constexpr std::string_view ToString(const TransferFailureType type) noexcept {
    switch (type) {
        case TransferFailureType::Generic: return "Generic";
        case TransferFailureType::InvalidInput: return "InvalidInput";
        case TransferFailureType::InvalidState: return "InvalidState";
        case TransferFailureType::NotFound: return "NotFound";
        case TransferFailureType::KeyGeneration: return "KeyGeneration";
        case TransferFailureType::DeriveKey: return "DeriveKey";
        case TransferFailureType::Encode: return "Encode";
        case TransferFailureType::Decode: return "Decode";
        case TransferFailureType::Storage: return "Storage";
        case TransferFailureType::TransportError: return "TransportError";
        case TransferFailureType::IntegrityError: return "IntegrityError";
        case TransferFailureType::HardwareUnavailable: return "HardwareUnavailable";
        case TransferFailureType::HardwareMismatch: return "HardwareMismatch";
        case TransferFailureType::KeyRevoked: return "KeyRevoked";
        case TransferFailureType::KeyExpired: return "KeyExpired";
        case TransferFailureType::RotationFailed: return "RotationFailed";
        case TransferFailureType::RetriesExhausted: return "RetriesExhausted";
        case TransferFailureType::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// Per-block failures that are worth another attempt.
[[nodiscard]] constexpr bool IsRetryable(const TransferFailureType type) noexcept {
    return type == TransferFailureType::TransportError ||
           type == TransferFailureType::IntegrityError;
}

/// Failures caused by the key itself; retrying with the same key cannot succeed.
[[nodiscard]] constexpr bool IsKeyLifecycleFailure(const TransferFailureType type) noexcept {
    return type == TransferFailureType::HardwareMismatch ||
           type == TransferFailureType::KeyRevoked ||
           type == TransferFailureType::KeyExpired;
}
}
