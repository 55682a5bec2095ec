#pragma once

#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/crypto/password_key_derivation.hpp"
#include "blockvault/transfer/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace blockvault::configuration {

/**
 * @brief Lifecycle policy for keys owned by keys::KeyManager
 *
 * - key lifetime: an Active key older than this expires (default 30 days)
 * - rotation overlap: a Deprecated key still decrypts for this long
 *   after rotation (default 7 days), then expires
 * - key retention: Expired records are purged from the store this long
 *   after they expired (default 0, purged by the next cleanup pass)
 */
class KeyLifecycleConfig {
public:
    [[nodiscard]] static KeyLifecycleConfig Default(std::filesystem::path storage_directory) {
        KeyLifecycleConfig config;
        config.storage_directory_ = std::move(storage_directory);
        return config;
    }

    /**
     * @brief Cheap KDF settings for unit tests; never use in production
     */
    [[nodiscard]] static KeyLifecycleConfig ForTesting(std::filesystem::path storage_directory) {
        KeyLifecycleConfig config = Default(std::move(storage_directory));
        config.kdf_params_.pbkdf2_iterations = kMinPbkdf2Iterations;
        config.kdf_params_.argon2_ops_limit = 1;
        config.kdf_params_.argon2_mem_limit = 8 * 1024;
        return config;
    }

    [[nodiscard]] KeyLifecycleConfig WithKeyLifetime(const std::chrono::seconds value) const {
        KeyLifecycleConfig copy = *this;
        copy.key_lifetime_ = value;
        return copy;
    }

    [[nodiscard]] KeyLifecycleConfig WithRotationOverlap(const std::chrono::seconds value) const {
        KeyLifecycleConfig copy = *this;
        copy.rotation_overlap_ = value;
        return copy;
    }

    [[nodiscard]] KeyLifecycleConfig WithKeyRetention(const std::chrono::seconds value) const {
        KeyLifecycleConfig copy = *this;
        copy.key_retention_ = value;
        return copy;
    }

    [[nodiscard]] KeyLifecycleConfig WithKdfParams(const crypto::PasswordKdfParams& value) const {
        KeyLifecycleConfig copy = *this;
        copy.kdf_params_ = value;
        return copy;
    }

    [[nodiscard]] KeyLifecycleConfig WithRotationLogCapacity(const size_t value) const {
        KeyLifecycleConfig copy = *this;
        copy.rotation_log_capacity_ = value;
        return copy;
    }

    [[nodiscard]] const std::filesystem::path& GetStorageDirectory() const noexcept { return storage_directory_; }
    [[nodiscard]] std::chrono::seconds GetKeyLifetime() const noexcept { return key_lifetime_; }
    [[nodiscard]] std::chrono::seconds GetRotationOverlap() const noexcept { return rotation_overlap_; }
    [[nodiscard]] std::chrono::seconds GetKeyRetention() const noexcept { return key_retention_; }
    [[nodiscard]] const crypto::PasswordKdfParams& GetKdfParams() const noexcept { return kdf_params_; }
    [[nodiscard]] size_t GetRotationLogCapacity() const noexcept { return rotation_log_capacity_; }

    [[nodiscard]] Result<Unit, TransferFailure> Validate() const {
        if (storage_directory_.empty()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Key storage directory must be set"));
        }
        if (key_lifetime_.count() <= 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Key lifetime must be positive"));
        }
        if (rotation_overlap_.count() < 0 || key_retention_.count() < 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Overlap and retention windows cannot be negative"));
        }
        if (kdf_params_.algorithm == crypto::PasswordKdfAlgorithm::Pbkdf2HmacSha256 &&
            kdf_params_.pbkdf2_iterations < kMinPbkdf2Iterations) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("PBKDF2 iteration count too low"));
        }
        if (rotation_log_capacity_ == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Rotation log capacity must be positive"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

private:
    KeyLifecycleConfig() = default;

    std::filesystem::path storage_directory_;
    std::chrono::seconds key_lifetime_ = kDefaultKeyLifetime;
    std::chrono::seconds rotation_overlap_ = kDefaultRotationOverlap;
    std::chrono::seconds key_retention_ = kDefaultKeyRetention;
    crypto::PasswordKdfParams kdf_params_{
        .algorithm = crypto::PasswordKdfAlgorithm::Pbkdf2HmacSha256,
        .pbkdf2_iterations = kDefaultPbkdf2Iterations,
    };
    size_t rotation_log_capacity_ = kDefaultRotationLogCapacity;
};

} // namespace blockvault::configuration
