#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace blockvault {

inline constexpr uint32_t kStateFormatVersion = 1;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;
inline constexpr size_t kDigestBytes = 32;
inline constexpr size_t kKeySaltBytes = 32;
inline constexpr size_t kInstallationSecretBytes = 32;

inline constexpr size_t kNoncePrefixBytes = 8;
inline constexpr size_t kNonceCounterBytes = 4;
inline constexpr size_t kNonceSaltBytes = 16;
inline constexpr uint64_t kMaxNonceCounter = 0xFFFFFFFFull;
inline constexpr uint64_t kMaxBlockIndex = 0xFFFFFFFFull;

inline constexpr size_t kKeyIdSuffixBytes = 4;
inline constexpr size_t kSessionIdBytes = 16;
inline constexpr size_t kFingerprintLogPrefix = 8;

inline constexpr uint32_t kDefaultPbkdf2Iterations = 100'000;
inline constexpr uint32_t kMinPbkdf2Iterations = 1'000;
inline constexpr size_t kDefaultRotationLogCapacity = 1000;

inline constexpr uint32_t kDefaultMaxRetries = 3;
inline constexpr std::chrono::milliseconds kDefaultRetryBaseDelay{1000};
inline constexpr std::chrono::milliseconds kDefaultRetryMaxDelay{30'000};
inline constexpr std::chrono::seconds kDefaultAckTimeout{300};
inline constexpr uint32_t kDefaultMaxConcurrentSessions = 3;
inline constexpr uint32_t kDefaultBlockWindow = 4;
inline constexpr size_t kDefaultBlockSize = 1024 * 1024;
inline constexpr std::chrono::hours kDefaultSessionRetention{24};
inline constexpr uint32_t kDefaultMaxResumeAttempts = 5;

inline constexpr std::chrono::hours kDefaultKeyLifetime{24 * 30};
inline constexpr std::chrono::hours kDefaultRotationOverlap{24 * 7};
inline constexpr std::chrono::seconds kDefaultKeyRetention{0};

inline constexpr std::string_view kStorageKeyInfo = "BlockVault-KeyStore-Seal";
inline constexpr std::string_view kDistributionWrapInfo = "BlockVault-Key-Distribution";
inline constexpr std::string_view kBlockAadLabel = "BlockVault-Block-v1";
inline constexpr std::string_view kHardwareSaltLabel = "BlockVault-Hardware-Salt";

inline constexpr std::string_view kKeyStoreFileName = "key_store.pb";
inline constexpr std::string_view kInstallationSecretFileName = "installation.secret";
inline constexpr std::string_view kInstallationMarkerFileName = "installation.id";
inline constexpr std::string_view kSessionFileExtension = ".session";

}  // namespace blockvault
