#pragma once

#include "blockvault/core/result.hpp"
#include "blockvault/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace blockvault::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) through the OpenSSL 3 EVP_KDF API
 *
 * Used to turn high-entropy secrets (installation secret, distribution
 * wrapping secret) into purpose-bound AES keys. Not suitable for
 * passwords or licence strings; see PasswordKeyDerivation for those.
 */
class Hkdf {
public:
    /**
     * @brief Derive key material into @p output
     *
     * @param ikm Input key material (must not be empty)
     * @param output Buffer to fill, at most MAX_OUTPUT_LEN bytes
     * @param salt Optional salt
     * @param info Optional context label
     */
    static Result<Unit, TransferFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, TransferFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace blockvault::crypto
