#pragma once
#include "blockvault/core/result.hpp"
#include "blockvault/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace blockvault::crypto {

/**
 * AES-256-GCM with a detached 128-bit tag (OpenSSL EVP).
 *
 * Stateless primitive. The caller guarantees (key, nonce) uniqueness;
 * within a transfer session this is transfer::NonceGenerator's job:
 *   [0..3]  random per-session prefix
 *   [4..7]  attempt counter, little endian
 *   [8..11] block index, little endian
 *
 * A tag mismatch on Decrypt is reported as IntegrityError and the partial
 * plaintext is wiped before returning.
 */
class AesGcm {
public:
    struct Sealed {
        std::vector<uint8_t> ciphertext;
        std::vector<uint8_t> tag;
    };

    [[nodiscard]] static Result<Sealed, TransferFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
