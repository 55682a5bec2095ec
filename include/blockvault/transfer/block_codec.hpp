#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/interfaces/i_key_provider.hpp"
#include "blockvault/transfer/constants.hpp"
#include "transfer/wire.pb.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace blockvault::transfer {

struct EncryptedBlock {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
};

/**
 * @brief Stateless per-block AEAD and digest
 *
 * AES-256-GCM, 96-bit nonce, detached 128-bit tag. Associated data binds
 * a ciphertext to its slot:
 * @code
 *   "BlockVault-Block-v1" || len32(session_id) || session_id
 *                         || index32 || len32(key_id) || key_id
 * @endcode
 * (lengths and index little endian), so a block replayed into another
 * session, index or key fails authentication.
 */
class BlockCodec {
public:
    [[nodiscard]] static Result<EncryptedBlock, TransferFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data);

    /// IntegrityError on any tag mismatch.
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> associated_data);

    [[nodiscard]] static std::array<uint8_t, kDigestBytes> ComputeDigest(std::span<const uint8_t> plaintext);

    /// Constant-time; IntegrityError on mismatch.
    [[nodiscard]] static Result<Unit, TransferFailure> VerifyDigest(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> expected_digest);

    [[nodiscard]] static std::vector<uint8_t> BuildAssociatedData(
        const std::string& session_id,
        uint32_t block_index,
        const std::string& key_id);

    /// Encrypts @p plaintext with the key lent by @p keys into a wire message.
    [[nodiscard]] static Result<proto::transfer::BlockData, TransferFailure> SealBlock(
        interfaces::IKeyProvider& keys,
        const std::string& session_id,
        const std::string& key_id,
        uint32_t block_index,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext);

    /// Decrypts @p block and checks its plaintext digest.
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> OpenBlock(
        interfaces::IKeyProvider& keys,
        const proto::transfer::BlockData& block);

private:
    BlockCodec() = delete;
};

}  // namespace blockvault::transfer
