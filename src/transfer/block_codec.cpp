#include "blockvault/transfer/block_codec.hpp"
#include "blockvault/core/constants.hpp"
#include "blockvault/crypto/aes_gcm.hpp"
#include "blockvault/crypto/sodium_interop.hpp"

namespace blockvault::transfer {
    using crypto::SodiumInterop;

    namespace {
        void AppendU32(std::vector<uint8_t>& out, const uint32_t value) {
            for (size_t i = 0; i < 4; ++i) {
                out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
            }
        }

        void AppendString(std::vector<uint8_t>& out, const std::string& value) {
            AppendU32(out, static_cast<uint32_t>(value.size()));
            out.insert(out.end(), value.begin(), value.end());
        }

        std::span<const uint8_t> AsBytes(const std::string& value) {
            return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
        }
    }

    Result<EncryptedBlock, TransferFailure> BlockCodec::Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data) {
        auto sealed = crypto::AesGcm::Encrypt(key, nonce, plaintext, associated_data);
        if (sealed.IsErr()) {
            return Result<EncryptedBlock, TransferFailure>::Err(sealed.UnwrapErr());
        }
        auto& parts = sealed.Unwrap();
        return Result<EncryptedBlock, TransferFailure>::Ok(
            EncryptedBlock{std::move(parts.ciphertext), std::move(parts.tag)});
    }

    Result<std::vector<uint8_t>, TransferFailure> BlockCodec::Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> associated_data) {
        return crypto::AesGcm::Decrypt(key, nonce, ciphertext, tag, associated_data);
    }

    std::array<uint8_t, kDigestBytes> BlockCodec::ComputeDigest(std::span<const uint8_t> plaintext) {
        return SodiumInterop::Sha256(plaintext);
    }

    Result<Unit, TransferFailure> BlockCodec::VerifyDigest(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> expected_digest) {
        if (expected_digest.size() != kDigestBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::IntegrityError("Expected digest has the wrong length"));
        }
        const auto actual = ComputeDigest(plaintext);
        auto equal = SodiumInterop::ConstantTimeEquals(actual, expected_digest);
        if (equal.IsErr() || !equal.Unwrap()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::IntegrityError(std::string(ErrorMessages::DIGEST_MISMATCH)));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    std::vector<uint8_t> BlockCodec::BuildAssociatedData(
        const std::string& session_id,
        const uint32_t block_index,
        const std::string& key_id) {
        std::vector<uint8_t> aad;
        aad.reserve(kBlockAadLabel.size() + 12 + session_id.size() + key_id.size());
        aad.insert(aad.end(), kBlockAadLabel.begin(), kBlockAadLabel.end());
        AppendString(aad, session_id);
        AppendU32(aad, block_index);
        AppendString(aad, key_id);
        return aad;
    }

    Result<proto::transfer::BlockData, TransferFailure> BlockCodec::SealBlock(
        interfaces::IKeyProvider& keys,
        const std::string& session_id,
        const std::string& key_id,
        const uint32_t block_index,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext) {
        const auto aad = BuildAssociatedData(session_id, block_index, key_id);
        auto encrypted = keys.ExecuteWithKeyTyped<EncryptedBlock>(key_id,
            [&](std::span<const uint8_t> key) {
                return Encrypt(key, nonce, plaintext, aad);
            });
        if (encrypted.IsErr()) {
            return Result<proto::transfer::BlockData, TransferFailure>::Err(encrypted.UnwrapErr());
        }
        const auto& block = encrypted.Unwrap();
        const auto digest = ComputeDigest(plaintext);

        proto::transfer::BlockData message;
        message.set_session_id(session_id);
        message.set_block_index(block_index);
        message.set_key_id(key_id);
        message.set_ciphertext(block.ciphertext.data(), block.ciphertext.size());
        message.set_tag(block.tag.data(), block.tag.size());
        message.set_nonce(nonce.data(), nonce.size());
        message.set_plaintext_digest(digest.data(), digest.size());
        return Result<proto::transfer::BlockData, TransferFailure>::Ok(std::move(message));
    }

    Result<std::vector<uint8_t>, TransferFailure> BlockCodec::OpenBlock(
        interfaces::IKeyProvider& keys,
        const proto::transfer::BlockData& block) {
        const auto aad = BuildAssociatedData(block.session_id(), block.block_index(), block.key_id());
        auto plaintext = keys.ExecuteWithKeyTyped<std::vector<uint8_t>>(block.key_id(),
            [&](std::span<const uint8_t> key) {
                return Decrypt(key, AsBytes(block.nonce()), AsBytes(block.ciphertext()),
                               AsBytes(block.tag()), aad);
            },
            interfaces::KeyUsage::Decrypt);
        if (plaintext.IsErr()) {
            return plaintext;
        }
        if (auto verified = VerifyDigest(plaintext.Unwrap(), AsBytes(block.plaintext_digest()));
            verified.IsErr()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(verified.UnwrapErr());
        }
        return plaintext;
    }

}
