#include "blockvault/crypto/hkdf.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace blockvault::crypto {

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, TransferFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                "HKDF output size out of range: " +
                std::to_string(output.size()) + " (max " + std::to_string(MAX_OUTPUT_LEN) + ")"));
    }

    if (ikm.empty()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr);
    if (!kdf) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::DeriveKey("Failed to fetch HKDF algorithm"));
    }

    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::DeriveKey("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST.data(),
        const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_KEY.data(), const_cast<uint8_t*>(ikm.data()), ikm.size());

    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());
    }

    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_INFO.data(), const_cast<uint8_t*>(info.data()), info.size());
    }

    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        { auto _wipe = SodiumInterop::SecureWipe(output); (void)_wipe; }
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::DeriveKey("HKDF key derivation failed"));
    }

    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, TransferFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);

    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            std::move(result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(output));
}

} // namespace blockvault::crypto
