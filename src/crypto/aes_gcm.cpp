#include "blockvault/crypto/aes_gcm.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/core/constants.hpp"
#include "blockvault/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <limits>
#include <memory>
namespace blockvault::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<Unit, TransferFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                        Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    bool FitsInt(size_t size) {
        return size <= static_cast<size_t>(std::numeric_limits<int>::max());
    }
}
Result<AesGcm::Sealed, TransferFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<Sealed, TransferFailure>::Err(std::move(check).UnwrapErr());
    }
    if (!FitsInt(plaintext.size()) || !FitsInt(associated_data.size())) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::InvalidInput("AES-GCM input too large"));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<Sealed, TransferFailure>::Err(
                TransferFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    Sealed sealed;
    sealed.ciphertext.resize(plaintext.size());
    sealed.tag.resize(Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           sealed.tag.data()) != OpenSSL::SUCCESS) {
        return Result<Sealed, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    sealed.ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return Result<Sealed, TransferFailure>::Ok(std::move(sealed));
}
Result<std::vector<uint8_t>, TransferFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(std::move(check).UnwrapErr());
    }
    if (tag.size() != Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::IntegrityError(
                compat::format("AES-GCM tag must be {} bytes, got {}",
                    Constants::AES_GCM_TAG_SIZE, tag.size())));
    }
    if (!FitsInt(ciphertext.size()) || !FitsInt(associated_data.size())) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidInput("AES-GCM input too large"));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(ciphertext.size());
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output)); (void)_wipe; }
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output)); (void)_wipe; }
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    const int ret = EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len);
    if (ret != OpenSSL::SUCCESS) {
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output)); (void)_wipe; }
        ERR_clear_error();
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::IntegrityError(
                std::string(ErrorMessages::TAG_VERIFICATION_FAILED)));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(output));
}
}
