#include <catch2/catch_test_macros.hpp>
#include "blockvault/crypto/aes_gcm.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/transfer/constants.hpp"
using namespace blockvault;
using namespace blockvault::crypto;
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt and decrypt round-trip") {
        std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
        std::vector<uint8_t> ad = {'a', 'd'};
        auto encrypt_result = AesGcm::Encrypt(key, nonce, plaintext, ad);
        REQUIRE(encrypt_result.IsOk());
        auto sealed = encrypt_result.Unwrap();
        REQUIRE(sealed.ciphertext.size() == plaintext.size());
        REQUIRE(sealed.tag.size() == kAesGcmTagBytes);
        REQUIRE(sealed.ciphertext != plaintext);
        auto decrypt_result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, sealed.tag, ad);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext still carries a tag") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x11);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x22);
        std::vector<uint8_t> plaintext = {};
        auto encrypt_result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(encrypt_result.IsOk());
        auto sealed = encrypt_result.Unwrap();
        REQUIRE(sealed.ciphertext.empty());
        REQUIRE(sealed.tag.size() == kAesGcmTagBytes);
        auto decrypt_result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, sealed.tag);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap().empty());
    }
    SECTION("One mebibyte block") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x33);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x44);
        std::vector<uint8_t> plaintext(1024 * 1024, 0x55);
        auto encrypt_result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(encrypt_result.IsOk());
        auto sealed = encrypt_result.Unwrap();
        auto decrypt_result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, sealed.tag);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap() == plaintext);
    }
}
TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(kAesKeyBytes, 0x66);
    std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x77);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    std::vector<uint8_t> ad = {'c', 'o', 'n', 't', 'e', 'x', 't'};
    auto encrypt_result = AesGcm::Encrypt(key, nonce, plaintext, ad);
    REQUIRE(encrypt_result.IsOk());
    auto sealed = encrypt_result.Unwrap();
    SECTION("Wrong key") {
        std::vector<uint8_t> wrong_key(kAesKeyBytes, 0x99);
        auto result = AesGcm::Decrypt(wrong_key, nonce, sealed.ciphertext, sealed.tag, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Wrong nonce") {
        std::vector<uint8_t> wrong_nonce(kAesGcmNonceBytes, 0x88);
        auto result = AesGcm::Decrypt(key, wrong_nonce, sealed.ciphertext, sealed.tag, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Wrong associated data") {
        std::vector<uint8_t> wrong_ad = {'w', 'r', 'o', 'n', 'g'};
        auto result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, sealed.tag, wrong_ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Tampered ciphertext") {
        auto tampered = sealed.ciphertext;
        tampered[0] ^= 0x01;
        auto result = AesGcm::Decrypt(key, nonce, tampered, sealed.tag, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Tampered tag") {
        auto tampered = sealed.tag;
        tampered[tampered.size() - 1] ^= 0x01;
        auto result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, tampered, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Truncated tag") {
        std::vector<uint8_t> short_tag(sealed.tag.begin(), sealed.tag.begin() + 8);
        auto result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, short_tag, ad);
        REQUIRE(result.IsErr());
    }
}
TEST_CASE("AES-GCM - Input validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> valid_key(kAesKeyBytes, 0xAA);
    std::vector<uint8_t> valid_nonce(kAesGcmNonceBytes, 0xBB);
    std::vector<uint8_t> plaintext = {'t', 'e', 's', 't'};
    SECTION("Invalid key size") {
        std::vector<uint8_t> short_key(16, 0xCC);
        auto result = AesGcm::Encrypt(short_key, valid_nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
    SECTION("Invalid nonce size") {
        std::vector<uint8_t> short_nonce(8, 0xDD);
        auto result = AesGcm::Encrypt(valid_key, short_nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
}
