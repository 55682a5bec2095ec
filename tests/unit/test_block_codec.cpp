#include <catch2/catch_test_macros.hpp>
#include "blockvault/transfer/block_codec.hpp"
#include "blockvault/transfer/nonce.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "helpers/mock_key_provider.hpp"
#include <algorithm>
#include <set>
#include <string>
using namespace blockvault;
using namespace blockvault::transfer;
using blockvault::crypto::SodiumInterop;
using blockvault::test_helpers::MockKeyProvider;

namespace {
    std::vector<uint8_t> SampleBlock(const size_t size, const uint8_t seed) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<uint8_t>(seed + i * 31);
        }
        return data;
    }
}

TEST_CASE("BlockCodec - Seal and open", "[transfer][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    MockKeyProvider keys;
    keys.SetKey("model_a", std::vector<uint8_t>(kAesKeyBytes, 0x42));
    auto nonces = NonceGenerator::Create("session-1").Unwrap();
    const auto plaintext = SampleBlock(4096, 7);

    auto sealed_result = BlockCodec::SealBlock(
        keys, "session-1", "model_a", 3, nonces.Next().Unwrap(), plaintext);
    REQUIRE(sealed_result.IsOk());
    auto block = sealed_result.Unwrap();

    SECTION("Message carries slot, nonce and digest") {
        REQUIRE(block.session_id() == "session-1");
        REQUIRE(block.block_index() == 3);
        REQUIRE(block.key_id() == "model_a");
        REQUIRE(block.nonce().size() == kAesGcmNonceBytes);
        REQUIRE(block.tag().size() == kAesGcmTagBytes);
        REQUIRE(block.plaintext_digest().size() == kDigestBytes);
        const auto digest = BlockCodec::ComputeDigest(plaintext);
        REQUIRE(std::equal(digest.begin(), digest.end(),
            reinterpret_cast<const uint8_t*>(block.plaintext_digest().data())));
    }
    SECTION("Open returns the plaintext") {
        auto opened = BlockCodec::OpenBlock(keys, block);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Only opening borrows the key for decryption") {
        REQUIRE(keys.DecryptCalls() == 0);
        REQUIRE(BlockCodec::OpenBlock(keys, block).IsOk());
        REQUIRE(keys.DecryptCalls() == 1);
    }
    SECTION("Flipped ciphertext byte is an integrity error") {
        std::string ciphertext = block.ciphertext();
        ciphertext[100] = static_cast<char>(ciphertext[100] ^ 0x01);
        block.set_ciphertext(ciphertext);
        auto opened = BlockCodec::OpenBlock(keys, block);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Replay into another index fails authentication") {
        block.set_block_index(4);
        auto opened = BlockCodec::OpenBlock(keys, block);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Replay into another session fails authentication") {
        block.set_session_id("session-2");
        auto opened = BlockCodec::OpenBlock(keys, block);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Wrong plaintext digest is an integrity error") {
        std::string digest = block.plaintext_digest();
        digest[0] = static_cast<char>(digest[0] ^ 0xFF);
        block.set_plaintext_digest(digest);
        auto opened = BlockCodec::OpenBlock(keys, block);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Key failures pass through unchanged") {
        keys.FailKey("model_a", TransferFailure::KeyRevoked("revoked in test"));
        auto opened = BlockCodec::OpenBlock(keys, block);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::KeyRevoked);
        auto resealed = BlockCodec::SealBlock(
            keys, "session-1", "model_a", 3, nonces.Next().Unwrap(), plaintext);
        REQUIRE(resealed.IsErr());
        REQUIRE(resealed.UnwrapErr().type == TransferFailureType::KeyRevoked);
    }
    SECTION("Unknown key is NotFound") {
        block.set_key_id("missing");
        auto opened = BlockCodec::OpenBlock(keys, block);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::NotFound);
    }
}

TEST_CASE("BlockCodec - Digest verification", "[transfer][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto data = SampleBlock(1000, 1);
    const auto digest = BlockCodec::ComputeDigest(data);
    SECTION("Matching digest") {
        REQUIRE(BlockCodec::VerifyDigest(data, digest).IsOk());
    }
    SECTION("Changed data") {
        auto changed = data;
        changed[999] ^= 0x80;
        auto result = BlockCodec::VerifyDigest(changed, digest);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::IntegrityError);
    }
    SECTION("Digest of the wrong length") {
        const std::vector<uint8_t> short_digest(16, 0);
        REQUIRE(BlockCodec::VerifyDigest(data, short_digest).IsErr());
    }
}

TEST_CASE("BlockCodec - Associated data binds the slot", "[transfer][codec]") {
    const auto base = BlockCodec::BuildAssociatedData("s", 1, "k");
    REQUIRE(base != BlockCodec::BuildAssociatedData("s", 2, "k"));
    REQUIRE(base != BlockCodec::BuildAssociatedData("t", 1, "k"));
    REQUIRE(base != BlockCodec::BuildAssociatedData("s", 1, "j"));
    // Length prefixes keep ("ab", "c") and ("a", "bc") apart.
    REQUIRE(BlockCodec::BuildAssociatedData("ab", 0, "c") != BlockCodec::BuildAssociatedData("a", 0, "bc"));
}

TEST_CASE("NonceGenerator - Layout and uniqueness", "[transfer][nonce]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Counter is little endian after the session prefix") {
        auto generator = NonceGenerator::Create("session-1").Unwrap();
        const auto first = generator.Next().Unwrap();
        REQUIRE(first.size() == kAesGcmNonceBytes);
        REQUIRE(first[kNoncePrefixBytes] == 0x00);
        const auto second = generator.Next().Unwrap();
        REQUIRE(second[kNoncePrefixBytes] == 0x01);
        REQUIRE(std::equal(first.begin(), first.begin() + kNoncePrefixBytes, second.begin()));
        REQUIRE(first != second);
    }
    SECTION("Retries never reuse a nonce") {
        auto generator = NonceGenerator::Create("session-1").Unwrap();
        std::set<std::vector<uint8_t>> seen;
        for (int attempt = 0; attempt < 1000; ++attempt) {
            seen.insert(generator.Next().Unwrap());
        }
        REQUIRE(seen.size() == 1000);
    }
    SECTION("Sessions sharing a key never emit the same nonce") {
        std::set<std::vector<uint8_t>> prefixes;
        std::set<std::vector<uint8_t>> seen;
        constexpr int SESSION_COUNT = 200;
        constexpr int ATTEMPTS = 20;
        for (int session = 0; session < SESSION_COUNT; ++session) {
            auto generator = NonceGenerator::Create("session-" + std::to_string(session)).Unwrap();
            for (int attempt = 0; attempt < ATTEMPTS; ++attempt) {
                const auto nonce = generator.Next().Unwrap();
                if (attempt == 0) {
                    prefixes.emplace(nonce.begin(), nonce.begin() + kNoncePrefixBytes);
                }
                seen.insert(nonce);
            }
        }
        REQUIRE(prefixes.size() == SESSION_COUNT);
        REQUIRE(seen.size() == SESSION_COUNT * ATTEMPTS);
    }
    SECTION("One session id drawn twice gets distinct prefixes") {
        auto a = NonceGenerator::Create("restarted").Unwrap();
        auto b = NonceGenerator::Resume("restarted", 0).Unwrap();
        REQUIRE(a.ExportState().prefix != b.ExportState().prefix);
        REQUIRE(a.Next().Unwrap() != b.Next().Unwrap());
    }
    SECTION("Resume keeps the counter") {
        auto generator = NonceGenerator::Resume("session-1", 42).Unwrap();
        REQUIRE(generator.ExportState().counter == 42);
        const auto nonce = generator.Next().Unwrap();
        REQUIRE(nonce[kNoncePrefixBytes] == 42);
        REQUIRE(generator.ExportState().counter == 43);
    }
    SECTION("Counter overflow is refused") {
        NonceGenerator::State state;
        state.counter = kMaxNonceCounter + 1;
        REQUIRE(NonceGenerator::FromState(state).IsErr());
    }
    SECTION("An empty session id is refused") {
        auto result = NonceGenerator::Create("");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
}
