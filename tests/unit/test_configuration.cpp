#include <catch2/catch_test_macros.hpp>
#include "blockvault/configuration/key_lifecycle_config.hpp"
#include "blockvault/configuration/transfer_config.hpp"
using namespace blockvault;
using namespace blockvault::configuration;
using std::chrono::milliseconds;

TEST_CASE("TransferConfig - Defaults", "[config]") {
    const auto config = TransferConfig::Default();
    REQUIRE(config.GetMaxRetries() == 3);
    REQUIRE(config.GetMaxConcurrentSessions() == 3);
    REQUIRE(config.GetRetryBaseDelay() == milliseconds(1000));
    REQUIRE(config.GetRetryMaxDelay() == milliseconds(30'000));
    REQUIRE(config.GetBlockSize() == 1024 * 1024);
    REQUIRE(config.Validate().IsOk());
    REQUIRE(TransferConfig::HighThroughput().Validate().IsOk());
    REQUIRE(TransferConfig::Conservative().GetMaxConcurrentSessions() == 1);
}

TEST_CASE("TransferConfig - Backoff schedule", "[config][retry]") {
    SECTION("Doubles from the base delay") {
        const auto config = TransferConfig::Default()
            .WithRetryDelays(milliseconds(100), milliseconds(10'000));
        REQUIRE(config.BackoffDelay(1) == milliseconds(100));
        REQUIRE(config.BackoffDelay(2) == milliseconds(200));
        REQUIRE(config.BackoffDelay(3) == milliseconds(400));
        REQUIRE(config.BackoffDelay(4) == milliseconds(800));
    }
    SECTION("Capped at the maximum") {
        const auto config = TransferConfig::Default()
            .WithRetryDelays(milliseconds(1000), milliseconds(3000));
        REQUIRE(config.BackoffDelay(2) == milliseconds(2000));
        REQUIRE(config.BackoffDelay(3) == milliseconds(3000));
        REQUIRE(config.BackoffDelay(40) == milliseconds(3000));
    }
    SECTION("No wait before the first attempt") {
        REQUIRE(TransferConfig::Default().BackoffDelay(0) == milliseconds(0));
    }
    SECTION("Zero base never waits") {
        const auto config = TransferConfig::Default()
            .WithRetryDelays(milliseconds(0), milliseconds(0));
        REQUIRE(config.BackoffDelay(5) == milliseconds(0));
    }
}

TEST_CASE("TransferConfig - Validation", "[config]") {
    SECTION("Zero retries") {
        auto result = TransferConfig::Default().WithMaxRetries(0).Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
    SECTION("Base above max") {
        REQUIRE(TransferConfig::Default()
            .WithRetryDelays(milliseconds(500), milliseconds(100)).Validate().IsErr());
    }
    SECTION("Zero concurrency, window or block size") {
        REQUIRE(TransferConfig::Default().WithMaxConcurrentSessions(0).Validate().IsErr());
        REQUIRE(TransferConfig::Default().WithBlockWindow(0).Validate().IsErr());
        REQUIRE(TransferConfig::Default().WithBlockSize(0).Validate().IsErr());
    }
    SECTION("Modifiers leave the original untouched") {
        const auto original = TransferConfig::Default();
        const auto changed = original.WithBlockWindow(9);
        REQUIRE(original.GetBlockWindow() == 4);
        REQUIRE(changed.GetBlockWindow() == 9);
    }
}

TEST_CASE("KeyLifecycleConfig - Validation", "[config][keys]") {
    SECTION("Defaults are valid") {
        const auto config = KeyLifecycleConfig::Default("/tmp/keys");
        REQUIRE(config.Validate().IsOk());
        REQUIRE(config.GetKeyLifetime() == std::chrono::hours(24 * 30));
        REQUIRE(config.GetRotationOverlap() == std::chrono::hours(24 * 7));
        REQUIRE(config.GetKeyRetention() == std::chrono::seconds(0));
    }
    SECTION("Storage directory is required") {
        REQUIRE(KeyLifecycleConfig::Default("").Validate().IsErr());
    }
    SECTION("Lifetime must be positive") {
        REQUIRE(KeyLifecycleConfig::Default("/tmp/keys")
            .WithKeyLifetime(std::chrono::seconds(0)).Validate().IsErr());
    }
    SECTION("Weak PBKDF2 settings are refused") {
        crypto::PasswordKdfParams params;
        params.pbkdf2_iterations = 10;
        REQUIRE(KeyLifecycleConfig::Default("/tmp/keys").WithKdfParams(params).Validate().IsErr());
    }
}
