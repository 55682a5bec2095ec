#include <catch2/catch_test_macros.hpp>
#include "blockvault/hardware/hardware_identity.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "helpers/test_environment.hpp"
#include <sys/stat.h>
using namespace blockvault;
using namespace blockvault::hardware;
using blockvault::crypto::SodiumInterop;
using blockvault::test_helpers::FakeHardwareIdentity;
using blockvault::test_helpers::TempDirectory;

TEST_CASE("HardwareFingerprint - Canonical hashing", "[hardware]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Component order does not matter") {
        HardwareIdentity a{{{"machine_id", "abc"}, {"hostname", "node-1"}}};
        HardwareIdentity b{{{"hostname", "node-1"}, {"machine_id", "abc"}}};
        REQUIRE(HardwareFingerprint::Compute(a).Unwrap() == HardwareFingerprint::Compute(b).Unwrap());
    }
    SECTION("Fingerprint is 64 hex characters") {
        HardwareIdentity identity{{{"machine_id", "abc"}}};
        const auto fingerprint = HardwareFingerprint::Compute(identity).Unwrap();
        REQUIRE(fingerprint.size() == 64);
        REQUIRE(fingerprint.find_first_not_of("0123456789abcdef") == std::string::npos);
    }
    SECTION("Any component change alters the fingerprint") {
        HardwareIdentity a{{{"machine_id", "abc"}, {"hostname", "node-1"}}};
        HardwareIdentity b{{{"machine_id", "abd"}, {"hostname", "node-1"}}};
        REQUIRE(HardwareFingerprint::Compute(a).Unwrap() != HardwareFingerprint::Compute(b).Unwrap());
    }
    SECTION("Empty identity is unavailable") {
        auto result = HardwareFingerprint::Compute(HardwareIdentity{});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::HardwareUnavailable);
    }
    SECTION("Source failure propagates") {
        FakeHardwareIdentity source("machine-a");
        source.SetUnavailable(true);
        auto result = HardwareFingerprint::FromSource(source);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::HardwareUnavailable);
    }
}

TEST_CASE("SystemHardwareIdentity - Collection on this host", "[hardware]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    SystemHardwareIdentity source(dir.Path());

    auto first = source.Collect();
    REQUIRE(first.IsOk());
    REQUIRE_FALSE(first.Unwrap().IsEmpty());

    SECTION("Installation marker is created private and reused") {
        const auto marker = dir.Path() / "installation.id";
        REQUIRE(std::filesystem::exists(marker));
        struct stat info {};
        REQUIRE(::stat(marker.c_str(), &info) == 0);
        REQUIRE((info.st_mode & 0777) == 0600);

        auto second = source.Collect();
        REQUIRE(second.IsOk());
        REQUIRE(HardwareFingerprint::Compute(first.Unwrap()).Unwrap() ==
                HardwareFingerprint::Compute(second.Unwrap()).Unwrap());
    }
}
