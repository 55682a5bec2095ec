#include <catch2/catch_test_macros.hpp>
#include "blockvault/keys/key_manager.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "helpers/test_environment.hpp"
#include <sys/stat.h>
#include <atomic>
#include <thread>
using namespace blockvault;
using namespace blockvault::keys;
using blockvault::crypto::SodiumInterop;
using namespace blockvault::test_helpers;

namespace {
    std::vector<uint8_t> CopyKey(KeyManager& manager, const std::string& key_id) {
        std::vector<uint8_t> copy;
        auto result = manager.ExecuteWithKey(key_id, [&copy](std::span<const uint8_t> key) {
            copy.assign(key.begin(), key.end());
            return Result<Unit, TransferFailure>::Ok(unit);
        });
        if (result.IsErr()) {
            return {};
        }
        return copy;
    }

    std::vector<uint8_t> CopyKeyForDecrypt(KeyManager& manager, const std::string& key_id) {
        std::vector<uint8_t> copy;
        auto result = manager.ExecuteWithKeyForDecrypt(key_id, [&copy](std::span<const uint8_t> key) {
            copy.assign(key.begin(), key.end());
            return Result<Unit, TransferFailure>::Ok(unit);
        });
        if (result.IsErr()) {
            return {};
        }
        return copy;
    }

    TransferFailureType UseFailure(KeyManager& manager, const std::string& key_id) {
        auto result = manager.ExecuteWithKey(key_id, [](std::span<const uint8_t>) {
            return Result<Unit, TransferFailure>::Ok(unit);
        });
        return result.IsErr() ? result.UnwrapErr().type : TransferFailureType::Generic;
    }

    uint32_t ModeOf(const std::filesystem::path& path) {
        struct stat info {};
        if (::stat(path.c_str(), &info) != 0) {
            return 0;
        }
        return info.st_mode & 0777;
    }

    class RecordingNotifier final : public interfaces::IKeyRotationNotifier {
    public:
        [[nodiscard]] Result<Unit, TransferFailure> NotifyRotation(
            const std::string& target,
            const KeyRotationEvent& event) override {
            targets.push_back(target + ":" + event.new_key_id);
            if (target == "unreachable") {
                return Result<Unit, TransferFailure>::Err(TransferFailure::TransportError("down"));
            }
            return Result<Unit, TransferFailure>::Ok(unit);
        }
        std::vector<std::string> targets;
    };
}

TEST_CASE("KeyManager - Hardware-bound generation", "[keys][hardware]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto identity = std::make_shared<FakeHardwareIdentity>("machine-a");
    auto manager = MakeKeyManager(dir.Path(), identity);
    REQUIRE(manager);

    SECTION("Key is Active, bound and usable") {
        auto result = manager->GenerateHardwareBoundKey({"model_x", "licence-123", {{"tier", "gold"}}});
        REQUIRE(result.IsOk());
        const auto key = result.Unwrap();
        REQUIRE(key.key_id.rfind("model_x_", 0) == 0);
        REQUIRE(key.status == KeyStatus::Active);
        REQUIRE(key.origin == KeyOrigin::HardwareBound);
        REQUIRE(key.hardware_fingerprint.size() == 64);
        REQUIRE(key.labels.at("tier") == "gold");
        REQUIRE(key.expires_at.has_value());
        REQUIRE(CopyKey(*manager, key.key_id).size() == 32);
        REQUIRE(manager->ValidateHardwareBinding(key.key_id));
    }
    SECTION("Same secret gives different keys per key id") {
        const auto a = manager->GenerateHardwareBoundKey({"model_x", "licence-123", {}}).Unwrap();
        const auto b = manager->GenerateHardwareBoundKey({"model_x", "licence-123", {}}).Unwrap();
        REQUIRE(a.key_id != b.key_id);
        REQUIRE(CopyKey(*manager, a.key_id) != CopyKey(*manager, b.key_id));
    }
    SECTION("Secret is required") {
        auto result = manager->GenerateHardwareBoundKey({"model_x", "", {}});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
    SECTION("No identifiers means HardwareUnavailable") {
        identity->SetUnavailable(true);
        auto result = manager->GenerateHardwareBoundKey({"model_x", "licence-123", {}});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::HardwareUnavailable);
    }
    SECTION("Changed machine fails validation and use") {
        const auto key = manager->GenerateHardwareBoundKey({"model_x", "licence-123", {}}).Unwrap();
        identity->SetMachineId("machine-b");
        REQUIRE_FALSE(manager->ValidateHardwareBinding(key.key_id));
        REQUIRE(UseFailure(*manager, key.key_id) == TransferFailureType::HardwareMismatch);
        identity->SetMachineId("machine-a");
        REQUIRE(manager->ValidateHardwareBinding(key.key_id));
    }
    SECTION("Unknown keys do not validate") {
        REQUIRE_FALSE(manager->ValidateHardwareBinding("nope"));
    }
}

TEST_CASE("KeyManager - Random keys", "[keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto manager = MakeKeyManager(dir.Path(), std::make_shared<FakeHardwareIdentity>("machine-a"));
    REQUIRE(manager);

    const auto a = manager->GenerateRandomKey({"model_y", "", {}}).Unwrap();
    const auto b = manager->GenerateRandomKey({"", "", {}}).Unwrap();
    REQUIRE(a.origin == KeyOrigin::Random);
    REQUIRE(a.hardware_fingerprint.empty());
    REQUIRE(b.key_id.rfind("key_", 0) == 0);
    REQUIRE(CopyKey(*manager, a.key_id) != CopyKey(*manager, b.key_id));
    REQUIRE(manager->ValidateHardwareBinding(a.key_id));

    SECTION("ListActiveKeys filters by model") {
        REQUIRE(manager->ListActiveKeys().size() == 2);
        const auto model_keys = manager->ListActiveKeys("model_y");
        REQUIRE(model_keys.size() == 1);
        REQUIRE(model_keys[0].key_id == a.key_id);
    }
    SECTION("Usage is tracked") {
        REQUIRE(CopyKey(*manager, a.key_id).size() == 32);
        const auto used = manager->GetKey(a.key_id);
        REQUIRE(used->usage_count >= 2);
        REQUIRE(used->last_used_at.has_value());
    }
}

TEST_CASE("KeyManager - Persistence", "[keys][storage]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto identity = std::make_shared<FakeHardwareIdentity>("machine-a");
    std::string bound_id;
    std::string random_id;
    std::vector<uint8_t> bound_bytes;
    {
        auto manager = MakeKeyManager(dir.Path(), identity);
        REQUIRE(manager);
        bound_id = manager->GenerateHardwareBoundKey({"model_x", "licence", {}}).Unwrap().key_id;
        random_id = manager->GenerateRandomKey({"model_x", "", {}}).Unwrap().key_id;
        bound_bytes = CopyKey(*manager, bound_id);
    }

    SECTION("Store files are private") {
        REQUIRE(ModeOf(dir.Path() / "key_store.pb") == 0600);
        REQUIRE(ModeOf(dir.Path() / "installation.secret") == 0600);
        REQUIRE(ModeOf(dir.Path()) == 0700);
    }
    SECTION("Key material is not stored in the clear") {
        std::ifstream in(dir.Path() / "key_store.pb", std::ios::binary);
        const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const std::string raw(bound_bytes.begin(), bound_bytes.end());
        REQUIRE(contents.find(raw) == std::string::npos);
    }
    SECTION("Reopened manager sees the same keys") {
        auto reopened = MakeKeyManager(dir.Path(), identity);
        REQUIRE(reopened);
        REQUIRE(reopened->GetKey(bound_id).has_value());
        REQUIRE(reopened->GetKey(random_id).has_value());
        REQUIRE(CopyKey(*reopened, bound_id) == bound_bytes);
    }
    SECTION("Revocation survives a restart") {
        {
            auto manager = MakeKeyManager(dir.Path(), identity);
            REQUIRE(manager->RevokeKey(random_id, "compromised"));
        }
        auto reopened = MakeKeyManager(dir.Path(), identity);
        REQUIRE(reopened->IsRevoked(random_id));
        REQUIRE(reopened->GetKey(random_id)->status == KeyStatus::Revoked);
        REQUIRE(reopened->GetKey(random_id)->revocation_reason == "compromised");
        REQUIRE(UseFailure(*reopened, random_id) == TransferFailureType::KeyRevoked);
    }
}

TEST_CASE("KeyManager - Rotation", "[keys][rotation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto clock = std::make_shared<ManualClock>();
    auto manager = MakeKeyManager(dir.Path(), std::make_shared<FakeHardwareIdentity>("machine-a"),
                                  clock, std::chrono::hours(1));
    REQUIRE(manager);
    const auto old_key = manager->GenerateRandomKey({"model_r", "", {{"env", "prod"}}}).Unwrap();
    const auto old_bytes = CopyKey(*manager, old_key.key_id);

    auto rotated = manager->RotateKey(old_key.key_id, {"", "", {}});
    REQUIRE(rotated.IsOk());
    const auto new_key = rotated.Unwrap();

    SECTION("Successor links and generations") {
        REQUIRE(new_key.status == KeyStatus::Active);
        REQUIRE(new_key.generation == old_key.generation + 1);
        REQUIRE(new_key.predecessor_id == old_key.key_id);
        REQUIRE(new_key.model_id == "model_r");
        REQUIRE(new_key.labels.at("env") == "prod");
        const auto old_now = manager->GetKey(old_key.key_id).value();
        REQUIRE(old_now.status == KeyStatus::Deprecated);
        REQUIRE(old_now.successor_id == new_key.key_id);
        REQUIRE(CopyKey(*manager, new_key.key_id) != old_bytes);
    }
    SECTION("History records the event") {
        const auto history = manager->GetRotationHistory(old_key.key_id);
        REQUIRE(history.size() == 1);
        REQUIRE(history[0].new_key_id == new_key.key_id);
        REQUIRE(history[0].status == RotationStatus::Completed);
        REQUIRE(manager->GetRotationHistory(new_key.key_id).size() == 1);
    }
    SECTION("Old key stays usable during the overlap and expires after it") {
        clock->Advance(std::chrono::minutes(59));
        REQUIRE(CopyKey(*manager, old_key.key_id) == old_bytes);
        clock->Advance(std::chrono::minutes(2));
        REQUIRE(manager->GetKey(old_key.key_id)->status == KeyStatus::Expired);
        REQUIRE(UseFailure(*manager, old_key.key_id) == TransferFailureType::KeyExpired);
        REQUIRE(CopyKeyForDecrypt(*manager, old_key.key_id) == old_bytes);
        REQUIRE(manager->CleanupExpiredKeys() == 1);
        REQUIRE_FALSE(manager->GetKey(old_key.key_id).has_value());
        REQUIRE(CopyKeyForDecrypt(*manager, old_key.key_id).empty());
        REQUIRE(manager->GetKey(new_key.key_id)->status == KeyStatus::Active);
    }
    SECTION("A deprecated key cannot be rotated again") {
        auto again = manager->RotateKey(old_key.key_id, {"", "", {}});
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == TransferFailureType::RotationFailed);
    }
    SECTION("Revoked key cannot be rotated") {
        REQUIRE(manager->RevokeKey(new_key.key_id, "test"));
        auto again = manager->RotateKey(new_key.key_id, {"", "", {}});
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == TransferFailureType::RotationFailed);
    }
    SECTION("Only one successor is ever Active") {
        const auto active = manager->ListActiveKeys("model_r");
        REQUIRE(active.size() == 1);
        REQUIRE(active[0].key_id == new_key.key_id);
    }
}

TEST_CASE("KeyManager - Rotation of hardware-bound keys", "[keys][rotation][hardware]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto notifier = std::make_shared<RecordingNotifier>();
    auto created = KeyManager::Create(
        configuration::KeyLifecycleConfig::ForTesting(dir.Path()),
        std::make_shared<FakeHardwareIdentity>("machine-a"),
        std::make_shared<DeviceStorageKeyProvider>(dir.Path()),
        nullptr,
        notifier);
    REQUIRE(created.IsOk());
    auto manager = std::move(created).Unwrap();
    const auto key = manager->GenerateHardwareBoundKey({"model_h", "licence", {}}).Unwrap();

    SECTION("Secret is needed for the successor; old key stays Active") {
        auto rotated = manager->RotateKey(key.key_id, {"", "", {}});
        REQUIRE(rotated.IsErr());
        REQUIRE(rotated.UnwrapErr().type == TransferFailureType::RotationFailed);
        REQUIRE(manager->GetKey(key.key_id)->status == KeyStatus::Active);
        const auto history = manager->GetRotationHistory(key.key_id);
        REQUIRE(history.size() == 1);
        REQUIRE(history[0].status == RotationStatus::Failed);
    }
    SECTION("Targets are notified; a failing target does not undo the rotation") {
        auto rotated = manager->RotateKey(key.key_id, {"", "licence", {}}, {"sink-1", "unreachable"});
        REQUIRE(rotated.IsOk());
        REQUIRE(rotated.Unwrap().origin == KeyOrigin::HardwareBound);
        REQUIRE(notifier->targets.size() == 2);
        const auto history = manager->GetRotationHistory(key.key_id);
        REQUIRE(history.back().notified_targets == std::vector<std::string>{"sink-1"});
    }
}

TEST_CASE("KeyManager - Revocation and retirement", "[keys][revocation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto manager = MakeKeyManager(dir.Path(), std::make_shared<FakeHardwareIdentity>("machine-a"));
    REQUIRE(manager);
    const auto key = manager->GenerateRandomKey({"model_v", "", {}}).Unwrap();

    SECTION("Revocation is immediate and irreversible") {
        REQUIRE(manager->RevokeKey(key.key_id, "leaked"));
        REQUIRE(manager->IsRevoked(key.key_id));
        REQUIRE(UseFailure(*manager, key.key_id) == TransferFailureType::KeyRevoked);
        REQUIRE(manager->RevokeKey(key.key_id, "again"));
        REQUIRE(manager->GetKey(key.key_id)->revocation_reason == "leaked");
        REQUIRE_FALSE(manager->ValidateHardwareBinding(key.key_id));
        REQUIRE(manager->RetireKey(key.key_id).IsErr());
    }
    SECTION("Unknown key cannot be revoked") {
        REQUIRE_FALSE(manager->RevokeKey("missing", "x"));
    }
    SECTION("Revocation during use is reported by the running operation") {
        auto result = manager->ExecuteWithKey(key.key_id, [&](std::span<const uint8_t>) {
            manager->RevokeKey(key.key_id, "mid-operation");
            return Result<Unit, TransferFailure>::Ok(unit);
        });
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::KeyRevoked);
    }
    SECTION("Retire deprecates an Active key") {
        REQUIRE(manager->RetireKey(key.key_id).IsOk());
        REQUIRE(manager->GetKey(key.key_id)->status == KeyStatus::Deprecated);
        REQUIRE(CopyKey(*manager, key.key_id).size() == 32);
        REQUIRE(manager->RetireKey(key.key_id).IsErr());
    }
    SECTION("Revoked keys cannot be exported") {
        REQUIRE(manager->RevokeKey(key.key_id, "leaked"));
        const std::vector<uint8_t> secret(32, 0x01);
        auto package = manager->ExportForDistribution(key.key_id, "node-b", secret);
        REQUIRE(package.IsErr());
        REQUIRE(package.UnwrapErr().type == TransferFailureType::KeyRevoked);
    }
}

TEST_CASE("KeyManager - Lifetime expiry and cleanup", "[keys][expiry]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto clock = std::make_shared<ManualClock>();
    auto manager = MakeKeyManager(dir.Path(), std::make_shared<FakeHardwareIdentity>("machine-a"), clock);
    REQUIRE(manager);
    const auto key = manager->GenerateRandomKey({"model_e", "", {}}).Unwrap();

    REQUIRE(manager->CleanupExpiredKeys() == 0);
    clock->Advance(std::chrono::hours(24 * 31));
    REQUIRE(manager->GetKey(key.key_id)->status == KeyStatus::Expired);
    REQUIRE(UseFailure(*manager, key.key_id) == TransferFailureType::KeyExpired);
    REQUIRE(manager->ListActiveKeys().empty());
    REQUIRE(CopyKeyForDecrypt(*manager, key.key_id).size() == kAesKeyBytes);
    REQUIRE(manager->CleanupExpiredKeys() == 1);
    REQUIRE_FALSE(manager->GetKey(key.key_id).has_value());
    REQUIRE(UseFailure(*manager, key.key_id) == TransferFailureType::NotFound);
}

TEST_CASE("KeyManager - Expired keys stay decrypt-only until purged", "[keys][expiry]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto clock = std::make_shared<ManualClock>();
    const auto config = configuration::KeyLifecycleConfig::ForTesting(dir.Path())
        .WithKeyLifetime(std::chrono::hours(1))
        .WithKeyRetention(std::chrono::hours(2));
    auto open = [&]() {
        return std::shared_ptr<KeyManager>(KeyManager::Create(
            config, std::make_shared<FakeHardwareIdentity>("machine-a"),
            std::make_shared<DeviceStorageKeyProvider>(dir.Path()), clock).Unwrap());
    };
    auto manager = open();
    const auto key = manager->GenerateRandomKey({"model_x", "", {}}).Unwrap();
    const auto bytes = CopyKey(*manager, key.key_id);
    REQUIRE(bytes.size() == kAesKeyBytes);

    clock->Advance(std::chrono::minutes(61));
    REQUIRE(manager->CleanupExpiredKeys() == 0);
    REQUIRE(manager->GetKey(key.key_id)->status == KeyStatus::Expired);
    REQUIRE(UseFailure(*manager, key.key_id) == TransferFailureType::KeyExpired);
    REQUIRE(CopyKeyForDecrypt(*manager, key.key_id) == bytes);

    SECTION("Material survives a restart inside the retention window") {
        manager.reset();
        auto reopened = open();
        REQUIRE(reopened->GetKey(key.key_id)->status == KeyStatus::Expired);
        REQUIRE(UseFailure(*reopened, key.key_id) == TransferFailureType::KeyExpired);
        REQUIRE(CopyKeyForDecrypt(*reopened, key.key_id) == bytes);
    }
    SECTION("Purge after retention erases the key") {
        clock->Advance(std::chrono::hours(2));
        REQUIRE(manager->CleanupExpiredKeys() == 1);
        REQUIRE_FALSE(manager->GetKey(key.key_id).has_value());
        auto refused = manager->ExecuteWithKeyForDecrypt(key.key_id, [](std::span<const uint8_t>) {
            return Result<Unit, TransferFailure>::Ok(unit);
        });
        REQUIRE(refused.IsErr());
        REQUIRE(refused.UnwrapErr().type == TransferFailureType::NotFound);
    }
    SECTION("Revocation ends decryption at once") {
        REQUIRE(manager->RevokeKey(key.key_id, "leaked"));
        auto refused = manager->ExecuteWithKeyForDecrypt(key.key_id, [](std::span<const uint8_t>) {
            return Result<Unit, TransferFailure>::Ok(unit);
        });
        REQUIRE(refused.IsErr());
        REQUIRE(refused.UnwrapErr().type == TransferFailureType::KeyRevoked);
    }
}

TEST_CASE("KeyManager - Distribution between nodes", "[keys][distribution]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir_a;
    TempDirectory dir_b;
    auto node_a = MakeKeyManager(dir_a.Path(), std::make_shared<FakeHardwareIdentity>("machine-a"));
    auto node_b = MakeKeyManager(dir_b.Path(), std::make_shared<FakeHardwareIdentity>("machine-b"));
    REQUIRE(node_a);
    REQUIRE(node_b);
    const auto key = node_a->GenerateRandomKey({"model_d", "", {}}).Unwrap();
    const std::vector<uint8_t> wrap_secret(32, 0x7E);

    auto package = node_a->ExportForDistribution(key.key_id, "node-b", wrap_secret);
    REQUIRE(package.IsOk());

    SECTION("Import installs the same material") {
        auto imported = node_b->ImportDistributedKey(package.Unwrap(), wrap_secret);
        REQUIRE(imported.IsOk());
        REQUIRE(imported.Unwrap().key_id == key.key_id);
        REQUIRE(imported.Unwrap().origin == KeyOrigin::Imported);
        REQUIRE(CopyKey(*node_b, key.key_id) == CopyKey(*node_a, key.key_id));
    }
    SECTION("Concurrent imports of one package install it once") {
        constexpr int THREAD_COUNT = 4;
        std::atomic<int> installed{0};
        std::atomic<int> duplicates{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                auto imported = node_b->ImportDistributedKey(package.Unwrap(), wrap_secret);
                if (imported.IsOk()) {
                    installed.fetch_add(1);
                } else if (imported.UnwrapErr().type == TransferFailureType::InvalidState) {
                    duplicates.fetch_add(1);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(installed.load() == 1);
        REQUIRE(duplicates.load() == THREAD_COUNT - 1);
        REQUIRE(CopyKey(*node_b, key.key_id) == CopyKey(*node_a, key.key_id));
    }
    SECTION("Wrong wrapping secret is rejected") {
        const std::vector<uint8_t> wrong(32, 0x7F);
        REQUIRE(node_b->ImportDistributedKey(package.Unwrap(), wrong).IsErr());
        REQUIRE_FALSE(node_b->GetKey(key.key_id).has_value());
    }
    SECTION("Package for another recipient does not open") {
        auto altered = package.Unwrap();
        altered.set_recipient_id("node-c");
        REQUIRE(node_b->ImportDistributedKey(altered, wrap_secret).IsErr());
    }
    SECTION("Short wrapping secret is refused on export") {
        const std::vector<uint8_t> short_secret(8, 0x01);
        REQUIRE(node_a->ExportForDistribution(key.key_id, "node-b", short_secret).IsErr());
    }
}
