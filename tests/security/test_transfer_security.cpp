#include <catch2/catch_test_macros.hpp>
#include "blockvault/crypto/sodium_interop.hpp"
#include "helpers/transfer_harness.hpp"
#include <atomic>
using namespace blockvault;
using namespace blockvault::transfer;
using namespace blockvault::test_helpers;
using blockvault::crypto::SodiumInterop;
using configuration::TransferConfig;
using std::chrono::milliseconds;

namespace {
    constexpr size_t kBlock = 4096;
    constexpr auto kWait = std::chrono::seconds(30);

    TransferConfig SerialConfig() {
        return TransferConfig::Default()
            .WithBlockWindow(1)
            .WithRetryDelays(milliseconds(100), milliseconds(10'000));
    }
}

TEST_CASE("Transfer security - Tampered blocks", "[security][transfer][integrity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Occasional tampering is retried and never reaches the sink") {
        LoopbackTransport::FaultPlan plan;
        plan.corrupt_every_nth_block = 2;
        TransferHarness h(plan);
        auto manager = h.MakeManager(SerialConfig());
        const auto artifact = MakeArtifact(6 * kBlock);

        const auto id = manager->StartSession(MakeRequest(artifact, kBlock)).Unwrap();
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);
        REQUIRE(h.sink->Assemble(id) == artifact);
        const auto stats = manager->GetStatistics();
        REQUIRE(stats.integrity_failures > 0);
        REQUIRE(stats.integrity_failures == h.loopback->InjectedFailures());
        for (uint32_t index = 0; index < 6; ++index) {
            REQUIRE(h.sink->WriteCount(id, index) == 1);
        }
    }

    SECTION("Persistent tampering exhausts the retries") {
        LoopbackTransport::FaultPlan plan;
        plan.corrupt_every_nth_block = 1;
        TransferHarness h(plan);
        auto manager = h.MakeManager(SerialConfig());
        const auto artifact = MakeArtifact(kBlock);

        const auto id = manager->StartSession(MakeRequest(artifact, kBlock)).Unwrap();
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);

        const auto report = manager->GetSessionReport(id).value();
        REQUIRE(report.failure.has_value());
        REQUIRE(report.failure->type == TransferFailureType::RetriesExhausted);
        const auto blocks = manager->GetBlocks(id);
        REQUIRE(blocks[0].status == BlockStatus::Failed);
        REQUIRE(blocks[0].retry_count == 3);
        REQUIRE(blocks[0].last_error.has_value());
        REQUIRE_FALSE(h.sink->HasBlock(id, 0));
        REQUIRE(h.scheduler->Delays() == std::vector<milliseconds>{milliseconds(100), milliseconds(200)});
    }

    SECTION("A source that no longer matches its digest is an integrity failure") {
        TransferHarness h;
        auto manager = h.MakeManager(SerialConfig());
        const auto artifact = MakeArtifact(2 * kBlock);
        auto request = MakeRequest(artifact, kBlock);
        auto source = std::make_shared<MemoryBlockSource>(artifact);
        source->CorruptByte(kBlock + 3);
        request.block_source = source;

        const auto id = manager->StartSession(std::move(request)).Unwrap();
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);
        REQUIRE(h.sink->HasBlock(id, 0));
        REQUIRE_FALSE(h.sink->HasBlock(id, 1));
        REQUIRE(h.transport->AcceptedSends(id, 1) == 0);
    }
}

TEST_CASE("Transfer security - Key lifecycle failures are fatal", "[security][transfer][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Revocation mid-transfer stops the session without retries") {
        TransferHarness h;
        auto manager = h.MakeManager(SerialConfig());
        const auto artifact = MakeArtifact(6 * kBlock);
        const auto key_id = h.NewKey();
        std::atomic<bool> revoked{false};
        h.transport->OnDelivered([&](const RecordingTransport::Delivery& delivery) {
            if (delivery.kind == TransferMessage::kBlock && delivery.block_index == 2 &&
                delivery.ack == proto::transfer::ACK_ACCEPTED && !revoked.exchange(true)) {
                h.keys->RevokeKey(key_id, "compromised");
            }
        });

        const auto id = manager->StartSession(MakeRequest(artifact, kBlock, key_id)).Unwrap();
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);

        const auto report = manager->GetSessionReport(id).value();
        REQUIRE(report.failure->type == TransferFailureType::KeyRevoked);
        const auto blocks = manager->GetBlocks(id);
        REQUIRE(blocks[2].status == BlockStatus::Completed);
        REQUIRE(blocks[3].status == BlockStatus::Failed);
        REQUIRE(blocks[3].retry_count == 0);
        REQUIRE(blocks[3].last_error->type == TransferFailureType::KeyRevoked);
        REQUIRE(h.scheduler->Delays().empty());
        REQUIRE(manager->GetStatistics().retry_attempts == 0);
        REQUIRE(h.transport->AcceptedSends(id, 3) == 0);

        SECTION("Resuming on the revoked key fails again") {
            REQUIRE(manager->ResumeTransfer(id));
            REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);
            REQUIRE(manager->GetSessionReport(id)->failure->type == TransferFailureType::KeyRevoked);
        }
        SECTION("A replacement key finishes the transfer") {
            REQUIRE(manager->ReplaceSessionKey(id, key_id).IsErr());
            const auto fresh = h.NewKey();
            REQUIRE(manager->ReplaceSessionKey(id, fresh).IsOk());
            REQUIRE(manager->ResumeTransfer(id));
            REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);
            REQUIRE(h.sink->Assemble(id) == artifact);
            for (uint32_t index = 0; index < 6; ++index) {
                REQUIRE(h.transport->AcceptedSends(id, index) == 1);
            }
        }
    }

    SECTION("Key expiry mid-transfer is fatal") {
        auto clock = std::make_shared<ManualClock>();
        TransferHarness h({}, clock);
        auto manager = h.MakeManager(SerialConfig());
        const auto artifact = MakeArtifact(4 * kBlock);
        const auto key_id = h.NewKey();
        std::atomic<bool> advanced{false};
        h.transport->OnDelivered([&](const RecordingTransport::Delivery& delivery) {
            if (delivery.kind == TransferMessage::kBlock && delivery.block_index == 1 && !advanced.exchange(true)) {
                clock->Advance(std::chrono::hours(24 * 31));
            }
        });

        const auto id = manager->StartSession(MakeRequest(artifact, kBlock, key_id)).Unwrap();
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);
        REQUIRE(manager->GetSessionReport(id)->failure->type == TransferFailureType::KeyExpired);
        REQUIRE(manager->GetBlocks(id)[2].retry_count == 0);
        REQUIRE(h.scheduler->Delays().empty());
    }

    SECTION("Expired or revoked keys cannot start sessions") {
        TransferHarness h;
        auto manager = h.MakeManager(SerialConfig());
        const auto key_id = h.NewKey();
        REQUIRE(h.keys->RevokeKey(key_id, "test"));
        auto started = manager->StartSession(MakeRequest(MakeArtifact(kBlock), kBlock, key_id));
        REQUIRE(started.IsErr());
        REQUIRE(started.UnwrapErr().type == TransferFailureType::InvalidState);
        REQUIRE(manager->StartSession(MakeRequest(MakeArtifact(kBlock), kBlock, "missing")).IsErr());
    }
}

TEST_CASE("Transfer security - Hardware binding", "[security][transfer][hardware]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Hardware change during a transfer fails it at once") {
        TransferHarness h;
        auto manager = h.MakeManager(SerialConfig());
        const auto artifact = MakeArtifact(3 * kBlock);
        const auto key_id = h.keys->GenerateHardwareBoundKey({"model", "licence-key", {}}).Unwrap().key_id;
        std::atomic<bool> moved{false};
        h.transport->OnDelivered([&](const RecordingTransport::Delivery& delivery) {
            if (delivery.kind == TransferMessage::kBlock && !moved.exchange(true)) {
                h.identity->SetMachineId("machine-b");
            }
        });

        const auto id = manager->StartSession(MakeRequest(artifact, kBlock, key_id)).Unwrap();
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);
        REQUIRE(manager->GetSessionReport(id)->failure->type == TransferFailureType::HardwareMismatch);
        REQUIRE(manager->GetBlocks(id)[1].retry_count == 0);
        REQUIRE_FALSE(h.keys->ValidateHardwareBinding(key_id));
    }

    SECTION("A key store copied to another machine does not validate") {
        TempDirectory machine_a;
        TempDirectory machine_b;
        std::string key_id;
        {
            auto keys = MakeKeyManager(machine_a.Path(), std::make_shared<FakeHardwareIdentity>("machine-a"));
            REQUIRE(keys);
            key_id = keys->GenerateHardwareBoundKey({"model", "licence-key", {}}).Unwrap().key_id;
            REQUIRE(keys->ValidateHardwareBinding(key_id));
        }
        std::filesystem::copy(machine_a.Path(), machine_b.Path(),
            std::filesystem::copy_options::recursive | std::filesystem::copy_options::overwrite_existing);

        auto stolen = MakeKeyManager(machine_b.Path(), std::make_shared<FakeHardwareIdentity>("machine-b"));
        REQUIRE(stolen);
        REQUIRE(stolen->GetKey(key_id).has_value());
        REQUIRE_FALSE(stolen->ValidateHardwareBinding(key_id));
        auto used = stolen->ExecuteWithKey(key_id, [](std::span<const uint8_t>) {
            return Result<Unit, TransferFailure>::Ok(unit);
        });
        REQUIRE(used.IsErr());
        REQUIRE(used.UnwrapErr().type == TransferFailureType::HardwareMismatch);
    }
}
