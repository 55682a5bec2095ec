#include <catch2/catch_test_macros.hpp>
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/transfer/block_codec.hpp"
#include "blockvault/transfer/nonce.hpp"
#include "blockvault/transfer/session_store.hpp"
#include "helpers/transfer_harness.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <future>
#include <iterator>
#include <mutex>
#include <thread>
using namespace blockvault;
using namespace blockvault::transfer;
using namespace blockvault::test_helpers;
using blockvault::crypto::SodiumInterop;
using configuration::TransferConfig;
using std::chrono::milliseconds;

namespace {
    constexpr size_t kMiB = 1024 * 1024;
    constexpr size_t kBlock = 4096;
    constexpr auto kWait = std::chrono::seconds(60);
}

TEST_CASE("Transfer workflow - Ten blocks over a lossy link", "[integration][transfer]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    LoopbackTransport::FaultPlan plan;
    plan.fail_every_nth_block = 3;
    TransferHarness h(plan);
    auto manager = h.MakeManager(TransferConfig::Default()
        .WithBlockWindow(1)
        .WithRetryDelays(milliseconds(250), milliseconds(5000)));
    auto events = std::make_shared<RecordingEventHandler>();
    manager->AddEventHandler(events);
    std::atomic<double> last_progress{0.0};
    manager->AddProgressCallback([&last_progress](const std::string&, const double percentage) {
        last_progress.store(percentage);
    });

    const auto artifact = MakeArtifact(10 * kMiB, 7);
    const auto id = manager->StartSession(MakeRequest(artifact, kMiB)).Unwrap();
    REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);
    manager->FlushNotifications();

    REQUIRE(h.sink->Assemble(id) == artifact);
    REQUIRE(h.loopback->InjectedFailures() == 4);
    const auto stats = manager->GetStatistics();
    REQUIRE(stats.blocks_transferred == 10);
    REQUIRE(stats.bytes_transferred == 10 * kMiB);
    REQUIRE(stats.retry_attempts == 4);
    REQUIRE(stats.sessions_completed == 1);
    REQUIRE(h.scheduler->Delays() == std::vector<milliseconds>(4, milliseconds(250)));
    REQUIRE(last_progress.load() == 100.0);
    REQUIRE(events->Completed() == std::vector<std::string>{id});
    REQUIRE(events->Retries() == 4);
    REQUIRE(manager->GetProgress(id) == 100.0);

    const auto sink_session = h.receiver->GetSession(id);
    REQUIRE(sink_session.has_value());
    REQUIRE(sink_session->closed);
    for (uint32_t index = 0; index < 10; ++index) {
        REQUIRE(h.transport->AcceptedSends(id, index) == 1);
    }
}

TEST_CASE("Transfer workflow - Progress follows every block transition", "[integration][transfer][progress]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TransferHarness h;
    auto manager = h.MakeManager(TransferConfig::Default().WithBlockWindow(1));
    std::mutex seen_lock;
    std::condition_variable seen_cv;
    std::vector<double> seen;
    manager->AddProgressCallback([&](const std::string&, const double percentage) {
        std::lock_guard<std::mutex> guard(seen_lock);
        seen.push_back(percentage);
        seen_cv.notify_all();
    });

    // The first block is held at the sink until its claim has been reported.
    std::atomic<bool> claim_reported{false};
    std::atomic<bool> held{false};
    h.transport->OnDelivered([&](const RecordingTransport::Delivery& delivery) {
        if (delivery.kind != TransferMessage::kBlock || held.exchange(true)) {
            return;
        }
        std::unique_lock<std::mutex> guard(seen_lock);
        const bool reported = seen_cv.wait_for(guard, std::chrono::seconds(10), [&] { return !seen.empty(); });
        claim_reported.store(reported && seen.front() == 0.0);
    });

    const auto artifact = MakeArtifact(4 * kBlock, 17);
    const auto id = manager->StartSession(MakeRequest(artifact, kBlock)).Unwrap();
    REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);
    manager->FlushNotifications();

    REQUIRE(claim_reported.load());
    std::lock_guard<std::mutex> guard(seen_lock);
    REQUIRE(seen.back() == 100.0);
    REQUIRE(std::is_sorted(seen.begin(), seen.end()));
}

TEST_CASE("Transfer workflow - Files on both ends", "[integration][transfer][io]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory files;
    const auto input = files.Path() / "model.bin";
    const auto artifact = MakeArtifact(5 * kBlock + 123, 3);
    {
        std::ofstream out(input, std::ios::binary);
        out.write(reinterpret_cast<const char*>(artifact.data()), static_cast<std::streamsize>(artifact.size()));
    }

    TransferHarness h;
    auto file_sink = FileBlockSink::Open(files.Path() / "received").Unwrap();
    std::shared_ptr<FileBlockSink> sink(std::move(file_sink));
    auto receiver = std::make_shared<BlockReceiver>(h.keys, sink);
    auto transport = std::make_shared<LoopbackTransport>(receiver);
    auto manager = SecureBlockTransferManager::Create(
        TransferConfig::Default(), h.keys, transport, h.SessionDirectory(), h.scheduler).Unwrap();

    StartSessionRequest request;
    request.artifact_id = "model.bin";
    request.blocks = ArtifactChunker::Describe(input, kBlock).Unwrap();
    request.block_source = std::shared_ptr<FileBlockSource>(FileBlockSource::Open(input).Unwrap());
    const auto id = manager->StartSession(std::move(request)).Unwrap();
    REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);

    const auto output = files.Path() / "model.out";
    REQUIRE(sink->AssembleArtifact(id, 6, output).IsOk());
    std::ifstream in(output, std::ios::binary);
    const std::vector<uint8_t> received((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(received == artifact);
}

TEST_CASE("Transfer workflow - Crash and resume", "[integration][transfer][resume]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TransferHarness h;
    const auto config = TransferConfig::Default().WithBlockWindow(1);
    const auto artifact = MakeArtifact(10 * kBlock, 11);
    std::string id;

    {
        auto first = h.MakeManager(config);
        std::atomic<bool> paused{false};
        auto* first_ptr = first.get();
        h.transport->OnDelivered([&](const RecordingTransport::Delivery& delivery) {
            if (delivery.kind == TransferMessage::kBlock && delivery.block_index == 3 && !paused.exchange(true)) {
                first_ptr->PauseSession(delivery.session_id);
            }
        });
        id = first->StartSession(MakeRequest(artifact, kBlock)).Unwrap();
        REQUIRE(first->WaitForSession(id, kWait) == SessionStatus::Paused);
        h.transport->OnDelivered(nullptr);
        first->Shutdown();
    }

    // Rewrite the record as a process killed mid-attempt would leave it.
    {
        auto store = SessionStore::Open(h.SessionDirectory()).Unwrap();
        auto record = store->Load(id).Unwrap();
        REQUIRE(record.blocks(3).status() == proto::transfer::BLOCK_COMPLETED);
        REQUIRE(record.blocks(4).status() == proto::transfer::BLOCK_PENDING);
        record.set_status(proto::transfer::SESSION_ACTIVE);
        record.mutable_blocks(4)->set_status(proto::transfer::BLOCK_VERIFYING);
        REQUIRE(store->Save(record).IsOk());
    }

    auto second = h.MakeManager(config);
    REQUIRE(second->LoadPersistedSessions().Unwrap() == 1);
    const auto recovered = second->GetSessionReport(id);
    REQUIRE(recovered.has_value());
    REQUIRE(recovered->status == SessionStatus::Paused);
    REQUIRE(recovered->completed_blocks == 4);
    REQUIRE(second->GetBlocks(id)[4].status == BlockStatus::Pending);

    SECTION("Resume needs the block source again") {
        REQUIRE_FALSE(second->ResumeTransfer(id));
    }
    SECTION("Completed blocks are never sent twice") {
        REQUIRE(second->AttachBlockSource(id, std::make_shared<MemoryBlockSource>(artifact)).IsOk());
        REQUIRE(second->ResumeTransfer(id));
        REQUIRE(second->WaitForSession(id, kWait) == SessionStatus::Completed);
        REQUIRE(h.sink->Assemble(id) == artifact);
        for (uint32_t index = 0; index < 10; ++index) {
            REQUIRE(h.transport->AcceptedSends(id, index) == 1);
            REQUIRE(h.sink->WriteCount(id, index) == 1);
        }
        REQUIRE(second->GetSessionReport(id)->resume_count == 1);
        REQUIRE(second->GetStatistics().blocks_transferred == 6);
    }
}

TEST_CASE("Transfer workflow - Pause, resume and cancel", "[integration][transfer]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto artifact = MakeArtifact(8 * kBlock, 5);

    SECTION("Pause then resume completes without resending") {
        TransferHarness h;
        auto manager = h.MakeManager(TransferConfig::Default().WithBlockWindow(2));
        std::atomic<bool> paused{false};
        auto* manager_ptr = manager.get();
        h.transport->OnDelivered([&](const RecordingTransport::Delivery& delivery) {
            if (delivery.kind == TransferMessage::kBlock && !paused.exchange(true)) {
                manager_ptr->PauseSession(delivery.session_id);
            }
        });
        const auto id = manager->StartSession(MakeRequest(artifact, kBlock)).Unwrap();
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Paused);
        REQUIRE(manager->GetProgress(id).value() < 100.0);
        REQUIRE_FALSE(manager->PauseSession(id));

        REQUIRE(manager->ResumeTransfer(id));
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);
        REQUIRE(h.sink->Assemble(id) == artifact);
        for (uint32_t index = 0; index < 8; ++index) {
            REQUIRE(h.transport->AcceptedSends(id, index) == 1);
        }
        REQUIRE_FALSE(manager->ResumeTransfer(id));
        REQUIRE_FALSE(manager->CancelSession(id));
    }

    SECTION("Cancel interrupts a backoff wait") {
        LoopbackTransport::FaultPlan plan;
        plan.fail_every_nth_block = 1;
        TransferHarness h(plan);
        auto manager = h.MakeManager(
            TransferConfig::Default().WithRetryDelays(milliseconds(30'000), milliseconds(30'000)),
            std::make_shared<interfaces::ConditionDelayScheduler>());
        const auto id = manager->StartSession(MakeRequest(artifact, kBlock)).Unwrap();

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        bool waiting = false;
        while (!waiting && std::chrono::steady_clock::now() < deadline) {
            for (const auto& block : manager->GetBlocks(id)) {
                waiting = waiting || block.retry_count > 0;
            }
            std::this_thread::sleep_for(milliseconds(5));
        }
        REQUIRE(waiting);

        const auto started = std::chrono::steady_clock::now();
        REQUIRE(manager->CancelSession(id, "operator abort"));
        REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Cancelled);
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
        REQUIRE_FALSE(h.receiver->GetSession(id).has_value());
        REQUIRE(manager->GetStatistics().sessions_cancelled == 1);
        for (const auto& block : manager->GetBlocks(id)) {
            REQUIRE(block.status != BlockStatus::InFlight);
            REQUIRE(block.status != BlockStatus::Verifying);
        }
    }

    SECTION("A queued session can be cancelled before it runs") {
        TransferHarness h;
        auto manager = h.MakeManager(TransferConfig::Default().WithMaxConcurrentSessions(1));
        std::promise<void> release;
        auto released = release.get_future().share();
        h.transport->OnDelivered([released](const RecordingTransport::Delivery& delivery) {
            if (delivery.kind == TransferMessage::kOpen) {
                released.wait();
            }
        });
        const auto first = manager->StartSession(MakeRequest(artifact, kBlock)).Unwrap();
        const auto second = manager->StartSession(MakeRequest(artifact, kBlock)).Unwrap();
        REQUIRE(manager->CancelSession(second));
        release.set_value();
        REQUIRE(manager->WaitForSession(first, kWait) == SessionStatus::Completed);
        REQUIRE(manager->WaitForSession(second, kWait) == SessionStatus::Cancelled);
        REQUIRE(h.transport->AcceptedSends(second, 0) == 0);
    }
}

TEST_CASE("Transfer workflow - Resume budget", "[integration][transfer][resume]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    LoopbackTransport::FaultPlan plan;
    plan.fail_every_nth_block = 1;
    TransferHarness h(plan);
    auto manager = h.MakeManager(TransferConfig::Default().WithMaxResumeAttempts(1));
    const auto id = manager->StartSession(MakeRequest(MakeArtifact(kBlock), kBlock)).Unwrap();
    REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);

    REQUIRE(manager->GetBlocks(id)[0].retry_count == 3);
    REQUIRE(manager->ResumeTransfer(id));
    REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Failed);
    REQUIRE(manager->GetBlocks(id)[0].retry_count == 3);
    REQUIRE(h.loopback->InjectedFailures() == 6);

    REQUIRE_FALSE(manager->ResumeTransfer(id));
    REQUIRE(manager->GetSessionReport(id)->status == SessionStatus::Cancelled);
}

TEST_CASE("Transfer workflow - Rotation during a transfer", "[integration][transfer][rotation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto clock = std::make_shared<ManualClock>();
    TransferHarness h({}, clock, std::chrono::hours(1));
    auto manager = h.MakeManager(TransferConfig::Default().WithBlockWindow(1));
    const auto artifact = MakeArtifact(6 * kBlock, 9);
    const auto old_key = h.NewKey("model-r");

    auto nonces = NonceGenerator::Create("rotation-check").Unwrap();
    const std::vector<uint8_t> sample(256, 0x3C);
    const auto sealed_before = BlockCodec::SealBlock(*h.keys, "rotation-check", old_key, 0, nonces.Next().Unwrap(), sample).Unwrap();

    std::string new_key;
    std::atomic<bool> rotated{false};
    h.transport->OnDelivered([&](const RecordingTransport::Delivery& delivery) {
        if (delivery.kind == TransferMessage::kBlock && delivery.block_index == 1 && !rotated.exchange(true)) {
            auto result = h.keys->RotateKey(old_key, {"", "", {{"reason", "scheduled"}}});
            if (result.IsOk()) {
                new_key = result.Unwrap().key_id;
            }
        }
    });

    const auto id = manager->StartSession(MakeRequest(artifact, kBlock, old_key)).Unwrap();
    REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);
    REQUIRE(h.sink->Assemble(id) == artifact);
    REQUIRE_FALSE(new_key.empty());
    REQUIRE(h.keys->GetKey(old_key)->status == keys::KeyStatus::Deprecated);
    REQUIRE(h.keys->GetRotationHistory(old_key).front().reason == "scheduled");

    SECTION("New sessions must use the successor") {
        auto refused = manager->StartSession(MakeRequest(artifact, kBlock, old_key));
        REQUIRE(refused.IsErr());
        const auto next = manager->StartSession(MakeRequest(artifact, kBlock, new_key)).Unwrap();
        REQUIRE(manager->WaitForSession(next, kWait) == SessionStatus::Completed);
    }
    SECTION("Old ciphertext opens after the overlap until the key is purged") {
        REQUIRE(BlockCodec::OpenBlock(*h.keys, sealed_before).Unwrap() == sample);
        clock->Advance(std::chrono::minutes(61));
        auto resealed = BlockCodec::SealBlock(*h.keys, "rotation-check", old_key, 1, nonces.Next().Unwrap(), sample);
        REQUIRE(resealed.IsErr());
        REQUIRE(resealed.UnwrapErr().type == TransferFailureType::KeyExpired);
        REQUIRE(BlockCodec::OpenBlock(*h.keys, sealed_before).Unwrap() == sample);

        REQUIRE(h.keys->CleanupExpiredKeys() == 1);
        auto opened = BlockCodec::OpenBlock(*h.keys, sealed_before);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::NotFound);
    }
}

TEST_CASE("Transfer workflow - Housekeeping", "[integration][transfer]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TransferHarness h;
    auto manager = h.MakeManager(TransferConfig::Default()
        .WithSessionRetention(milliseconds(0))
        .WithRetireKeyOnCompletion(true));
    const auto id = manager->StartSession(MakeRequest(MakeArtifact(2 * kBlock), kBlock)).Unwrap();
    REQUIRE(manager->WaitForSession(id, kWait) == SessionStatus::Completed);

    const auto report = manager->GetSessionReport(id).value();
    REQUIRE(report.completed_at.has_value());
    REQUIRE(h.keys->GetKey(report.key_id)->status == keys::KeyStatus::Deprecated);
    REQUIRE(h.keys->GetKey(report.key_id)->labels.at("purpose") == "block-transfer");
    REQUIRE(manager->ListSessions().size() == 1);

    REQUIRE(manager->EvictExpiredSessions() == 1);
    REQUIRE_FALSE(manager->GetSessionReport(id).has_value());
    REQUIRE(manager->ListSessions().empty());

    auto restarted = h.MakeManager(TransferConfig::Default());
    REQUIRE(restarted->LoadPersistedSessions().Unwrap() == 0);

    manager->Shutdown();
    auto refused = manager->StartSession(MakeRequest(MakeArtifact(kBlock), kBlock));
    REQUIRE(refused.IsErr());
    REQUIRE(refused.UnwrapErr().type == TransferFailureType::InvalidState);
}
