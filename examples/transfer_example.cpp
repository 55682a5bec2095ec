/**
 * @file transfer_example.cpp
 * @brief Encrypts a file block by block and moves it through a loopback sink
 *
 * Usage: blockvault_transfer_example <input-file> [work-directory]
 */

#include "blockvault/configuration/key_lifecycle_config.hpp"
#include "blockvault/configuration/transfer_config.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/hardware/hardware_identity.hpp"
#include "blockvault/keys/device_storage_key_provider.hpp"
#include "blockvault/keys/key_manager.hpp"
#include "blockvault/transfer/block_io.hpp"
#include "blockvault/transfer/block_receiver.hpp"
#include "blockvault/transfer/loopback_transport.hpp"
#include "blockvault/transfer/secure_block_transfer_manager.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace blockvault;
using namespace blockvault::transfer;

namespace {
    constexpr size_t kExampleBlockSize = 256 * 1024;

    int Fail(const std::string& step, const TransferFailure& failure) {
        std::cerr << step << " failed: " << ToString(failure.type) << ": " << failure.message << std::endl;
        return 1;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <input-file> [work-directory]" << std::endl;
        return 2;
    }
    const std::filesystem::path input = argv[1];
    const std::filesystem::path work = argc > 2
        ? std::filesystem::path(argv[2])
        : std::filesystem::temp_directory_path() / "blockvault-example";

    std::cout << "=== BlockVault - Secure Block Transfer Example ===" << std::endl;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize libsodium: " << init.UnwrapErr().message << std::endl;
        return 1;
    }

    std::cout << "1. Opening key store in " << (work / "keys") << std::endl;
    auto key_manager_result = keys::KeyManager::Create(
        configuration::KeyLifecycleConfig::Default(work / "keys"),
        std::make_shared<hardware::SystemHardwareIdentity>(),
        std::make_shared<keys::DeviceStorageKeyProvider>(work / "keys"));
    if (key_manager_result.IsErr()) {
        return Fail("Key store", key_manager_result.UnwrapErr());
    }
    std::shared_ptr<keys::KeyManager> key_manager(std::move(key_manager_result).Unwrap());

    keys::KeyContext context;
    context.model_id = input.filename().string();
    context.labels["origin"] = "transfer-example";
    auto key = key_manager->GenerateRandomKey(context);
    if (key.IsErr()) {
        return Fail("Key generation", key.UnwrapErr());
    }
    std::cout << "   Key " << key.Unwrap().key_id << " (" << ToString(key.Unwrap().status) << ")" << std::endl;

    std::cout << "2. Chunking " << input << std::endl;
    auto blocks = ArtifactChunker::Describe(input, kExampleBlockSize);
    if (blocks.IsErr()) {
        return Fail("Chunking", blocks.UnwrapErr());
    }
    auto source = FileBlockSource::Open(input);
    if (source.IsErr()) {
        return Fail("Opening input", source.UnwrapErr());
    }
    const auto block_count = static_cast<uint32_t>(blocks.Unwrap().size());
    std::cout << "   " << block_count << " blocks of up to " << kExampleBlockSize << " bytes" << std::endl;

    auto sink_result = FileBlockSink::Open(work / "received");
    if (sink_result.IsErr()) {
        return Fail("Opening sink", sink_result.UnwrapErr());
    }
    std::shared_ptr<FileBlockSink> sink(std::move(sink_result).Unwrap());
    auto receiver = std::make_shared<BlockReceiver>(key_manager, sink);
    auto transport = std::make_shared<LoopbackTransport>(receiver);

    auto manager_result = SecureBlockTransferManager::Create(
        configuration::TransferConfig::Default(), key_manager, transport, work / "sessions");
    if (manager_result.IsErr()) {
        return Fail("Transfer manager", manager_result.UnwrapErr());
    }
    auto manager = std::move(manager_result).Unwrap();
    manager->AddProgressCallback([](const std::string& session_id, const double percentage) {
        std::cout << "   [" << session_id.substr(0, 8) << "] "
                  << std::fixed << std::setprecision(1) << percentage << "%" << std::endl;
    });

    std::cout << "3. Transferring" << std::endl;
    StartSessionRequest request;
    request.artifact_id = context.model_id;
    request.source_id = "example-sender";
    request.sink_id = "example-receiver";
    request.blocks = std::move(blocks).Unwrap();
    request.block_source = std::shared_ptr<FileBlockSource>(std::move(source).Unwrap());
    request.key_id = key.Unwrap().key_id;
    auto session_id = manager->StartSession(std::move(request));
    if (session_id.IsErr()) {
        return Fail("Starting session", session_id.UnwrapErr());
    }

    const auto status = manager->WaitForSession(session_id.Unwrap(), std::chrono::minutes(10));
    manager->FlushNotifications();
    if (status != SessionStatus::Completed) {
        const auto report = manager->GetSessionReport(session_id.Unwrap());
        if (report.has_value() && report->failure.has_value()) {
            return Fail("Transfer", *report->failure);
        }
        std::cerr << "Transfer did not complete" << std::endl;
        return 1;
    }

    const auto output = work / (context.model_id + ".received");
    if (auto assembled = sink->AssembleArtifact(session_id.Unwrap(), block_count, output); assembled.IsErr()) {
        return Fail("Assembling output", assembled.UnwrapErr());
    }

    const auto stats = manager->GetStatistics();
    std::cout << "4. Done: " << stats.blocks_transferred << " blocks, "
              << stats.bytes_transferred << " bytes, "
              << stats.retry_attempts << " retries" << std::endl;
    std::cout << "   Output written to " << output << std::endl;

    manager->Shutdown();
    return 0;
}
