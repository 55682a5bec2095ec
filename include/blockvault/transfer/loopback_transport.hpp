#pragma once
#include "blockvault/interfaces/i_block_transport.hpp"
#include "blockvault/transfer/block_receiver.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace blockvault::transfer {

/// In-process transport: serializes every message to bytes and hands them
/// to a BlockReceiver. Faults can be injected for block messages.
class LoopbackTransport final : public interfaces::IBlockTransport {
public:
    struct FaultPlan {
        /// Every Nth block send is lost (0 = never).
        uint32_t fail_every_nth_block = 0;
        /// Every Nth block send arrives with a flipped ciphertext byte (0 = never).
        uint32_t corrupt_every_nth_block = 0;
        /// Simulated round trip; longer than the ack timeout means a lost ack.
        std::chrono::milliseconds latency{0};
    };

    explicit LoopbackTransport(std::shared_ptr<BlockReceiver> receiver);
    LoopbackTransport(std::shared_ptr<BlockReceiver> receiver, FaultPlan plan);

    [[nodiscard]] Result<proto::transfer::DeliveryAck, TransferFailure> Deliver(
        const proto::transfer::TransferMessage& message,
        std::chrono::milliseconds ack_timeout) override;

    [[nodiscard]] uint64_t BlockSends() const noexcept { return block_sends_.load(); }
    [[nodiscard]] uint64_t InjectedFailures() const noexcept { return injected_failures_.load(); }

private:
    std::shared_ptr<BlockReceiver> receiver_;
    FaultPlan plan_;
    std::atomic<uint64_t> block_sends_{0};
    std::atomic<uint64_t> injected_failures_{0};
};

}  // namespace blockvault::transfer
