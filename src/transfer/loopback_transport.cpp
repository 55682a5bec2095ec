#include "blockvault/transfer/loopback_transport.hpp"
#include "blockvault/core/atomic_file.hpp"
#include "blockvault/core/logging.hpp"

#include <algorithm>
#include <thread>

namespace blockvault::transfer {

    namespace {
        constexpr const char* kComponent = "LoopbackTransport";

        bool Hits(const uint32_t every_nth, const uint64_t sequence) {
            return every_nth != 0 && sequence % every_nth == 0;
        }
    }

    LoopbackTransport::LoopbackTransport(std::shared_ptr<BlockReceiver> receiver)
        : LoopbackTransport(std::move(receiver), FaultPlan{}) {}

    LoopbackTransport::LoopbackTransport(std::shared_ptr<BlockReceiver> receiver, FaultPlan plan)
        : receiver_(std::move(receiver))
        , plan_(plan) {}

    Result<proto::transfer::DeliveryAck, TransferFailure> LoopbackTransport::Deliver(
        const proto::transfer::TransferMessage& message,
        const std::chrono::milliseconds ack_timeout) {
        if (!receiver_) {
            return Result<proto::transfer::DeliveryAck, TransferFailure>::Err(
                TransferFailure::TransportError("No receiver attached"));
        }

        const proto::transfer::TransferMessage* outgoing = &message;
        proto::transfer::TransferMessage corrupted;
        if (message.body_case() == proto::transfer::TransferMessage::kBlock) {
            const uint64_t sequence = block_sends_.fetch_add(1) + 1;
            if (Hits(plan_.fail_every_nth_block, sequence)) {
                injected_failures_.fetch_add(1);
                BLOCKVAULT_LOG_DEBUG(kComponent, "Dropping send #{} (block {})",
                    sequence, message.block().block_index());
                return Result<proto::transfer::DeliveryAck, TransferFailure>::Err(
                    TransferFailure::TransportError(compat::format("Injected loss of send #{}", sequence)));
            }
            if (Hits(plan_.corrupt_every_nth_block, sequence) && !message.block().ciphertext().empty()) {
                injected_failures_.fetch_add(1);
                corrupted = message;
                (*corrupted.mutable_block()->mutable_ciphertext())[0] ^= 0x01;
                outgoing = &corrupted;
            }
        }

        if (plan_.latency.count() > 0) {
            std::this_thread::sleep_for(std::min(plan_.latency, ack_timeout));
            if (plan_.latency > ack_timeout) {
                return Result<proto::transfer::DeliveryAck, TransferFailure>::Err(
                    TransferFailure::TransportError(compat::format(
                        "No acknowledgment within {} ms", ack_timeout.count())));
            }
        }

        auto bytes = storage::SerializeDeterministic(*outgoing);
        if (bytes.IsErr()) {
            return Result<proto::transfer::DeliveryAck, TransferFailure>::Err(bytes.UnwrapErr());
        }
        return Result<proto::transfer::DeliveryAck, TransferFailure>::Ok(receiver_->HandleBytes(bytes.Unwrap()));
    }

}
