#pragma once
#include "blockvault/interfaces/i_block_transport.hpp"
#include "transfer/wire.pb.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace blockvault::test_helpers {

using proto::transfer::TransferMessage;

inline std::string SessionIdOf(const TransferMessage& message) {
    switch (message.body_case()) {
        case TransferMessage::kOpen: return message.open().session_id();
        case TransferMessage::kBlock: return message.block().session_id();
        case TransferMessage::kClose: return message.close().session_id();
        case TransferMessage::kCancel: return message.cancel().session_id();
        case TransferMessage::BODY_NOT_SET: break;
    }
    return {};
}

/// Decorator that logs every delivery, in call order, before forwarding it.
class RecordingTransport final : public interfaces::IBlockTransport {
public:
    struct Delivery {
        uint64_t sequence = 0;
        std::string session_id;
        TransferMessage::BodyCase kind = TransferMessage::BODY_NOT_SET;
        uint32_t block_index = 0;
        proto::transfer::AckStatus ack = proto::transfer::ACK_REJECTED;
        bool delivered = false;
    };

    explicit RecordingTransport(std::shared_ptr<interfaces::IBlockTransport> inner)
        : inner_(std::move(inner)) {}

    /// Runs after every delivery that reached the sink.
    void OnDelivered(std::function<void(const Delivery&)> hook) {
        std::lock_guard<std::mutex> guard(lock_);
        hook_ = std::move(hook);
    }

    [[nodiscard]] Result<proto::transfer::DeliveryAck, TransferFailure> Deliver(
        const TransferMessage& message,
        const std::chrono::milliseconds ack_timeout) override {
        Delivery delivery;
        delivery.session_id = SessionIdOf(message);
        delivery.kind = message.body_case();
        if (message.has_block()) {
            delivery.block_index = message.block().block_index();
        }
        size_t slot = 0;
        {
            std::lock_guard<std::mutex> guard(lock_);
            delivery.sequence = next_sequence_++;
            slot = deliveries_.size();
            deliveries_.push_back(delivery);
        }

        auto ack = inner_->Deliver(message, ack_timeout);

        std::function<void(const Delivery&)> hook;
        {
            std::lock_guard<std::mutex> guard(lock_);
            if (ack.IsOk()) {
                deliveries_[slot].delivered = true;
                deliveries_[slot].ack = ack.Unwrap().status();
            }
            delivery = deliveries_[slot];
            hook = hook_;
        }
        if (ack.IsOk() && hook) {
            hook(delivery);
        }
        return ack;
    }

    [[nodiscard]] std::vector<Delivery> Deliveries() const {
        std::lock_guard<std::mutex> guard(lock_);
        return deliveries_;
    }

    [[nodiscard]] std::vector<Delivery> DeliveriesFor(const std::string& session_id) const {
        std::lock_guard<std::mutex> guard(lock_);
        std::vector<Delivery> matching;
        for (const auto& delivery : deliveries_) {
            if (delivery.session_id == session_id) {
                matching.push_back(delivery);
            }
        }
        return matching;
    }

    /// Block deliveries of @p index that the sink accepted as new.
    [[nodiscard]] uint32_t AcceptedSends(const std::string& session_id, const uint32_t index) const {
        std::lock_guard<std::mutex> guard(lock_);
        uint32_t count = 0;
        for (const auto& delivery : deliveries_) {
            if (delivery.session_id == session_id &&
                delivery.kind == TransferMessage::kBlock &&
                delivery.block_index == index &&
                delivery.ack == proto::transfer::ACK_ACCEPTED) {
                ++count;
            }
        }
        return count;
    }

private:
    std::shared_ptr<interfaces::IBlockTransport> inner_;
    mutable std::mutex lock_;
    uint64_t next_sequence_ = 0;
    std::vector<Delivery> deliveries_;
    std::function<void(const Delivery&)> hook_;
};

}  // namespace blockvault::test_helpers
