#include "blockvault/transfer/block_receiver.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/transfer/block_codec.hpp"
#include "blockvault/transfer/constants.hpp"

namespace blockvault::transfer {

    namespace {
        constexpr const char* kComponent = "BlockReceiver";

        proto::transfer::DeliveryAck MakeAck(
            const std::string& session_id,
            const uint32_t block_index,
            const proto::transfer::AckStatus status) {
            proto::transfer::DeliveryAck ack;
            ack.set_session_id(session_id);
            ack.set_block_index(block_index);
            ack.set_status(status);
            return ack;
        }

        proto::transfer::DeliveryAck MakeFailureAck(
            const std::string& session_id,
            const uint32_t block_index,
            const proto::transfer::AckStatus status,
            const TransferFailure& failure) {
            auto ack = MakeAck(session_id, block_index, status);
            ack.set_failure_kind(static_cast<uint32_t>(failure.type));
            ack.set_detail(failure.message);
            return ack;
        }

        proto::transfer::AckStatus StatusFor(const TransferFailureType type) {
            if (type == TransferFailureType::IntegrityError) {
                return proto::transfer::ACK_INTEGRITY_FAILURE;
            }
            if (IsKeyLifecycleFailure(type) || type == TransferFailureType::NotFound) {
                return proto::transfer::ACK_KEY_REJECTED;
            }
            return proto::transfer::ACK_REJECTED;
        }
    }

    BlockReceiver::BlockReceiver(
        std::shared_ptr<interfaces::IKeyProvider> keys,
        std::shared_ptr<interfaces::IBlockSink> sink)
        : keys_(std::move(keys))
        , sink_(std::move(sink)) {}

    proto::transfer::DeliveryAck BlockReceiver::HandleBytes(std::span<const uint8_t> bytes) {
        proto::transfer::TransferMessage message;
        if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return MakeFailureAck({}, 0, proto::transfer::ACK_REJECTED,
                TransferFailure::Decode("Malformed transfer message"));
        }
        return HandleMessage(message);
    }

    proto::transfer::DeliveryAck BlockReceiver::HandleMessage(const proto::transfer::TransferMessage& message) {
        switch (message.body_case()) {
            case proto::transfer::TransferMessage::kOpen:
                return HandleOpen(message.open());
            case proto::transfer::TransferMessage::kBlock:
                return HandleBlock(message.block());
            case proto::transfer::TransferMessage::kClose:
                return HandleClose(message.close());
            case proto::transfer::TransferMessage::kCancel:
                return HandleCancel(message.cancel());
            case proto::transfer::TransferMessage::BODY_NOT_SET:
                break;
        }
        return MakeFailureAck({}, 0, proto::transfer::ACK_REJECTED,
            TransferFailure::Decode("Transfer message has no body"));
    }

    std::optional<BlockReceiver::SinkSessionInfo> BlockReceiver::GetSession(const std::string& session_id) const {
        const auto session = FindSession(session_id);
        if (!session) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> guard(session->lock);
        SinkSessionInfo info;
        info.session_id = session_id;
        info.artifact_id = session->artifact_id;
        info.key_id = session->key_id;
        info.total_blocks = static_cast<uint32_t>(session->slots.size());
        for (const auto& [index, slot] : session->slots) {
            if (slot.state == SlotState::Received) {
                ++info.received_blocks;
            }
        }
        info.closed = session->closed;
        return info;
    }

    std::shared_ptr<BlockReceiver::SinkSession> BlockReceiver::FindSession(const std::string& session_id) const {
        std::shared_lock lock(sessions_lock_);
        const auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    void BlockReceiver::ReleaseSlot(SinkSession& session, const uint32_t index, const SlotState state) {
        std::lock_guard<std::mutex> guard(session.lock);
        const auto it = session.slots.find(index);
        if (it != session.slots.end()) {
            it->second.state = state;
        }
    }

    // ========================================================================
    // Handlers
    // ========================================================================

    proto::transfer::DeliveryAck BlockReceiver::HandleOpen(const proto::transfer::SessionOpen& open) {
        const std::string& session_id = open.session_id();
        if (session_id.empty() || open.blocks().empty()) {
            return MakeFailureAck(session_id, 0, proto::transfer::ACK_REJECTED,
                TransferFailure::InvalidInput("Session open needs an id and a manifest"));
        }

        auto session = std::make_shared<SinkSession>();
        session->artifact_id = open.artifact_id();
        session->key_id = open.key_id();
        for (const auto& entry : open.blocks()) {
            if (entry.digest().size() != kDigestBytes || entry.size() == 0) {
                return MakeFailureAck(session_id, entry.index(), proto::transfer::ACK_REJECTED,
                    TransferFailure::InvalidInput("Manifest entry has an invalid size or digest"));
            }
            Slot slot;
            slot.size = entry.size();
            slot.digest = entry.digest();
            slot.state = sink_->HasBlock(session_id, entry.index()) ? SlotState::Received : SlotState::Missing;
            if (!session->slots.emplace(entry.index(), std::move(slot)).second) {
                return MakeFailureAck(session_id, entry.index(), proto::transfer::ACK_REJECTED,
                    TransferFailure::InvalidInput("Manifest repeats a block index"));
            }
        }

        std::unique_lock lock(sessions_lock_);
        const auto existing = sessions_.find(session_id);
        if (existing != sessions_.end()) {
            std::lock_guard<std::mutex> guard(existing->second->lock);
            const auto& known = existing->second->slots;
            bool same = known.size() == session->slots.size();
            for (auto a = known.begin(), b = session->slots.cbegin(); same && a != known.end(); ++a, ++b) {
                same = a->first == b->first && a->second.digest == b->second.digest &&
                       a->second.size == b->second.size;
            }
            if (!same) {
                return MakeFailureAck(session_id, 0, proto::transfer::ACK_REJECTED,
                    TransferFailure::InvalidState("Session already open with a different manifest"));
            }
            existing->second->key_id = open.key_id();
            return MakeAck(session_id, 0, proto::transfer::ACK_DUPLICATE);
        }
        sessions_.emplace(session_id, std::move(session));
        BLOCKVAULT_LOG_DEBUG(kComponent, "Opened sink session {} ({} blocks)", session_id, open.blocks_size());
        return MakeAck(session_id, 0, proto::transfer::ACK_ACCEPTED);
    }

    proto::transfer::DeliveryAck BlockReceiver::HandleBlock(const proto::transfer::BlockData& block) {
        const std::string& session_id = block.session_id();
        const uint32_t index = block.block_index();
        const auto session = FindSession(session_id);
        if (!session) {
            return MakeFailureAck(session_id, index, proto::transfer::ACK_UNKNOWN_SESSION,
                TransferFailure::NotFound("Sink has no session " + session_id));
        }

        Slot expected;
        {
            std::lock_guard<std::mutex> guard(session->lock);
            const auto it = session->slots.find(index);
            if (it == session->slots.end()) {
                return MakeFailureAck(session_id, index, proto::transfer::ACK_REJECTED,
                    TransferFailure::InvalidInput("Block index not in manifest"));
            }
            switch (it->second.state) {
                case SlotState::Received:
                    return MakeAck(session_id, index, proto::transfer::ACK_DUPLICATE);
                case SlotState::Writing:
                    return MakeFailureAck(session_id, index, proto::transfer::ACK_BUSY,
                        TransferFailure::TransportError("Block is still being written"));
                case SlotState::Missing:
                    break;
            }
            it->second.state = SlotState::Writing;
            expected = it->second;
        }

        if (block.plaintext_digest() != expected.digest) {
            ReleaseSlot(*session, index, SlotState::Missing);
            BLOCKVAULT_LOG_WARN(kComponent, "Block {} of {} carries a digest that differs from the manifest",
                index, session_id);
            return MakeFailureAck(session_id, index, proto::transfer::ACK_INTEGRITY_FAILURE,
                TransferFailure::IntegrityError("Block digest differs from the manifest"));
        }

        auto plaintext = BlockCodec::OpenBlock(*keys_, block);
        if (plaintext.IsErr()) {
            ReleaseSlot(*session, index, SlotState::Missing);
            const auto& failure = plaintext.UnwrapErr();
            BLOCKVAULT_LOG_WARN(kComponent, "Rejected block {} of {}: {} ({})",
                index, session_id, ToString(failure.type), failure.message);
            return MakeFailureAck(session_id, index, StatusFor(failure.type), failure);
        }
        if (plaintext.Unwrap().size() != expected.size) {
            ReleaseSlot(*session, index, SlotState::Missing);
            return MakeFailureAck(session_id, index, proto::transfer::ACK_INTEGRITY_FAILURE,
                TransferFailure::IntegrityError("Block size differs from the manifest"));
        }

        if (auto written = sink_->WriteBlock(session_id, index, plaintext.Unwrap()); written.IsErr()) {
            ReleaseSlot(*session, index, SlotState::Missing);
            BLOCKVAULT_LOG_ERROR(kComponent, "Sink write of block {} of {} failed: {}",
                index, session_id, written.UnwrapErr().message);
            return MakeFailureAck(session_id, index, proto::transfer::ACK_REJECTED, written.UnwrapErr());
        }
        ReleaseSlot(*session, index, SlotState::Received);
        BLOCKVAULT_LOG_TRACE(kComponent, "Accepted block {} of {}", index, session_id);
        return MakeAck(session_id, index, proto::transfer::ACK_ACCEPTED);
    }

    proto::transfer::DeliveryAck BlockReceiver::HandleClose(const proto::transfer::SessionClose& close) {
        const auto session = FindSession(close.session_id());
        if (!session) {
            return MakeFailureAck(close.session_id(), 0, proto::transfer::ACK_UNKNOWN_SESSION,
                TransferFailure::NotFound("Sink has no session " + close.session_id()));
        }
        std::lock_guard<std::mutex> guard(session->lock);
        if (session->closed) {
            return MakeAck(close.session_id(), 0, proto::transfer::ACK_DUPLICATE);
        }
        uint32_t missing = 0;
        for (const auto& [index, slot] : session->slots) {
            if (slot.state != SlotState::Received) {
                ++missing;
            }
        }
        if (missing > 0) {
            return MakeFailureAck(close.session_id(), 0, proto::transfer::ACK_REJECTED,
                TransferFailure::InvalidState(compat::format("{} blocks are still missing", missing)));
        }
        session->closed = true;
        BLOCKVAULT_LOG_INFO(kComponent, "Sink session {} complete ({} blocks)",
            close.session_id(), session->slots.size());
        return MakeAck(close.session_id(), 0, proto::transfer::ACK_ACCEPTED);
    }

    proto::transfer::DeliveryAck BlockReceiver::HandleCancel(const proto::transfer::SessionCancel& cancel) {
        std::unique_lock lock(sessions_lock_);
        if (sessions_.erase(cancel.session_id()) == 0) {
            return MakeFailureAck(cancel.session_id(), 0, proto::transfer::ACK_UNKNOWN_SESSION,
                TransferFailure::NotFound("Sink has no session " + cancel.session_id()));
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Sink session {} cancelled: {}", cancel.session_id(), cancel.reason());
        return MakeAck(cancel.session_id(), 0, proto::transfer::ACK_ACCEPTED);
    }

}
