#pragma once
#include "blockvault/interfaces/i_block_io.hpp"
#include "blockvault/interfaces/i_key_provider.hpp"
#include "transfer/wire.pb.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>

namespace blockvault::transfer {

/**
 * @brief Sink side of a transfer
 *
 * Decodes TransferMessages and answers each with a DeliveryAck:
 *
 * | Message | Effect                                          | Ack                     |
 * |---------|-------------------------------------------------|-------------------------|
 * | open    | registers the manifest (sizes, digests)         | ACCEPTED / DUPLICATE    |
 * | block   | decrypts, verifies tag and digest, writes block | ACCEPTED / DUPLICATE    |
 * | close   | marks the session finished if nothing is missing| ACCEPTED / REJECTED     |
 * | cancel  | forgets the session, written blocks stay        | ACCEPTED                |
 *
 * A block index that was already written is acknowledged DUPLICATE and
 * never rewritten, so a sender may redeliver freely.
 *
 * Thread Safety: all public methods are thread-safe; distinct blocks of one
 * session are processed in parallel.
 */
class BlockReceiver {
public:
    struct SinkSessionInfo {
        std::string session_id;
        std::string artifact_id;
        std::string key_id;
        uint32_t total_blocks = 0;
        uint32_t received_blocks = 0;
        bool closed = false;
    };

    BlockReceiver(
        std::shared_ptr<interfaces::IKeyProvider> keys,
        std::shared_ptr<interfaces::IBlockSink> sink);

    [[nodiscard]] proto::transfer::DeliveryAck HandleMessage(const proto::transfer::TransferMessage& message);

    [[nodiscard]] proto::transfer::DeliveryAck HandleBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] std::optional<SinkSessionInfo> GetSession(const std::string& session_id) const;

    BlockReceiver(const BlockReceiver&) = delete;
    BlockReceiver& operator=(const BlockReceiver&) = delete;

private:
    enum class SlotState { Missing, Writing, Received };

    struct Slot {
        uint64_t size = 0;
        std::string digest;
        SlotState state = SlotState::Missing;
    };

    struct SinkSession {
        mutable std::mutex lock;
        std::string artifact_id;
        std::string key_id;
        std::map<uint32_t, Slot> slots;
        bool closed = false;
    };

    [[nodiscard]] proto::transfer::DeliveryAck HandleOpen(const proto::transfer::SessionOpen& open);
    [[nodiscard]] proto::transfer::DeliveryAck HandleBlock(const proto::transfer::BlockData& block);
    [[nodiscard]] proto::transfer::DeliveryAck HandleClose(const proto::transfer::SessionClose& close);
    [[nodiscard]] proto::transfer::DeliveryAck HandleCancel(const proto::transfer::SessionCancel& cancel);

    [[nodiscard]] std::shared_ptr<SinkSession> FindSession(const std::string& session_id) const;

    void ReleaseSlot(SinkSession& session, uint32_t index, SlotState state);

    std::shared_ptr<interfaces::IKeyProvider> keys_;
    std::shared_ptr<interfaces::IBlockSink> sink_;

    mutable std::shared_mutex sessions_lock_;
    std::unordered_map<std::string, std::shared_ptr<SinkSession>> sessions_;
};

}  // namespace blockvault::transfer
