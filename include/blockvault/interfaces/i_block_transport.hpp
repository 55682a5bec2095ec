#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "transfer/wire.pb.h"
#include <chrono>

namespace blockvault::interfaces {

/// Delivers one message to the sink and returns its acknowledgment.
///
/// Implementations must be safe to call from several threads at once and
/// must report a lost delivery, or one not acknowledged within
/// @p ack_timeout, as TransportError. Redelivery of a block the sink
/// already accepted yields ACK_DUPLICATE.
class IBlockTransport {
public:
    virtual ~IBlockTransport() = default;

    [[nodiscard]] virtual Result<proto::transfer::DeliveryAck, TransferFailure> Deliver(
        const proto::transfer::TransferMessage& message,
        std::chrono::milliseconds ack_timeout) = 0;
};

}
