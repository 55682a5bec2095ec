#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include <string>

namespace blockvault::keys {
struct KeyRotationEvent;
}

namespace blockvault::interfaces {

/// Tells dependent services (sinks, caches, peers) that a key was rotated.
/// Called after the rotation is committed; a failure here never undoes it.
class IKeyRotationNotifier {
public:
    virtual ~IKeyRotationNotifier() = default;

    [[nodiscard]] virtual Result<Unit, TransferFailure> NotifyRotation(
        const std::string& target,
        const keys::KeyRotationEvent& event) = 0;
};

}
