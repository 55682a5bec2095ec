#pragma once
#include "blockvault/core/timestamp.hpp"

namespace blockvault::interfaces {

class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override {
        return Clock::now();
    }
};

}
