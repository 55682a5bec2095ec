#pragma once

#include <fmt/core.h>

namespace blockvault::compat {
    using fmt::format;
}
