#pragma once

#include <fmt/core.h>

namespace keyward::compat {
    using fmt::format;
}
