#pragma once

#include <fmt/core.h>

namespace cipherlink::compat {
    using fmt::format;
}
