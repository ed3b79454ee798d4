#pragma once

#include <fmt/core.h>

namespace shellpipe::compat {
    using fmt::format;
}
