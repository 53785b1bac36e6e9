#pragma once

#include <fmt/core.h>

namespace vaultphrases::compat {
    using fmt::format;
}
