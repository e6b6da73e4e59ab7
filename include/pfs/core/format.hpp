#pragma once
#include <fmt/core.h>

namespace pfs::compat {
using fmt::format;
}
