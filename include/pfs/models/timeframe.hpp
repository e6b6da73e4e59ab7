#pragma once

#include <chrono>
#include <optional>
#include <string_view>

namespace pfs::protocol::models {

/// Look-back window for the statistics queries.
enum class Timeframe {
    LastHour,
    LastDay,
    LastWeek,
    LastMonth
};

/// Accepts "1h", "24h", "7d", "30d". Anything else falls back to LastDay.
Timeframe ParseTimeframe(std::string_view text) noexcept;

std::string_view ToString(Timeframe timeframe) noexcept;

std::chrono::hours Duration(Timeframe timeframe) noexcept;

}
