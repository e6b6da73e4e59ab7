#include "pfs/models/timeframe.hpp"

namespace pfs::protocol::models {

Timeframe ParseTimeframe(const std::string_view text) noexcept {
    if (text == "1h") {
        return Timeframe::LastHour;
    }
    if (text == "7d") {
        return Timeframe::LastWeek;
    }
    if (text == "30d") {
        return Timeframe::LastMonth;
    }
    return Timeframe::LastDay;
}

std::string_view ToString(const Timeframe timeframe) noexcept {
    switch (timeframe) {
        case Timeframe::LastHour: return "1h";
        case Timeframe::LastDay: return "24h";
        case Timeframe::LastWeek: return "7d";
        case Timeframe::LastMonth: return "30d";
    }
    return "24h";
}

std::chrono::hours Duration(const Timeframe timeframe) noexcept {
    switch (timeframe) {
        case Timeframe::LastHour: return std::chrono::hours(1);
        case Timeframe::LastDay: return std::chrono::hours(24);
        case Timeframe::LastWeek: return std::chrono::hours(24 * 7);
        case Timeframe::LastMonth: return std::chrono::hours(24 * 30);
    }
    return std::chrono::hours(24);
}

}
