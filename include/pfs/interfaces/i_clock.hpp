#pragma once
#include <chrono>

namespace pfs::protocol::interfaces {

using TimePoint = std::chrono::system_clock::time_point;

/// Time source for expiry decisions. Tests substitute a manually advanced clock.
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override {
        return std::chrono::system_clock::now();
    }
};

}
