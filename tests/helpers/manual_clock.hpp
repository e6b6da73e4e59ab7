#pragma once

#include "pfs/interfaces/i_clock.hpp"

#include <atomic>
#include <chrono>

namespace pfs::protocol::test_helpers {

/// Clock that only moves when told to.
class ManualClock final : public interfaces::IClock {
public:
    explicit ManualClock(interfaces::TimePoint start = interfaces::TimePoint(std::chrono::hours(24 * 365 * 50)))
        : now_(start.time_since_epoch().count()) {}

    [[nodiscard]] interfaces::TimePoint Now() const override {
        return interfaces::TimePoint(interfaces::TimePoint::duration(now_.load()));
    }

    template<typename Rep, typename Period>
    void Advance(std::chrono::duration<Rep, Period> delta) {
        now_ += std::chrono::duration_cast<interfaces::TimePoint::duration>(delta).count();
    }

private:
    std::atomic<interfaces::TimePoint::rep> now_;
};

}
