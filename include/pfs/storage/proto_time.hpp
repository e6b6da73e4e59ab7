#pragma once

#include "pfs/interfaces/i_clock.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <chrono>

namespace pfs::protocol::storage {

inline google::protobuf::Timestamp ToTimestamp(const interfaces::TimePoint time) {
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch());
    return google::protobuf::util::TimeUtil::NanosecondsToTimestamp(nanos.count());
}

inline interfaces::TimePoint FromTimestamp(const google::protobuf::Timestamp& timestamp) {
    const auto nanos = std::chrono::nanoseconds(
        google::protobuf::util::TimeUtil::TimestampToNanoseconds(timestamp));
    return interfaces::TimePoint(std::chrono::duration_cast<interfaces::TimePoint::duration>(nanos));
}

}
