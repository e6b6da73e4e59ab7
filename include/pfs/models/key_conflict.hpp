#pragma once

#include "pfs/interfaces/i_clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfs::protocol::models {

using interfaces::TimePoint;

// Ordered so that a larger value is more severe.
enum class ConflictSeverity {
    Low = 0,
    Medium = 1,
    High = 2,
    Critical = 3
};

enum class ConflictStatus {
    Detected,
    Resolved,
    Failed
};

enum class ResolutionStrategy {
    LatestWins,
    HighestTrust,
    Consensus,
    Manual,
    AuthoritativeDevice,
    Merge
};

std::string_view ToString(ConflictSeverity severity) noexcept;
std::string_view ToString(ConflictStatus status) noexcept;
std::string_view ToString(ResolutionStrategy strategy) noexcept;

/// Accepts latest_wins, highest_trust, consensus, manual, authoritative_device, merge.
std::optional<ResolutionStrategy> ParseResolutionStrategy(std::string_view text) noexcept;

/// Accepts ratchet_state, conversation_key, device_key, hybrid_key.
bool IsKnownConflictKeyType(std::string_view text) noexcept;

/// Severity from the spread between the highest and lowest reported version:
/// above 10 critical, above 5 high, above 2 medium, otherwise low.
ConflictSeverity AssessConflictSeverity(uint64_t lowest_version, uint64_t highest_version) noexcept;

/// One device's claim about a key. Only the hash of the key travels through the relay.
struct ConflictingVersion {
    std::string device_id;
    uint64_t version = 0;
    TimePoint modified_at{};
    std::vector<uint8_t> key_hash;
};

struct KeyConflict {
    std::string conflict_id;
    std::string conversation_id;
    std::string key_type;
    ConflictSeverity severity = ConflictSeverity::Low;
    ConflictStatus status = ConflictStatus::Detected;
    std::vector<ConflictingVersion> versions;
    ResolutionStrategy strategy = ResolutionStrategy::LatestWins;
    std::optional<std::string> authoritative_device_id;
    std::optional<uint64_t> resolved_version;
    std::optional<std::string> resolved_by;
    std::optional<std::string> failure_reason;
    TimePoint detected_at{};
    std::optional<TimePoint> resolved_at;
};

struct ConflictReceipt {
    std::string conflict_id;
    ConflictSeverity severity = ConflictSeverity::Low;
    ConflictStatus status = ConflictStatus::Detected;
    /// Set when the strategy picks a version without a human in the loop.
    std::optional<uint64_t> recommended_version;
};

}
