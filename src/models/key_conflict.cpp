#include "pfs/models/key_conflict.hpp"

namespace pfs::protocol::models {

std::string_view ToString(const ConflictSeverity severity) noexcept {
    switch (severity) {
        case ConflictSeverity::Low: return "low";
        case ConflictSeverity::Medium: return "medium";
        case ConflictSeverity::High: return "high";
        case ConflictSeverity::Critical: return "critical";
    }
    return "low";
}

std::string_view ToString(const ConflictStatus status) noexcept {
    switch (status) {
        case ConflictStatus::Detected: return "detected";
        case ConflictStatus::Resolved: return "resolved";
        case ConflictStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string_view ToString(const ResolutionStrategy strategy) noexcept {
    switch (strategy) {
        case ResolutionStrategy::LatestWins: return "latest_wins";
        case ResolutionStrategy::HighestTrust: return "highest_trust";
        case ResolutionStrategy::Consensus: return "consensus";
        case ResolutionStrategy::Manual: return "manual";
        case ResolutionStrategy::AuthoritativeDevice: return "authoritative_device";
        case ResolutionStrategy::Merge: return "merge";
    }
    return "unknown";
}

std::optional<ResolutionStrategy> ParseResolutionStrategy(const std::string_view text) noexcept {
    if (text == "latest_wins") {
        return ResolutionStrategy::LatestWins;
    }
    if (text == "highest_trust") {
        return ResolutionStrategy::HighestTrust;
    }
    if (text == "consensus") {
        return ResolutionStrategy::Consensus;
    }
    if (text == "manual") {
        return ResolutionStrategy::Manual;
    }
    if (text == "authoritative_device") {
        return ResolutionStrategy::AuthoritativeDevice;
    }
    if (text == "merge") {
        return ResolutionStrategy::Merge;
    }
    return std::nullopt;
}

bool IsKnownConflictKeyType(const std::string_view text) noexcept {
    return text == "ratchet_state" || text == "conversation_key" || text == "device_key" || text == "hybrid_key";
}

ConflictSeverity AssessConflictSeverity(const uint64_t lowest_version, const uint64_t highest_version) noexcept {
    const uint64_t spread = highest_version - lowest_version;
    if (spread > 10) {
        return ConflictSeverity::Critical;
    }
    if (spread > 5) {
        return ConflictSeverity::High;
    }
    if (spread > 2) {
        return ConflictSeverity::Medium;
    }
    return ConflictSeverity::Low;
}

}
