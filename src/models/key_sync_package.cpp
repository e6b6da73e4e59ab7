#include "pfs/models/key_sync_package.hpp"

namespace pfs::protocol::models {

std::string_view ToString(const SyncPriority priority) noexcept {
    switch (priority) {
        case SyncPriority::Low: return "low";
        case SyncPriority::Medium: return "medium";
        case SyncPriority::High: return "high";
    }
    return "medium";
}

std::string_view ToString(const SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Processed: return "processed";
        case SyncStatus::Failed: return "failed";
        case SyncStatus::Expired: return "expired";
    }
    return "unknown";
}

std::optional<SyncPriority> ParseSyncPriority(const std::string_view text) noexcept {
    if (text == "low") {
        return SyncPriority::Low;
    }
    if (text == "medium") {
        return SyncPriority::Medium;
    }
    if (text == "high") {
        return SyncPriority::High;
    }
    return std::nullopt;
}

}
