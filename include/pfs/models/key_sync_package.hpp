#pragma once

#include "pfs/interfaces/i_clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfs::protocol::models {

using interfaces::TimePoint;

// Ordered so that a larger value is more urgent.
enum class SyncPriority {
    Low = 0,
    Medium = 1,
    High = 2
};

enum class SyncStatus {
    Pending,
    Processed,
    Failed,
    Expired
};

std::string_view ToString(SyncPriority priority) noexcept;
std::string_view ToString(SyncStatus status) noexcept;
std::optional<SyncPriority> ParseSyncPriority(std::string_view text) noexcept;

/// Opaque key bundle encrypted by the sending device for the receiving one.
struct EncryptedKeyPackage {
    std::vector<uint8_t> encrypted_data;
    std::vector<uint8_t> integrity_hash;
    std::vector<uint8_t> signature;
    std::string encryption_method;
};

struct SyncMetadata {
    std::string key_type;
    std::string conversation_id;
    SyncPriority priority = SyncPriority::Medium;
};

struct KeySyncPackage {
    std::string package_id;
    std::string user_id;
    std::string from_device_id;
    std::string to_device_id;
    std::string key_type;
    std::string conversation_id;
    std::vector<uint8_t> encrypted_key_data;
    std::vector<uint8_t> integrity_hash;
    std::vector<uint8_t> signature;
    std::string encryption_method;
    SyncPriority priority = SyncPriority::Medium;
    SyncStatus status = SyncStatus::Pending;
    std::optional<std::string> error_message;
    TimePoint created_at{};
    std::optional<TimePoint> processed_at;
    TimePoint expires_at{};
};

struct SyncReceipt {
    std::string package_id;
    SyncStatus status = SyncStatus::Pending;
    TimePoint expires_at{};
};

}
