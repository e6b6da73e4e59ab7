#pragma once

#include "pfs/interfaces/i_clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfs::protocol::models {

using interfaces::TimePoint;

enum class DeviceAuthMethod {
    QrCode,
    NumericCode,
    Biometric,
    MutualVerification
};

enum class DeviceAuthStatus {
    Pending,
    Verified,
    Failed,
    Expired
};

std::string_view ToString(DeviceAuthMethod method) noexcept;
std::string_view ToString(DeviceAuthStatus status) noexcept;

/// Accepts qr_code, numeric_code, biometric, mutual_verification.
std::optional<DeviceAuthMethod> ParseDeviceAuthMethod(std::string_view text) noexcept;

/// What the initiating device hands the relay. The verification code is only kept as a digest.
struct DeviceAuthChallenge {
    std::vector<uint8_t> challenge;
    std::string verification_code;
};

struct DeviceAuthSession {
    std::string session_id;
    std::string user_id;
    std::string initiator_device_id;
    std::string responder_device_id;
    DeviceAuthMethod method = DeviceAuthMethod::NumericCode;
    DeviceAuthStatus status = DeviceAuthStatus::Pending;
    std::vector<uint8_t> challenge;
    std::vector<uint8_t> verification_salt;
    std::vector<uint8_t> verification_digest;
    uint32_t attempts = 0;
    uint32_t max_attempts = 0;
    TimePoint created_at{};
    std::optional<TimePoint> finished_at;
    TimePoint expires_at{};
};

struct DeviceAuthReceipt {
    std::string session_id;
    DeviceAuthStatus status = DeviceAuthStatus::Pending;
    uint32_t attempts_remaining = 0;
    TimePoint expires_at{};
};

/// The responder's view of a pending session.
struct DeviceAuthRequest {
    std::string session_id;
    std::string initiator_device_id;
    DeviceAuthMethod method = DeviceAuthMethod::NumericCode;
    std::vector<uint8_t> challenge;
    TimePoint expires_at{};
};

}
