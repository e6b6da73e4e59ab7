#include "pfs/models/device_authentication.hpp"

namespace pfs::protocol::models {

std::string_view ToString(const DeviceAuthMethod method) noexcept {
    switch (method) {
        case DeviceAuthMethod::QrCode: return "qr_code";
        case DeviceAuthMethod::NumericCode: return "numeric_code";
        case DeviceAuthMethod::Biometric: return "biometric";
        case DeviceAuthMethod::MutualVerification: return "mutual_verification";
    }
    return "unknown";
}

std::string_view ToString(const DeviceAuthStatus status) noexcept {
    switch (status) {
        case DeviceAuthStatus::Pending: return "pending";
        case DeviceAuthStatus::Verified: return "verified";
        case DeviceAuthStatus::Failed: return "failed";
        case DeviceAuthStatus::Expired: return "expired";
    }
    return "unknown";
}

std::optional<DeviceAuthMethod> ParseDeviceAuthMethod(const std::string_view text) noexcept {
    if (text == "qr_code") {
        return DeviceAuthMethod::QrCode;
    }
    if (text == "numeric_code") {
        return DeviceAuthMethod::NumericCode;
    }
    if (text == "biometric") {
        return DeviceAuthMethod::Biometric;
    }
    if (text == "mutual_verification") {
        return DeviceAuthMethod::MutualVerification;
    }
    return std::nullopt;
}

}
