#pragma once

#include "pfs/configuration/ratchet_config.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pfs::protocol::configuration {

enum class DeploymentMode {
    Development,
    Production
};

[[nodiscard]] std::optional<DeploymentMode> ParseDeploymentMode(std::string_view text) noexcept;

[[nodiscard]] std::string_view DeploymentModeName(DeploymentMode mode) noexcept;

/// Process-wide settings shared by the store, the coordinators and the cleanup scheduler.
struct ServiceConfig {
    DeploymentMode mode = DeploymentMode::Development;
    RatchetConfig ratchet = RatchetConfig::Default();
    std::chrono::seconds exchange_ttl = kExchangeTtl;
    std::chrono::seconds sync_package_ttl = kSyncPackageTtl;
    std::chrono::seconds negotiation_ttl = kNegotiationTtl;
    std::chrono::seconds device_auth_ttl = kDeviceAuthTtl;
    std::chrono::seconds record_retention = kRecordRetention;
    std::chrono::seconds cleanup_interval = kCleanupInterval;
    size_t pending_exchange_limit = kDefaultPendingLimit;
    uint32_t device_auth_max_attempts = kDeviceAuthMaxAttempts;
    /// Sync packages only move between devices that passed a device authentication session.
    bool require_verified_devices = false;

    [[nodiscard]] static ServiceConfig Default() { return {}; }

    [[nodiscard]] static ServiceConfig Production() {
        ServiceConfig config;
        config.mode = DeploymentMode::Production;
        return config;
    }

    /**
     * Reads overrides from the process environment:
     *   PFS_MODE                       development | production
     *   PFS_MAX_SKIP                   forward gap bound per message (1..100000)
     *   PFS_MAX_SKIPPED_KEYS           retained skipped keys per session (1..1000000)
     *   PFS_CLEANUP_INTERVAL_SECONDS   sweep period (at most one week)
     *   PFS_REQUIRE_VERIFIED_DEVICES   true | false
     * Unset variables keep their defaults; malformed or out-of-range ones are a Configuration
     * failure.
     */
    [[nodiscard]] static Result<ServiceConfig, ProtocolFailure> FromEnvironment();

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;

    [[nodiscard]] bool IsProduction() const noexcept { return mode == DeploymentMode::Production; }
};

}
