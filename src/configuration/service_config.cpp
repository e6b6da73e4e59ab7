#include "pfs/configuration/service_config.hpp"
#include "pfs/core/format.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace pfs::protocol::configuration {

namespace {
    std::optional<std::string_view> ReadEnv(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string_view(value);
    }

    /// Values above `max` are rejected before any narrowing.
    Result<std::optional<uint64_t>, ProtocolFailure> ReadUnsigned(const char* name, const uint64_t max) {
        const auto text = ReadEnv(name);
        if (!text) {
            return Result<std::optional<uint64_t>, ProtocolFailure>::Ok(std::nullopt);
        }
        uint64_t value = 0;
        const auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
        if (ec != std::errc() || end != text->data() + text->size()) {
            return Result<std::optional<uint64_t>, ProtocolFailure>::Err(
                ProtocolFailure::Configuration(
                    compat::format("{} must be an unsigned integer, got '{}'", name, *text)));
        }
        if (value > max) {
            return Result<std::optional<uint64_t>, ProtocolFailure>::Err(
                ProtocolFailure::Configuration(compat::format("{} must be at most {}, got {}", name, max, value)));
        }
        return Result<std::optional<uint64_t>, ProtocolFailure>::Ok(value);
    }
}

std::optional<DeploymentMode> ParseDeploymentMode(const std::string_view text) noexcept {
    if (text == "development" || text == "dev") {
        return DeploymentMode::Development;
    }
    if (text == "production" || text == "prod") {
        return DeploymentMode::Production;
    }
    return std::nullopt;
}

std::string_view DeploymentModeName(const DeploymentMode mode) noexcept {
    return mode == DeploymentMode::Production ? "production" : "development";
}

Result<ServiceConfig, ProtocolFailure> ServiceConfig::FromEnvironment() {
    ServiceConfig config;

    if (const auto mode_text = ReadEnv("PFS_MODE")) {
        const auto mode = ParseDeploymentMode(*mode_text);
        if (!mode) {
            return Result<ServiceConfig, ProtocolFailure>::Err(
                ProtocolFailure::Configuration(
                    compat::format("PFS_MODE must be development or production, got '{}'", *mode_text)));
        }
        config.mode = *mode;
    }

    auto max_skip = ReadUnsigned("PFS_MAX_SKIP", kMaxSkipLimit);
    PFS_TRY(max_skip);
    auto max_keys = ReadUnsigned("PFS_MAX_SKIPPED_KEYS", kMaxSkippedKeysLimit);
    PFS_TRY(max_keys);
    auto interval = ReadUnsigned(
        "PFS_CLEANUP_INTERVAL_SECONDS", static_cast<uint64_t>(std::chrono::seconds(kMaxCleanupInterval).count()));
    PFS_TRY(interval);

    if (const auto verified_text = ReadEnv("PFS_REQUIRE_VERIFIED_DEVICES")) {
        if (*verified_text == "1" || *verified_text == "true") {
            config.require_verified_devices = true;
        } else if (*verified_text == "0" || *verified_text == "false") {
            config.require_verified_devices = false;
        } else {
            return Result<ServiceConfig, ProtocolFailure>::Err(
                ProtocolFailure::Configuration(
                    compat::format("PFS_REQUIRE_VERIFIED_DEVICES must be true or false, got '{}'", *verified_text)));
        }
    }

    const auto& skip_value = max_skip.Unwrap();
    const auto& keys_value = max_keys.Unwrap();
    if (skip_value || keys_value) {
        config.ratchet = RatchetConfig(
            skip_value ? static_cast<uint32_t>(*skip_value) : config.ratchet.MaxSkip(),
            keys_value ? static_cast<size_t>(*keys_value) : config.ratchet.MaxSkippedKeys(),
            config.ratchet.SkippedKeyTtl());
    }
    if (const auto& seconds = interval.Unwrap()) {
        config.cleanup_interval = std::chrono::seconds(static_cast<int64_t>(*seconds));
    }

    PFS_TRY(config.Validate());
    return Result<ServiceConfig, ProtocolFailure>::Ok(std::move(config));
}

Result<Unit, ProtocolFailure> ServiceConfig::Validate() const {
    if (ratchet.MaxSkip() == 0 || ratchet.MaxSkip() > kMaxSkipLimit) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Configuration(compat::format("max_skip must be within 1..{}", kMaxSkipLimit)));
    }
    if (ratchet.MaxSkippedKeys() == 0 || ratchet.MaxSkippedKeys() > kMaxSkippedKeysLimit) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Configuration(
                compat::format("max_skipped_keys must be within 1..{}", kMaxSkippedKeysLimit)));
    }
    if (ratchet.SkippedKeyTtl().count() <= 0 || exchange_ttl.count() <= 0 ||
        sync_package_ttl.count() <= 0 || negotiation_ttl.count() <= 0 ||
        device_auth_ttl.count() <= 0 || record_retention.count() <= 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Configuration("TTL values must be positive"));
    }
    if (cleanup_interval.count() <= 0 || cleanup_interval > kMaxCleanupInterval) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Configuration("cleanup_interval must be positive and at most one week"));
    }
    if (device_auth_max_attempts == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Configuration("device_auth_max_attempts must be positive"));
    }
    if (pending_exchange_limit == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Configuration("pending_exchange_limit must be positive"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
