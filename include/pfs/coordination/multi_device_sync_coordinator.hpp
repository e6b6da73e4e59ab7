#pragma once

#include "pfs/configuration/service_config.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/interfaces/i_coordination_event_handler.hpp"
#include "pfs/interfaces/i_coordination_store.hpp"
#include "pfs/interfaces/i_device_directory.hpp"
#include "pfs/models/key_sync_package.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pfs::protocol::coordination {

/**
 * @brief Mailbox for key bundles one device of a user hands to another device of the same user.
 *
 * Packages are opaque to the relay. A package is pending until the destination device marks it
 * processed or failed, or until it expires (24h by default). The key payload is dropped as soon
 * as the package leaves pending; the bare record is kept for the retention window.
 *
 * With `require_verified_devices` set, both devices must have completed a device authentication
 * session recorded in the same store.
 */
class MultiDeviceSyncCoordinator {
public:
    MultiDeviceSyncCoordinator(
        std::shared_ptr<interfaces::IDeviceDirectory> directory,
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::ICoordinationEventHandler> events = nullptr,
        std::shared_ptr<interfaces::ICoordinationStore> store = nullptr);

    Result<models::SyncReceipt, ProtocolFailure> CreatePackage(
        const std::string& user_id,
        const std::string& from_device_id,
        const std::string& to_device_id,
        const models::EncryptedKeyPackage& package,
        const models::SyncMetadata& metadata);

    /// Most urgent first, oldest first within a priority.
    Result<std::vector<models::KeySyncPackage>, ProtocolFailure> ListPending(
        const std::string& device_id,
        const std::string& user_id);

    Result<models::SyncReceipt, ProtocolFailure> MarkProcessed(
        const std::string& package_id,
        const std::string& user_id,
        bool success,
        const std::optional<std::string>& error_message = std::nullopt);

    /// Drops expired packages and delivered or failed ones older than the retention window.
    Result<size_t, ProtocolFailure> CleanupExpired();

private:
    Result<bool, ProtocolFailure> IsOwnedBy(const std::string& device_id, const std::string& user_id) const;
    Result<bool, ProtocolFailure> IsTrusted(const std::string& device_id) const;

    std::shared_ptr<interfaces::IDeviceDirectory> directory_;
    configuration::ServiceConfig config_;
    std::shared_ptr<interfaces::IClock> clock_;
    std::shared_ptr<interfaces::ICoordinationEventHandler> events_;
    std::shared_ptr<interfaces::ICoordinationStore> store_;
    std::mutex lock_;
};

}
