#pragma once

#include "pfs/configuration/service_config.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/interfaces/i_coordination_event_handler.hpp"
#include "pfs/interfaces/i_coordination_store.hpp"
#include "pfs/models/key_conflict.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pfs::protocol::coordination {

/**
 * @brief Tracks divergent key versions reported by a user's devices until one device settles them.
 *
 * A report carries at least two versions of the same key. Severity follows the spread between the
 * highest and lowest version. `latest_wins` recommends the highest version and
 * `authoritative_device` the version held by the named device; other strategies leave the pick
 * to the resolving device. Conflicts stay open until resolved or marked failed.
 */
class KeyConflictCoordinator {
public:
    KeyConflictCoordinator(
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::ICoordinationEventHandler> events = nullptr,
        std::shared_ptr<interfaces::ICoordinationStore> store = nullptr);

    Result<models::ConflictReceipt, ProtocolFailure> Report(
        const std::string& conversation_id,
        const std::string& key_type,
        const std::vector<models::ConflictingVersion>& versions,
        const std::string& strategy,
        const std::optional<std::string>& authoritative_device_id = std::nullopt);

    Result<models::KeyConflict, ProtocolFailure> Get(const std::string& conflict_id);

    /// Most severe first, oldest first within a severity.
    Result<std::vector<models::KeyConflict>, ProtocolFailure> ListOpen(const std::string& conversation_id);

    /// `version` must be one of the reported versions. With `authoritative_device`, only that
    /// device may resolve.
    Result<models::ConflictReceipt, ProtocolFailure> Resolve(
        const std::string& conflict_id,
        const std::string& resolver_device_id,
        uint64_t version);

    Result<models::ConflictReceipt, ProtocolFailure> MarkFailed(
        const std::string& conflict_id,
        const std::string& reason);

    /// Drops conflicts detected before the retention window.
    Result<size_t, ProtocolFailure> CleanupExpired();

private:
    Result<models::KeyConflict, ProtocolFailure> LoadOpenLocked(const std::string& conflict_id);

    configuration::ServiceConfig config_;
    std::shared_ptr<interfaces::IClock> clock_;
    std::shared_ptr<interfaces::ICoordinationEventHandler> events_;
    std::shared_ptr<interfaces::ICoordinationStore> store_;
    std::mutex lock_;
};

}
