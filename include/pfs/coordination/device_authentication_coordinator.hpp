#pragma once

#include "pfs/configuration/service_config.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/interfaces/i_coordination_event_handler.hpp"
#include "pfs/interfaces/i_coordination_store.hpp"
#include "pfs/interfaces/i_device_directory.hpp"
#include "pfs/models/device_authentication.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace pfs::protocol::coordination {

/**
 * @brief Relays a verification ceremony between two devices of the same user.
 *
 * The initiating device opens a session with a challenge and a verification code. The code is
 * stored only as a salted BLAKE2b digest. The responding device fetches the challenge, shows or
 * scans it, and submits the code back. A match marks both devices verified in the store; the
 * session fails after `device_auth_max_attempts` mismatches and expires after `device_auth_ttl`.
 */
class DeviceAuthenticationCoordinator {
public:
    DeviceAuthenticationCoordinator(
        std::shared_ptr<interfaces::IDeviceDirectory> directory,
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::ICoordinationEventHandler> events = nullptr,
        std::shared_ptr<interfaces::ICoordinationStore> store = nullptr);

    Result<models::DeviceAuthReceipt, ProtocolFailure> Open(
        const std::string& user_id,
        const std::string& initiator_device_id,
        const std::string& responder_device_id,
        const std::string& method,
        const models::DeviceAuthChallenge& challenge);

    /// Only the responder device sees the pending challenge.
    Result<models::DeviceAuthRequest, ProtocolFailure> GetRequest(
        const std::string& session_id,
        const std::string& device_id,
        const std::string& user_id);

    Result<models::DeviceAuthReceipt, ProtocolFailure> Verify(
        const std::string& session_id,
        const std::string& device_id,
        const std::string& user_id,
        const std::string& verification_code);

    /// Either device of the session may poll its state.
    Result<models::DeviceAuthReceipt, ProtocolFailure> Status(
        const std::string& session_id,
        const std::string& device_id,
        const std::string& user_id);

    Result<bool, ProtocolFailure> IsVerified(const std::string& device_id);

    /// Drops expired sessions and finished ones older than the retention window.
    Result<size_t, ProtocolFailure> CleanupExpired();

private:
    Result<bool, ProtocolFailure> IsOwnedBy(const std::string& device_id, const std::string& user_id) const;
    Result<models::DeviceAuthSession, ProtocolFailure> LoadLocked(const std::string& session_id);
    Result<Unit, ProtocolFailure> ExpireIfPastDeadline(models::DeviceAuthSession& session, interfaces::TimePoint now);

    std::shared_ptr<interfaces::IDeviceDirectory> directory_;
    configuration::ServiceConfig config_;
    std::shared_ptr<interfaces::IClock> clock_;
    std::shared_ptr<interfaces::ICoordinationEventHandler> events_;
    std::shared_ptr<interfaces::ICoordinationStore> store_;
    std::mutex lock_;
};

}
