#pragma once
#include <string>

namespace pfs::protocol::interfaces {

/// Notification hook for the relay services (push to the counterpart, metrics...).
/// Called after the mutation is committed and outside the coordinator's lock.
class ICoordinationEventHandler {
public:
    virtual ~ICoordinationEventHandler() = default;

    virtual void OnExchangeInitiated(const std::string& exchange_id, const std::string& recipient_id) = 0;
    virtual void OnExchangeResponded(const std::string& exchange_id, const std::string& initiator_id) = 0;
    virtual void OnExchangeCompleted(const std::string& exchange_id, const std::string& conversation_id) = 0;
    virtual void OnSyncPackageCreated(const std::string& package_id, const std::string& to_device_id) = 0;
    virtual void OnDeviceAuthenticationRequested(const std::string& session_id, const std::string& responder_device_id) = 0;
    virtual void OnKeyConflictDetected(const std::string& conflict_id, const std::string& conversation_id) = 0;
};

}
