#pragma once

#include "pfs/interfaces/i_coordination_store.hpp"

namespace pfs::protocol::test_helpers {

/// Relay store whose every call reports StorageUnavailable.
class FailingCoordinationStore final : public interfaces::ICoordinationStore {
public:
    Result<std::optional<models::KeyExchange>, ProtocolFailure> LoadExchange(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<Unit, ProtocolFailure> SaveExchange(const models::KeyExchange&) override {
        return Fail(Unavailable());
    }
    Result<std::vector<models::KeyExchange>, ProtocolFailure> ListExchanges() override {
        return Fail(Unavailable());
    }
    Result<bool, ProtocolFailure> DeleteExchange(const std::string&) override {
        return Fail(Unavailable());
    }

    Result<Unit, ProtocolFailure> SaveNegotiation(const models::AlgorithmNegotiation&) override {
        return Fail(Unavailable());
    }
    Result<std::vector<models::AlgorithmNegotiation>, ProtocolFailure>
    ListNegotiations(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<std::vector<models::AlgorithmNegotiation>, ProtocolFailure> ListAllNegotiations() override {
        return Fail(Unavailable());
    }
    Result<bool, ProtocolFailure> DeleteNegotiation(const std::string&) override {
        return Fail(Unavailable());
    }

    Result<Unit, ProtocolFailure> AppendMessage(const models::RelayedMessage&) override {
        return Fail(Unavailable());
    }
    Result<std::vector<models::RelayedMessage>, ProtocolFailure> ListMessagesSince(interfaces::TimePoint) override {
        return Fail(Unavailable());
    }
    Result<size_t, ProtocolFailure> DeleteMessagesBefore(interfaces::TimePoint) override {
        return Fail(Unavailable());
    }
    Result<Unit, ProtocolFailure> MarkConversationEncrypted(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<bool, ProtocolFailure> IsConversationEncrypted(const std::string&) override {
        return Fail(Unavailable());
    }

    Result<std::optional<models::KeySyncPackage>, ProtocolFailure> LoadPackage(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<Unit, ProtocolFailure> SavePackage(const models::KeySyncPackage&) override {
        return Fail(Unavailable());
    }
    Result<std::vector<models::KeySyncPackage>, ProtocolFailure> ListPackages() override {
        return Fail(Unavailable());
    }
    Result<bool, ProtocolFailure> DeletePackage(const std::string&) override {
        return Fail(Unavailable());
    }

    Result<std::optional<models::DeviceAuthSession>, ProtocolFailure> LoadAuthSession(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<Unit, ProtocolFailure> SaveAuthSession(const models::DeviceAuthSession&) override {
        return Fail(Unavailable());
    }
    Result<std::vector<models::DeviceAuthSession>, ProtocolFailure> ListAuthSessions() override {
        return Fail(Unavailable());
    }
    Result<bool, ProtocolFailure> DeleteAuthSession(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<Unit, ProtocolFailure> MarkDeviceVerified(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<bool, ProtocolFailure> IsDeviceVerified(const std::string&) override {
        return Fail(Unavailable());
    }

    Result<std::optional<models::KeyConflict>, ProtocolFailure> LoadConflict(const std::string&) override {
        return Fail(Unavailable());
    }
    Result<Unit, ProtocolFailure> SaveConflict(const models::KeyConflict&) override {
        return Fail(Unavailable());
    }
    Result<std::vector<models::KeyConflict>, ProtocolFailure> ListConflicts() override {
        return Fail(Unavailable());
    }
    Result<bool, ProtocolFailure> DeleteConflict(const std::string&) override {
        return Fail(Unavailable());
    }

private:
    static ProtocolFailure Unavailable() {
        return ProtocolFailure::StorageUnavailable("relay store offline");
    }
};

}
