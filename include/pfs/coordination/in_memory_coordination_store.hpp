#pragma once

#include "pfs/interfaces/i_coordination_store.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace pfs::protocol::coordination {

/// Process-local ICoordinationStore. Default for the coordinators when none is injected.
class InMemoryCoordinationStore final : public interfaces::ICoordinationStore {
public:
    Result<std::optional<models::KeyExchange>, ProtocolFailure> LoadExchange(const std::string& exchange_id) override;
    Result<Unit, ProtocolFailure> SaveExchange(const models::KeyExchange& exchange) override;
    Result<std::vector<models::KeyExchange>, ProtocolFailure> ListExchanges() override;
    Result<bool, ProtocolFailure> DeleteExchange(const std::string& exchange_id) override;

    Result<Unit, ProtocolFailure> SaveNegotiation(const models::AlgorithmNegotiation& negotiation) override;
    Result<std::vector<models::AlgorithmNegotiation>, ProtocolFailure>
    ListNegotiations(const std::string& conversation_id) override;
    Result<std::vector<models::AlgorithmNegotiation>, ProtocolFailure> ListAllNegotiations() override;
    Result<bool, ProtocolFailure> DeleteNegotiation(const std::string& negotiation_id) override;

    Result<Unit, ProtocolFailure> AppendMessage(const models::RelayedMessage& message) override;
    Result<std::vector<models::RelayedMessage>, ProtocolFailure> ListMessagesSince(interfaces::TimePoint since) override;
    Result<size_t, ProtocolFailure> DeleteMessagesBefore(interfaces::TimePoint cutoff) override;
    Result<Unit, ProtocolFailure> MarkConversationEncrypted(const std::string& conversation_id) override;
    Result<bool, ProtocolFailure> IsConversationEncrypted(const std::string& conversation_id) override;

    Result<std::optional<models::KeySyncPackage>, ProtocolFailure> LoadPackage(const std::string& package_id) override;
    Result<Unit, ProtocolFailure> SavePackage(const models::KeySyncPackage& package) override;
    Result<std::vector<models::KeySyncPackage>, ProtocolFailure> ListPackages() override;
    Result<bool, ProtocolFailure> DeletePackage(const std::string& package_id) override;

    Result<std::optional<models::DeviceAuthSession>, ProtocolFailure>
    LoadAuthSession(const std::string& session_id) override;
    Result<Unit, ProtocolFailure> SaveAuthSession(const models::DeviceAuthSession& session) override;
    Result<std::vector<models::DeviceAuthSession>, ProtocolFailure> ListAuthSessions() override;
    Result<bool, ProtocolFailure> DeleteAuthSession(const std::string& session_id) override;
    Result<Unit, ProtocolFailure> MarkDeviceVerified(const std::string& device_id) override;
    Result<bool, ProtocolFailure> IsDeviceVerified(const std::string& device_id) override;

    Result<std::optional<models::KeyConflict>, ProtocolFailure> LoadConflict(const std::string& conflict_id) override;
    Result<Unit, ProtocolFailure> SaveConflict(const models::KeyConflict& conflict) override;
    Result<std::vector<models::KeyConflict>, ProtocolFailure> ListConflicts() override;
    Result<bool, ProtocolFailure> DeleteConflict(const std::string& conflict_id) override;

private:
    std::mutex lock_;
    std::map<std::string, models::KeyExchange> exchanges_;
    // Insertion order is kept so per-conversation listings come out oldest first.
    std::vector<models::AlgorithmNegotiation> negotiations_;
    std::vector<models::RelayedMessage> messages_;
    std::set<std::string> encrypted_conversations_;
    std::map<std::string, models::KeySyncPackage> packages_;
    std::map<std::string, models::DeviceAuthSession> auth_sessions_;
    std::set<std::string> verified_devices_;
    std::map<std::string, models::KeyConflict> conflicts_;
};

}
