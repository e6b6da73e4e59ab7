#pragma once
#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/models/algorithm_negotiation.hpp"
#include "pfs/models/device_authentication.hpp"
#include "pfs/models/key_conflict.hpp"
#include "pfs/models/key_exchange.hpp"
#include "pfs/models/key_sync_package.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pfs::protocol::interfaces {

/**
 * Persistence for the relay records: key exchanges, negotiations and the message tally, sync
 * packages, device authentication sessions and key conflicts. None of them carry secret key
 * material; payloads are already encrypted by the clients.
 *
 * Save* methods upsert by the record id. Every method reports backend trouble as
 * StorageUnavailable. The coordinators serialise their own read-modify-write sequences, so an
 * implementation only needs each call to be atomic on its own.
 */
class ICoordinationStore {
public:
    virtual ~ICoordinationStore() = default;

    virtual Result<std::optional<models::KeyExchange>, ProtocolFailure> LoadExchange(const std::string& exchange_id) = 0;
    virtual Result<Unit, ProtocolFailure> SaveExchange(const models::KeyExchange& exchange) = 0;
    virtual Result<std::vector<models::KeyExchange>, ProtocolFailure> ListExchanges() = 0;
    virtual Result<bool, ProtocolFailure> DeleteExchange(const std::string& exchange_id) = 0;

    virtual Result<Unit, ProtocolFailure> SaveNegotiation(const models::AlgorithmNegotiation& negotiation) = 0;
    /// Oldest first.
    virtual Result<std::vector<models::AlgorithmNegotiation>, ProtocolFailure>
    ListNegotiations(const std::string& conversation_id) = 0;
    virtual Result<std::vector<models::AlgorithmNegotiation>, ProtocolFailure> ListAllNegotiations() = 0;
    virtual Result<bool, ProtocolFailure> DeleteNegotiation(const std::string& negotiation_id) = 0;

    virtual Result<Unit, ProtocolFailure> AppendMessage(const models::RelayedMessage& message) = 0;
    /// Messages with recorded_at >= since.
    virtual Result<std::vector<models::RelayedMessage>, ProtocolFailure> ListMessagesSince(TimePoint since) = 0;
    /// Deletes by predicate (recorded_at < cutoff); returns how many went.
    virtual Result<size_t, ProtocolFailure> DeleteMessagesBefore(TimePoint cutoff) = 0;
    /// Sticky per-conversation flag; survives message pruning.
    virtual Result<Unit, ProtocolFailure> MarkConversationEncrypted(const std::string& conversation_id) = 0;
    virtual Result<bool, ProtocolFailure> IsConversationEncrypted(const std::string& conversation_id) = 0;

    virtual Result<std::optional<models::KeySyncPackage>, ProtocolFailure> LoadPackage(const std::string& package_id) = 0;
    virtual Result<Unit, ProtocolFailure> SavePackage(const models::KeySyncPackage& package) = 0;
    virtual Result<std::vector<models::KeySyncPackage>, ProtocolFailure> ListPackages() = 0;
    virtual Result<bool, ProtocolFailure> DeletePackage(const std::string& package_id) = 0;

    virtual Result<std::optional<models::DeviceAuthSession>, ProtocolFailure>
    LoadAuthSession(const std::string& session_id) = 0;
    virtual Result<Unit, ProtocolFailure> SaveAuthSession(const models::DeviceAuthSession& session) = 0;
    virtual Result<std::vector<models::DeviceAuthSession>, ProtocolFailure> ListAuthSessions() = 0;
    virtual Result<bool, ProtocolFailure> DeleteAuthSession(const std::string& session_id) = 0;
    virtual Result<Unit, ProtocolFailure> MarkDeviceVerified(const std::string& device_id) = 0;
    virtual Result<bool, ProtocolFailure> IsDeviceVerified(const std::string& device_id) = 0;

    virtual Result<std::optional<models::KeyConflict>, ProtocolFailure> LoadConflict(const std::string& conflict_id) = 0;
    virtual Result<Unit, ProtocolFailure> SaveConflict(const models::KeyConflict& conflict) = 0;
    virtual Result<std::vector<models::KeyConflict>, ProtocolFailure> ListConflicts() = 0;
    virtual Result<bool, ProtocolFailure> DeleteConflict(const std::string& conflict_id) = 0;
};

}
