#pragma once

#include "pfs/configuration/service_config.hpp"
#include "pfs/coordination/algorithm_negotiation_ledger.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/interfaces/i_coordination_event_handler.hpp"
#include "pfs/interfaces/i_coordination_store.hpp"
#include "pfs/models/key_exchange.hpp"
#include "pfs/models/timeframe.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pfs::protocol::coordination {

/**
 * @brief Relays a key exchange between two users: pending -> responded -> completed.
 *
 * Anything short of completed turns expired once its deadline passes. Expiry is checked when the
 * exchange is touched and by CleanupExpired; there are no timers. Completing an initial_setup
 * exchange records the agreed suite in the negotiation ledger.
 *
 * Records live in the injected ICoordinationStore (an InMemoryCoordinationStore when none is
 * given). Completed exchanges are dropped by CleanupExpired once they fall out of the record
 * retention window.
 */
class KeyExchangeCoordinator {
public:
    KeyExchangeCoordinator(
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<AlgorithmNegotiationLedger> ledger,
        std::shared_ptr<interfaces::ICoordinationEventHandler> events = nullptr,
        std::shared_ptr<interfaces::ICoordinationStore> store = nullptr);

    /// `exchange_type` takes the wire names (initial_setup, ratchet_update, ...).
    Result<models::ExchangeReceipt, ProtocolFailure> Initiate(
        const std::string& initiator_id,
        const std::string& recipient_id,
        const std::string& conversation_id,
        std::string_view exchange_type,
        const models::PublicKeyBundle& public_key_bundle,
        std::span<const uint8_t> encrypted_key_data);

    Result<models::ExchangeReceipt, ProtocolFailure> Respond(
        const std::string& exchange_id,
        const std::string& recipient_id,
        std::span<const uint8_t> response_data,
        const models::PublicKeyBundle& public_key_bundle);

    Result<models::ExchangeReceipt, ProtocolFailure> Complete(
        const std::string& exchange_id,
        const std::string& user_id,
        std::span<const uint8_t> confirmation_signature);

    /// Newest first. A `limit` of 0 uses the configured default.
    Result<std::vector<models::PendingExchange>, ProtocolFailure> ListPending(
        const std::string& user_id,
        size_t limit = 0);

    Result<models::ExchangeData, ProtocolFailure> GetData(
        const std::string& exchange_id,
        const std::string& user_id);

    /// Drops expired exchanges and completed ones older than the retention window.
    Result<size_t, ProtocolFailure> CleanupExpired();

    Result<models::ExchangeStats, ProtocolFailure> Stats(
        models::Timeframe timeframe = models::Timeframe::LastDay) const;

private:
    Result<models::KeyExchange, ProtocolFailure> LoadLocked(const std::string& exchange_id);

    configuration::ServiceConfig config_;
    std::shared_ptr<interfaces::IClock> clock_;
    std::shared_ptr<AlgorithmNegotiationLedger> ledger_;
    std::shared_ptr<interfaces::ICoordinationEventHandler> events_;
    std::shared_ptr<interfaces::ICoordinationStore> store_;
    mutable std::mutex lock_;
};

}
