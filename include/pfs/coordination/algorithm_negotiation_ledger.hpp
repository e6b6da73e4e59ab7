#pragma once

#include "pfs/configuration/service_config.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/interfaces/i_coordination_store.hpp"
#include "pfs/models/algorithm_negotiation.hpp"
#include "pfs/models/timeframe.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pfs::protocol::coordination {

/**
 * @brief Which suite each conversation agreed on, plus a tally of relayed messages.
 *
 * One record per conversation is active at a time; recording a new negotiation retires the
 * previous one. Records stop being active after the negotiation TTL (30 days by default).
 * CleanupExpired prunes retired or expired negotiations and message tallies once they are older
 * than the record retention window, so the statistics windows are never short of data.
 */
class AlgorithmNegotiationLedger {
public:
    AlgorithmNegotiationLedger(
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::ICoordinationStore> store = nullptr);

    Result<std::string, ProtocolFailure> Record(
        const std::string& conversation_id,
        const std::string& initiator_id,
        const std::string& responder_id,
        const models::NegotiationOutcome& outcome);

    Result<std::optional<models::AlgorithmNegotiation>, ProtocolFailure> GetActive(
        const std::string& conversation_id) const;

    /// Counts one relayed message under `algorithm` (e.g. "X25519-ChaCha20Poly1305").
    Result<Unit, ProtocolFailure> RecordMessage(
        const std::string& conversation_id,
        const std::string& algorithm,
        bool encrypted);

    Result<models::EncryptionStatus, ProtocolFailure> EncryptionStatus(const std::string& conversation_id) const;

    Result<models::NegotiationStats, ProtocolFailure> Stats(
        models::Timeframe timeframe = models::Timeframe::LastDay) const;

    /// Returns how many negotiations and message tallies were removed.
    Result<size_t, ProtocolFailure> CleanupExpired();

private:
    Result<std::optional<models::AlgorithmNegotiation>, ProtocolFailure> ActiveLocked(
        const std::string& conversation_id,
        interfaces::TimePoint now) const;

    configuration::ServiceConfig config_;
    std::shared_ptr<interfaces::IClock> clock_;
    std::shared_ptr<interfaces::ICoordinationStore> store_;
    mutable std::mutex lock_;
};

}
