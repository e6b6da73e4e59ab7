#include "pfs/coordination/algorithm_negotiation_ledger.hpp"
#include "pfs/coordination/in_memory_coordination_store.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"

#include <cmath>

namespace pfs::protocol::coordination {
    using debug::Component;
    using models::AlgorithmNegotiation;

    namespace {
        double Percent(const size_t part, const size_t total) {
            if (total == 0) {
                return 0.0;
            }
            return std::round(static_cast<double>(part) * 10000.0 / static_cast<double>(total)) / 100.0;
        }
    }

    AlgorithmNegotiationLedger::AlgorithmNegotiationLedger(
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::ICoordinationStore> store)
        : config_(std::move(config))
        , clock_(clock ? std::move(clock) : std::make_shared<interfaces::SystemClock>())
        , store_(store ? std::move(store) : std::make_shared<InMemoryCoordinationStore>()) {}

    Result<std::string, ProtocolFailure> AlgorithmNegotiationLedger::Record(
        const std::string& conversation_id,
        const std::string& initiator_id,
        const std::string& responder_id,
        const models::NegotiationOutcome& outcome) {
        if (conversation_id.empty() || initiator_id.empty() || responder_id.empty()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Conversation, initiator and responder ids are required"));
        }
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        const auto now = clock_->Now();

        AlgorithmNegotiation negotiation;
        negotiation.negotiation_id = crypto::SodiumInterop::RandomHexId(kNegotiationIdBytes);
        negotiation.conversation_id = conversation_id;
        negotiation.initiator_id = initiator_id;
        negotiation.responder_id = responder_id;
        negotiation.selected = outcome.selected;
        negotiation.achieved_security_level = outcome.security_level;
        negotiation.quantum_resistant = outcome.quantum_resistant;
        negotiation.hybrid_mode = outcome.hybrid_mode;
        negotiation.protocol_version = outcome.protocol_version;
        negotiation.capabilities = outcome.capabilities;
        negotiation.created_at = now;
        negotiation.expires_at = now + config_.negotiation_ttl;
        negotiation.is_active = true;

        std::lock_guard<std::mutex> guard(lock_);
        auto previous = store_->ListNegotiations(conversation_id);
        if (previous.IsErr()) {
            return Fail(std::move(previous).UnwrapErr());
        }
        for (auto& retired : previous.Unwrap()) {
            if (retired.is_active) {
                retired.is_active = false;
                PFS_TRY(store_->SaveNegotiation(retired));
            }
        }
        PFS_TRY(store_->SaveNegotiation(negotiation));
        PFS_LOG_EVENT(Component::Negotiation, "recorded negotiation={} conversation={} kex={}",
                      negotiation.negotiation_id, conversation_id, models::ToString(outcome.selected.key_exchange));
        return Result<std::string, ProtocolFailure>::Ok(negotiation.negotiation_id);
    }

    Result<std::optional<AlgorithmNegotiation>, ProtocolFailure> AlgorithmNegotiationLedger::ActiveLocked(
        const std::string& conversation_id,
        const interfaces::TimePoint now) const {
        auto listed = store_->ListNegotiations(conversation_id);
        if (listed.IsErr()) {
            return Fail(std::move(listed).UnwrapErr());
        }
        const auto& negotiations = listed.Unwrap();
        for (auto it = negotiations.rbegin(); it != negotiations.rend(); ++it) {
            if (it->is_active && it->expires_at > now) {
                return Result<std::optional<AlgorithmNegotiation>, ProtocolFailure>::Ok(*it);
            }
        }
        return Result<std::optional<AlgorithmNegotiation>, ProtocolFailure>::Ok(std::nullopt);
    }

    Result<std::optional<AlgorithmNegotiation>, ProtocolFailure> AlgorithmNegotiationLedger::GetActive(
        const std::string& conversation_id) const {
        const auto now = clock_->Now();
        std::lock_guard<std::mutex> guard(lock_);
        return ActiveLocked(conversation_id, now);
    }

    Result<Unit, ProtocolFailure> AlgorithmNegotiationLedger::RecordMessage(
        const std::string& conversation_id,
        const std::string& algorithm,
        const bool encrypted) {
        if (conversation_id.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Conversation id is required"));
        }
        const models::RelayedMessage message{
            conversation_id, algorithm.empty() ? std::string("none") : algorithm, encrypted, clock_->Now()};
        std::lock_guard<std::mutex> guard(lock_);
        PFS_TRY(store_->AppendMessage(message));
        if (encrypted) {
            PFS_TRY(store_->MarkConversationEncrypted(conversation_id));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<models::EncryptionStatus, ProtocolFailure> AlgorithmNegotiationLedger::EncryptionStatus(
        const std::string& conversation_id) const {
        const auto now = clock_->Now();
        std::lock_guard<std::mutex> guard(lock_);
        models::EncryptionStatus status;
        auto encrypted = store_->IsConversationEncrypted(conversation_id);
        if (encrypted.IsErr()) {
            return Fail(std::move(encrypted).UnwrapErr());
        }
        status.encryption_enabled = encrypted.Unwrap();

        auto active = ActiveLocked(conversation_id, now);
        if (active.IsErr()) {
            return Fail(std::move(active).UnwrapErr());
        }
        if (const auto& negotiation = active.Unwrap()) {
            status.has_negotiation = true;
            status.security_level = negotiation->achieved_security_level;
            status.quantum_resistant = negotiation->quantum_resistant;
            status.algorithm = std::string(models::ToString(negotiation->selected.key_exchange));
            status.negotiated_at = negotiation->created_at;
        }
        return Result<models::EncryptionStatus, ProtocolFailure>::Ok(std::move(status));
    }

    Result<models::NegotiationStats, ProtocolFailure> AlgorithmNegotiationLedger::Stats(
        const models::Timeframe timeframe) const {
        const auto since = clock_->Now() - models::Duration(timeframe);
        std::lock_guard<std::mutex> guard(lock_);
        auto messages = store_->ListMessagesSince(since);
        if (messages.IsErr()) {
            return Fail(std::move(messages).UnwrapErr());
        }
        auto negotiations = store_->ListAllNegotiations();
        if (negotiations.IsErr()) {
            return Fail(std::move(negotiations).UnwrapErr());
        }

        models::NegotiationStats stats;
        for (const auto& message : messages.Unwrap()) {
            stats.total += 1;
            if (message.encrypted) {
                stats.encrypted += 1;
            }
            stats.by_algorithm[message.algorithm] += 1;
        }
        stats.encryption_rate = Percent(stats.encrypted, stats.total);
        for (const auto& negotiation : negotiations.Unwrap()) {
            if (negotiation.created_at < since) {
                continue;
            }
            stats.negotiations += 1;
            if (negotiation.quantum_resistant) {
                stats.quantum_resistant_negotiations += 1;
            }
        }
        return Result<models::NegotiationStats, ProtocolFailure>::Ok(std::move(stats));
    }

    Result<size_t, ProtocolFailure> AlgorithmNegotiationLedger::CleanupExpired() {
        const auto now = clock_->Now();
        const auto retention_cutoff = now - config_.record_retention;
        std::lock_guard<std::mutex> guard(lock_);

        auto pruned_messages = store_->DeleteMessagesBefore(retention_cutoff);
        if (pruned_messages.IsErr()) {
            return Fail(std::move(pruned_messages).UnwrapErr());
        }
        size_t removed = pruned_messages.Unwrap();

        auto negotiations = store_->ListAllNegotiations();
        if (negotiations.IsErr()) {
            return Fail(std::move(negotiations).UnwrapErr());
        }
        for (const auto& negotiation : negotiations.Unwrap()) {
            const bool in_force = negotiation.is_active && negotiation.expires_at > now;
            if (in_force || negotiation.created_at >= retention_cutoff) {
                continue;
            }
            auto deleted = store_->DeleteNegotiation(negotiation.negotiation_id);
            if (deleted.IsErr()) {
                return Fail(std::move(deleted).UnwrapErr());
            }
            if (deleted.Unwrap()) {
                removed += 1;
            }
        }
        if (removed > 0) {
            PFS_LOG_EVENT(Component::Cleanup, "pruned {} negotiation ledger records", removed);
        }
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

}  // namespace pfs::protocol::coordination
