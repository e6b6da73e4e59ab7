#include "pfs/coordination/key_exchange_coordinator.hpp"
#include "pfs/coordination/in_memory_coordination_store.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"

#include <algorithm>
#include <cmath>

namespace pfs::protocol::coordination {
    using debug::Component;
    using models::ExchangeReceipt;
    using models::ExchangeStatus;
    using models::ExchangeType;
    using models::KeyExchange;

    namespace {
        bool IsLive(const KeyExchange& exchange) {
            return exchange.status == ExchangeStatus::Pending || exchange.status == ExchangeStatus::Responded;
        }

        bool IsPastDeadline(const KeyExchange& exchange, const interfaces::TimePoint now) {
            return IsLive(exchange) && now > exchange.expires_at;
        }

        bool Involves(const KeyExchange& exchange, const std::string& user_id) {
            return exchange.initiator_id == user_id || exchange.recipient_id == user_id;
        }

        models::NegotiationOutcome OutcomeOf(const KeyExchange& exchange) {
            const auto& bundle = exchange.public_key_bundle;
            models::NegotiationOutcome outcome;
            outcome.selected = bundle.selected;
            outcome.security_level = bundle.security_level;
            outcome.quantum_resistant = bundle.quantum_resistant;
            outcome.hybrid_mode = bundle.hybrid_mode;
            outcome.protocol_version = bundle.protocol_version;
            outcome.capabilities.local = bundle.capabilities;
            if (exchange.recipient_public_key_bundle) {
                outcome.capabilities.remote = exchange.recipient_public_key_bundle->capabilities;
            }
            return outcome;
        }
    }

    KeyExchangeCoordinator::KeyExchangeCoordinator(
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<AlgorithmNegotiationLedger> ledger,
        std::shared_ptr<interfaces::ICoordinationEventHandler> events,
        std::shared_ptr<interfaces::ICoordinationStore> store)
        : config_(std::move(config))
        , clock_(clock ? std::move(clock) : std::make_shared<interfaces::SystemClock>())
        , ledger_(std::move(ledger))
        , events_(std::move(events))
        , store_(store ? std::move(store) : std::make_shared<InMemoryCoordinationStore>()) {}

    Result<KeyExchange, ProtocolFailure> KeyExchangeCoordinator::LoadLocked(const std::string& exchange_id) {
        auto loaded = store_->LoadExchange(exchange_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& found = loaded.Unwrap();
        if (!found) {
            return Result<KeyExchange, ProtocolFailure>::Err(
                ProtocolFailure::ExchangeNotFound("Key exchange not found"));
        }
        return Result<KeyExchange, ProtocolFailure>::Ok(std::move(*found));
    }

    Result<ExchangeReceipt, ProtocolFailure> KeyExchangeCoordinator::Initiate(
        const std::string& initiator_id,
        const std::string& recipient_id,
        const std::string& conversation_id,
        const std::string_view exchange_type,
        const models::PublicKeyBundle& public_key_bundle,
        std::span<const uint8_t> encrypted_key_data) {
        if (initiator_id.empty() || recipient_id.empty() || conversation_id.empty()) {
            return Result<ExchangeReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Initiator, recipient and conversation ids are required"));
        }
        if (initiator_id == recipient_id) {
            return Result<ExchangeReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Cannot exchange keys with oneself"));
        }
        const auto type = models::ParseExchangeType(exchange_type);
        if (!type) {
            return Result<ExchangeReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(compat::format("Unknown exchange type '{}'", exchange_type)));
        }
        if (public_key_bundle.x25519_public_key.size() != kX25519PublicKeyBytes) {
            return Result<ExchangeReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Public key bundle must carry a 32-byte X25519 key"));
        }
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<ExchangeReceipt, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        const auto now = clock_->Now();
        KeyExchange exchange;
        exchange.id = crypto::SodiumInterop::RandomHexId(kExchangeIdBytes);
        exchange.initiator_id = initiator_id;
        exchange.recipient_id = recipient_id;
        exchange.conversation_id = conversation_id;
        exchange.type = *type;
        exchange.status = ExchangeStatus::Pending;
        exchange.public_key_bundle = public_key_bundle;
        exchange.encrypted_key_data.assign(encrypted_key_data.begin(), encrypted_key_data.end());
        exchange.created_at = now;
        exchange.expires_at = now + config_.exchange_ttl;

        ExchangeReceipt receipt{exchange.id, exchange.status, exchange.expires_at};
        {
            std::lock_guard<std::mutex> guard(lock_);
            PFS_TRY(store_->SaveExchange(exchange));
        }
        PFS_LOG_EVENT(Component::Exchange, "initiated exchange={} type={} conversation={}",
                      receipt.exchange_id, exchange_type, conversation_id);
        if (events_) {
            events_->OnExchangeInitiated(receipt.exchange_id, recipient_id);
        }
        return Result<ExchangeReceipt, ProtocolFailure>::Ok(std::move(receipt));
    }

    Result<ExchangeReceipt, ProtocolFailure> KeyExchangeCoordinator::Respond(
        const std::string& exchange_id,
        const std::string& recipient_id,
        std::span<const uint8_t> response_data,
        const models::PublicKeyBundle& public_key_bundle) {
        const auto now = clock_->Now();
        ExchangeReceipt receipt;
        std::string initiator_id;
        {
            std::lock_guard<std::mutex> guard(lock_);
            auto loaded = LoadLocked(exchange_id);
            if (loaded.IsErr()) {
                return Fail(std::move(loaded).UnwrapErr());
            }
            auto& exchange = loaded.Unwrap();
            if (exchange.recipient_id != recipient_id) {
                return Result<ExchangeReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::ExchangeUnauthorized("Only the recipient may respond to this exchange"));
            }
            if (IsPastDeadline(exchange, now)) {
                exchange.status = ExchangeStatus::Expired;
                PFS_TRY(store_->SaveExchange(exchange));
            }
            if (exchange.status == ExchangeStatus::Expired) {
                return Result<ExchangeReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::ExchangeExpired("Key exchange has expired"));
            }
            if (exchange.status != ExchangeStatus::Pending) {
                return Result<ExchangeReceipt, ProtocolFailure>::Err(ProtocolFailure::ExchangeInvalidState(
                    compat::format("Cannot respond to an exchange in state {}", models::ToString(exchange.status))));
            }
            exchange.status = ExchangeStatus::Responded;
            exchange.response_data.assign(response_data.begin(), response_data.end());
            exchange.recipient_public_key_bundle = public_key_bundle;
            exchange.responded_at = now;
            PFS_TRY(store_->SaveExchange(exchange));
            receipt = ExchangeReceipt{exchange.id, exchange.status, exchange.expires_at};
            initiator_id = exchange.initiator_id;
        }
        PFS_LOG_EVENT(Component::Exchange, "responded exchange={}", exchange_id);
        if (events_) {
            events_->OnExchangeResponded(exchange_id, initiator_id);
        }
        return Result<ExchangeReceipt, ProtocolFailure>::Ok(std::move(receipt));
    }

    Result<ExchangeReceipt, ProtocolFailure> KeyExchangeCoordinator::Complete(
        const std::string& exchange_id,
        const std::string& user_id,
        std::span<const uint8_t> confirmation_signature) {
        const auto now = clock_->Now();
        ExchangeReceipt receipt;
        KeyExchange completed;
        {
            std::lock_guard<std::mutex> guard(lock_);
            auto loaded = LoadLocked(exchange_id);
            if (loaded.IsErr()) {
                return Fail(std::move(loaded).UnwrapErr());
            }
            auto& exchange = loaded.Unwrap();
            if (!Involves(exchange, user_id)) {
                return Result<ExchangeReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::ExchangeUnauthorized("Caller is not a party to this exchange"));
            }
            if (IsPastDeadline(exchange, now)) {
                exchange.status = ExchangeStatus::Expired;
                PFS_TRY(store_->SaveExchange(exchange));
            }
            if (exchange.status == ExchangeStatus::Expired) {
                return Result<ExchangeReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::ExchangeExpired("Key exchange has expired"));
            }
            if (exchange.status != ExchangeStatus::Responded) {
                return Result<ExchangeReceipt, ProtocolFailure>::Err(ProtocolFailure::ExchangeInvalidState(
                    compat::format("Cannot complete an exchange in state {}", models::ToString(exchange.status))));
            }
            exchange.status = ExchangeStatus::Completed;
            exchange.confirmation_signature.assign(confirmation_signature.begin(), confirmation_signature.end());
            exchange.completed_at = now;
            PFS_TRY(store_->SaveExchange(exchange));
            receipt = ExchangeReceipt{exchange.id, exchange.status, exchange.expires_at};
            completed = exchange;
        }

        if (completed.type == ExchangeType::InitialSetup && ledger_) {
            // The exchange is already committed; a ledger failure only costs the statistics.
            auto recorded = ledger_->Record(
                completed.conversation_id, completed.initiator_id, completed.recipient_id, OutcomeOf(completed));
            if (recorded.IsErr()) {
                PFS_LOG_FAILURE(Component::Exchange, "record negotiation", recorded.UnwrapErr());
            }
        }
        PFS_LOG_EVENT(Component::Exchange, "completed exchange={} conversation={}",
                      exchange_id, completed.conversation_id);
        if (events_) {
            events_->OnExchangeCompleted(exchange_id, completed.conversation_id);
        }
        return Result<ExchangeReceipt, ProtocolFailure>::Ok(std::move(receipt));
    }

    Result<std::vector<models::PendingExchange>, ProtocolFailure> KeyExchangeCoordinator::ListPending(
        const std::string& user_id,
        size_t limit) {
        if (limit == 0) {
            limit = config_.pending_exchange_limit;
        }
        const auto now = clock_->Now();
        std::vector<models::PendingExchange> pending;
        std::lock_guard<std::mutex> guard(lock_);
        auto listed = store_->ListExchanges();
        if (listed.IsErr()) {
            return Fail(std::move(listed).UnwrapErr());
        }
        for (auto& exchange : listed.Unwrap()) {
            if (!Involves(exchange, user_id) || !IsLive(exchange)) {
                continue;
            }
            if (IsPastDeadline(exchange, now)) {
                exchange.status = ExchangeStatus::Expired;
                PFS_TRY(store_->SaveExchange(exchange));
                continue;
            }
            const bool is_initiator = exchange.initiator_id == user_id;
            pending.push_back(models::PendingExchange{
                exchange.id,
                exchange.conversation_id,
                exchange.type,
                exchange.status,
                is_initiator,
                is_initiator ? exchange.recipient_id : exchange.initiator_id,
                exchange.public_key_bundle,
                exchange.created_at,
                exchange.expires_at});
        }
        std::stable_sort(pending.begin(), pending.end(), [](const auto& a, const auto& b) {
            return a.created_at > b.created_at;
        });
        if (pending.size() > limit) {
            pending.resize(limit);
        }
        return Result<std::vector<models::PendingExchange>, ProtocolFailure>::Ok(std::move(pending));
    }

    Result<models::ExchangeData, ProtocolFailure> KeyExchangeCoordinator::GetData(
        const std::string& exchange_id,
        const std::string& user_id) {
        const auto now = clock_->Now();
        std::lock_guard<std::mutex> guard(lock_);
        auto loaded = LoadLocked(exchange_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& exchange = loaded.Unwrap();
        if (!Involves(exchange, user_id)) {
            return Result<models::ExchangeData, ProtocolFailure>::Err(
                ProtocolFailure::ExchangeUnauthorized("Caller is not a party to this exchange"));
        }
        if (IsPastDeadline(exchange, now)) {
            exchange.status = ExchangeStatus::Expired;
            PFS_TRY(store_->SaveExchange(exchange));
        }

        models::ExchangeData data;
        data.exchange_id = exchange.id;
        data.conversation_id = exchange.conversation_id;
        data.type = exchange.type;
        data.status = exchange.status;
        data.public_key_bundle = exchange.public_key_bundle;
        data.created_at = exchange.created_at;
        data.responded_at = exchange.responded_at;
        data.expires_at = exchange.expires_at;
        if (exchange.initiator_id == user_id) {
            if (exchange.responded_at) {
                data.response_data = exchange.response_data;
            }
            data.recipient_public_key_bundle = exchange.recipient_public_key_bundle;
        } else {
            data.encrypted_key_data = exchange.encrypted_key_data;
        }
        return Result<models::ExchangeData, ProtocolFailure>::Ok(std::move(data));
    }

    Result<size_t, ProtocolFailure> KeyExchangeCoordinator::CleanupExpired() {
        const auto now = clock_->Now();
        const auto retention_cutoff = now - config_.record_retention;
        std::lock_guard<std::mutex> guard(lock_);
        auto listed = store_->ListExchanges();
        if (listed.IsErr()) {
            return Fail(std::move(listed).UnwrapErr());
        }
        size_t removed = 0;
        for (const auto& exchange : listed.Unwrap()) {
            const bool expired = exchange.status == ExchangeStatus::Expired || IsPastDeadline(exchange, now);
            const bool retired = exchange.status == ExchangeStatus::Completed && exchange.created_at < retention_cutoff;
            if (!expired && !retired) {
                continue;
            }
            auto deleted = store_->DeleteExchange(exchange.id);
            if (deleted.IsErr()) {
                return Fail(std::move(deleted).UnwrapErr());
            }
            if (deleted.Unwrap()) {
                removed += 1;
            }
        }
        if (removed > 0) {
            PFS_LOG_EVENT(Component::Cleanup, "removed {} key exchanges", removed);
        }
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

    Result<models::ExchangeStats, ProtocolFailure> KeyExchangeCoordinator::Stats(
        const models::Timeframe timeframe) const {
        const auto since = clock_->Now() - models::Duration(timeframe);
        std::lock_guard<std::mutex> guard(lock_);
        auto listed = store_->ListExchanges();
        if (listed.IsErr()) {
            return Fail(std::move(listed).UnwrapErr());
        }
        models::ExchangeStats stats;
        size_t completed = 0;
        for (const auto& exchange : listed.Unwrap()) {
            if (exchange.created_at < since) {
                continue;
            }
            stats.total += 1;
            stats.by_status[exchange.status] += 1;
            stats.by_type[exchange.type] += 1;
            if (exchange.status == ExchangeStatus::Completed) {
                completed += 1;
            }
        }
        if (stats.total > 0) {
            stats.success_rate =
                std::round(static_cast<double>(completed) * 10000.0 / static_cast<double>(stats.total)) / 100.0;
        }
        return Result<models::ExchangeStats, ProtocolFailure>::Ok(std::move(stats));
    }

}  // namespace pfs::protocol::coordination
