#include "pfs/protocol/ratchet_engine.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"

#include <utility>

namespace pfs::protocol {
    using debug::Component;
    using models::RatchetState;

    RatchetEngine::RatchetEngine(
        std::shared_ptr<storage::KeyMaterialStore> store,
        configuration::RatchetConfig config,
        std::shared_ptr<interfaces::IClock> clock)
        : store_(std::move(store))
        , config_(config)
        , clock_(clock ? std::move(clock) : std::make_shared<interfaces::SystemClock>()) {
        auto init = crypto::SodiumInterop::Initialize();
        if (init.IsErr()) {
            PFS_LOG_WARN(Component::Ratchet, "libsodium initialization failed: {}", init.UnwrapErr().message);
        }
    }

    std::string RatchetEngine::LockKey(const std::string& conversation_id, const std::string& user_id) {
        return compat::format("{}\x1f{}", conversation_id, user_id);
    }

    Result<bool, ProtocolFailure> RatchetEngine::HasState(
        const std::string& conversation_id,
        const std::string& user_id) {
        auto guard = locks_.Lock(LockKey(conversation_id, user_id));
        auto stats = store_->Statistics(conversation_id, user_id);
        if (stats.IsOk()) {
            return Result<bool, ProtocolFailure>::Ok(true);
        }
        if (stats.UnwrapErr().type == ProtocolFailureType::RatchetNotInitialized) {
            return Result<bool, ProtocolFailure>::Ok(false);
        }
        return Fail(stats.UnwrapErr());
    }

    Result<RatchetState, ProtocolFailure> RatchetEngine::Initialize(
        const std::string& conversation_id,
        const std::string& user_id,
        std::span<const uint8_t> shared_secret,
        const bool is_initiator,
        const InitializeOptions& options) {
        auto guard = locks_.Lock(LockKey(conversation_id, user_id));

        auto existing = store_->Get(conversation_id, user_id);
        if (existing.IsErr()) {
            // A state that no longer decrypts can still be replaced explicitly.
            if (!(options.reset && existing.UnwrapErr().type == ProtocolFailureType::CorruptedState)) {
                return Fail(existing.UnwrapErr());
            }
        }
        const bool has_state = existing.IsErr() || existing.Unwrap().has_value();
        if (existing.IsOk() && existing.Unwrap()) {
            existing.Unwrap()->WipeSecrets();
        }
        if (has_state) {
            if (!options.reset) {
                return Result<RatchetState, ProtocolFailure>::Err(
                    ProtocolFailure::AlreadyInitialized("Ratchet state already exists for this conversation and user"));
            }
            PFS_TRY(store_->Delete(conversation_id, user_id));
        }

        auto state_result = RatchetSession::Bootstrap(
            conversation_id, user_id, shared_secret, is_initiator, options.hybrid, clock_->Now());
        if (state_result.IsErr()) {
            PFS_LOG_FAILURE(Component::Ratchet, "initialize", state_result.UnwrapErr());
            return state_result;
        }
        auto state = std::move(state_result).Unwrap();
        auto id_result = store_->Put(conversation_id, user_id, state);
        if (id_result.IsErr()) {
            state.WipeSecrets();
            return Fail(id_result.UnwrapErr());
        }
        state.id = std::move(id_result).Unwrap();
        state.version += 1;
        PFS_LOG_EVENT(Component::Ratchet, "initialized state={} initiator={} hybrid={}",
                      state.id, is_initiator, state.IsHybrid());
        return Result<RatchetState, ProtocolFailure>::Ok(std::move(state));
    }

    Result<RatchetSession, ProtocolFailure> RatchetEngine::LoadSession(
        const std::string& conversation_id,
        const std::string& user_id) {
        auto loaded = store_->Get(conversation_id, user_id);
        if (loaded.IsErr()) {
            return Fail(loaded.UnwrapErr());
        }
        auto state = std::move(loaded).Unwrap();
        if (!state) {
            return Result<RatchetSession, ProtocolFailure>::Err(
                ProtocolFailure::RatchetNotInitialized("No ratchet state for this conversation and user"));
        }
        return Result<RatchetSession, ProtocolFailure>::Ok(RatchetSession(std::move(*state), config_));
    }

    Result<proto::wire::RatchetEnvelope, ProtocolFailure> RatchetEngine::Encrypt(
        const std::string& conversation_id,
        const std::string& user_id,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data) {
        auto guard = locks_.Lock(LockKey(conversation_id, user_id));
        auto session_result = LoadSession(conversation_id, user_id);
        if (session_result.IsErr()) {
            return Fail(session_result.UnwrapErr());
        }
        auto session = std::move(session_result).Unwrap();

        auto envelope = session.Encrypt(plaintext, associated_data, clock_->Now());
        if (envelope.IsErr()) {
            PFS_LOG_FAILURE(Component::Ratchet, "encrypt", envelope.UnwrapErr());
            return envelope;
        }
        if (auto saved = store_->Put(conversation_id, user_id, session.State()); saved.IsErr()) {
            return Fail(saved.UnwrapErr());
        }
        return envelope;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetEngine::Decrypt(
        const std::string& conversation_id,
        const std::string& user_id,
        const proto::wire::RatchetEnvelope& envelope,
        std::span<const uint8_t> associated_data) {
        auto guard = locks_.Lock(LockKey(conversation_id, user_id));
        auto session_result = LoadSession(conversation_id, user_id);
        if (session_result.IsErr()) {
            return Fail(session_result.UnwrapErr());
        }
        auto session = std::move(session_result).Unwrap();

        auto outcome_result = session.Decrypt(envelope, associated_data, clock_->Now());
        if (outcome_result.IsErr()) {
            return Fail(outcome_result.UnwrapErr());
        }
        auto outcome = std::move(outcome_result).Unwrap();
        const auto& state = session.State();

        // Retained-key changes go in before the state: a consumed key must never outlive the
        // state write, otherwise the same envelope would decrypt twice.
        auto persisted = PersistSkippedKeyChanges(state.id, outcome.changes);
        if (persisted.IsOk()) {
            persisted = store_->Put(conversation_id, user_id, state).Map([](std::string) { return unit; });
        }
        if (persisted.IsErr()) {
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span(outcome.plaintext));
            (void) _wipe;
            PFS_LOG_FAILURE(Component::Ratchet, "decrypt persist", persisted.UnwrapErr());
            return Fail(persisted.UnwrapErr());
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(outcome.plaintext));
    }

    Result<Unit, ProtocolFailure> RatchetEngine::PersistSkippedKeyChanges(
        const std::string& ratchet_state_id,
        SkippedKeyChanges& changes) {
        for (auto& added : changes.added) {
            auto put = store_->PutSkippedKey(ratchet_state_id, added.message_key_id, added.key,
                                             added.chain_length, added.message_number, added.sequence);
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span(added.key));
            (void) _wipe;
            PFS_TRY(put);
        }
        for (const auto& removed : changes.removed) {
            PFS_TRY(store_->DeleteSkippedKey(ratchet_state_id, removed));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<bool, ProtocolFailure> RatchetEngine::Reset(
        const std::string& conversation_id,
        const std::string& user_id) {
        auto guard = locks_.Lock(LockKey(conversation_id, user_id));
        return store_->Delete(conversation_id, user_id);
    }

    Result<models::RatchetStatistics, ProtocolFailure> RatchetEngine::Statistics(
        const std::string& conversation_id,
        const std::string& user_id) {
        return store_->Statistics(conversation_id, user_id);
    }

}  // namespace pfs::protocol
