#include "pfs/storage/key_material_store.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/aes_gcm.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"
#include "pfs/storage/in_memory_storage_backend.hpp"
#include "pfs/storage/proto_time.hpp"
#include "pfs/storage/state_key_providers.hpp"

#include <utility>

namespace pfs::protocol::storage {
    using crypto::AesGcm;
    using crypto::SodiumInterop;
    using debug::Component;
    using models::RatchetState;
    using models::SkippedMessageKey;
    using proto::storage::EncryptedField;
    using proto::storage::StoredRatchetState;
    using proto::storage::StoredSkippedKey;

    namespace {
        class ScopedWipe {
        public:
            explicit ScopedWipe(std::vector<uint8_t>& bytes) noexcept : bytes_(bytes) {}
            ~ScopedWipe() {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes_));
                (void) _wipe;
            }
            ScopedWipe(const ScopedWipe&) = delete;
            ScopedWipe& operator=(const ScopedWipe&) = delete;

        private:
            std::vector<uint8_t>& bytes_;
        };

        std::span<const uint8_t> AsBytes(const std::string& value) {
            return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
        }

        std::vector<uint8_t> ToVector(const std::string& value) {
            return {value.begin(), value.end()};
        }

        std::vector<uint8_t> FieldAad(
            std::string_view field,
            const std::string& owner_a,
            const std::string& owner_b) {
            const auto text = compat::format("{}|{}|{}|{}", kStateFieldAdLabel, field, owner_a, owner_b);
            return {text.begin(), text.end()};
        }

        Result<EncryptedField, ProtocolFailure> SealField(
            std::span<const uint8_t> key,
            std::span<const uint8_t> plaintext,
            std::span<const uint8_t> aad) {
            const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
            auto sealed_result = AesGcm::Encrypt(key, nonce, plaintext, aad);
            if (sealed_result.IsErr()) {
                return Fail(sealed_result.UnwrapErr());
            }
            const auto sealed = std::move(sealed_result).Unwrap();
            const size_t ciphertext_len = sealed.size() - kAesGcmTagBytes;
            EncryptedField field;
            field.set_ciphertext(sealed.data(), ciphertext_len);
            field.set_nonce(nonce.data(), nonce.size());
            field.set_auth_tag(sealed.data() + ciphertext_len, kAesGcmTagBytes);
            return Result<EncryptedField, ProtocolFailure>::Ok(std::move(field));
        }

        Result<std::vector<uint8_t>, ProtocolFailure> OpenField(
            std::span<const uint8_t> key,
            const EncryptedField& field,
            std::span<const uint8_t> aad,
            std::string_view field_name) {
            std::vector<uint8_t> sealed(field.ciphertext().begin(), field.ciphertext().end());
            sealed.insert(sealed.end(), field.auth_tag().begin(), field.auth_tag().end());
            auto opened = AesGcm::Decrypt(key, AsBytes(field.nonce()), sealed, aad);
            if (opened.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::CorruptedState(
                        compat::format("Stored field '{}' failed to decrypt", field_name)));
            }
            return opened;
        }

        /// Seals `value` into `*target` unless it is empty.
        Result<Unit, ProtocolFailure> SealInto(
            EncryptedField* target,
            std::span<const uint8_t> key,
            const std::vector<uint8_t>& value,
            std::string_view field_name,
            const std::string& conversation_id,
            const std::string& user_id) {
            if (value.empty()) {
                return Result<Unit, ProtocolFailure>::Ok(unit);
            }
            auto sealed = SealField(key, value, FieldAad(field_name, conversation_id, user_id));
            if (sealed.IsErr()) {
                return Fail(sealed.UnwrapErr());
            }
            *target = std::move(sealed).Unwrap();
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> OpenInto(
            std::vector<uint8_t>& target,
            std::span<const uint8_t> key,
            const bool present,
            const EncryptedField& field,
            std::string_view field_name,
            const std::string& conversation_id,
            const std::string& user_id) {
            if (!present) {
                target.clear();
                return Result<Unit, ProtocolFailure>::Ok(unit);
            }
            auto opened = OpenField(key, field, FieldAad(field_name, conversation_id, user_id), field_name);
            if (opened.IsErr()) {
                return Fail(opened.UnwrapErr());
            }
            target = std::move(opened).Unwrap();
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        std::vector<uint8_t> SkippedKeyAad(const std::string& ratchet_state_id, const std::string& message_key_id) {
            return FieldAad("skipped_key", ratchet_state_id, message_key_id);
        }
    }

    Result<std::unique_ptr<KeyMaterialStore>, ProtocolFailure> KeyMaterialStore::Create(
        std::shared_ptr<interfaces::IStorageBackend> backend,
        std::shared_ptr<interfaces::IStateKeyProvider> key_provider,
        const configuration::ServiceConfig& config,
        std::shared_ptr<interfaces::IClock> clock) {
        using StoreResult = Result<std::unique_ptr<KeyMaterialStore>, ProtocolFailure>;
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return StoreResult::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        PFS_TRY(config.Validate());

        if (!key_provider) {
            if (config.IsProduction()) {
                PFS_LOG_WARN(Component::Config, "state encryption key provider missing in production mode");
                return StoreResult::Err(ProtocolFailure::Configuration(
                    "A state encryption key provider is required in production mode"));
            }
            PFS_LOG_WARN(Component::Config,
                         "no state encryption key provider configured; using a random per-process key");
            auto generated = StaticStateKeyProvider::Generate();
            if (generated.IsErr()) {
                return StoreResult::Err(generated.UnwrapErr());
            }
            key_provider = std::move(generated).Unwrap();
        }
        if (!backend) {
            backend = std::make_shared<InMemoryStorageBackend>();
        }
        if (!clock) {
            clock = std::make_shared<interfaces::SystemClock>();
        }
        return StoreResult::Ok(std::unique_ptr<KeyMaterialStore>(new KeyMaterialStore(
            std::move(backend), std::move(key_provider), config, std::move(clock))));
    }

    KeyMaterialStore::KeyMaterialStore(
        std::shared_ptr<interfaces::IStorageBackend> backend,
        std::shared_ptr<interfaces::IStateKeyProvider> key_provider,
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock)
        : backend_(std::move(backend))
        , key_provider_(std::move(key_provider))
        , config_(std::move(config))
        , clock_(std::move(clock)) {}

    Result<std::vector<uint8_t>, ProtocolFailure> KeyMaterialStore::LoadKey() {
        auto handle_result = key_provider_->GetStateEncryptionKey();
        if (handle_result.IsErr()) {
            return Fail(handle_result.UnwrapErr());
        }
        const auto handle = std::move(handle_result).Unwrap();
        if (handle.Size() != kAesKeyBytes) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Configuration(
                    compat::format("State encryption key must be {} bytes", kAesKeyBytes)));
        }
        auto bytes = handle.ReadBytes(kAesKeyBytes);
        if (bytes.IsErr()) {
            return Fail(ProtocolFailure::FromSodiumFailure(bytes.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes).Unwrap());
    }

    Result<std::string, ProtocolFailure> KeyMaterialStore::Put(
        const std::string& conversation_id,
        const std::string& user_id,
        const RatchetState& state) {
        using IdResult = Result<std::string, ProtocolFailure>;
        if (conversation_id.empty() || user_id.empty()) {
            return IdResult::Err(ProtocolFailure::ValidationError("Conversation id and user id are required"));
        }
        if (state.root_key.size() != kRootKeyBytes) {
            return IdResult::Err(ProtocolFailure::ValidationError("Ratchet state has no root key"));
        }

        auto existing_result = backend_->LoadState(conversation_id, user_id);
        if (existing_result.IsErr()) {
            return Fail(existing_result.UnwrapErr());
        }
        const auto& existing = existing_result.Unwrap();

        auto key_result = LoadKey();
        if (key_result.IsErr()) {
            return Fail(key_result.UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        ScopedWipe wipe_key(key);

        const auto now = clock_->Now();
        StoredRatchetState record;
        record.set_id(existing ? existing->id()
                               : (state.id.empty() ? SodiumInterop::RandomHexId(kStateIdBytes) : state.id));
        record.set_conversation_id(conversation_id);
        record.set_user_id(user_id);

        PFS_TRY(SealInto(record.mutable_root_key(), key, state.root_key, "root_key", conversation_id, user_id));
        PFS_TRY(SealInto(record.mutable_sending_chain_key(), key, state.sending_chain_key,
                         "sending_chain_key", conversation_id, user_id));
        PFS_TRY(SealInto(record.mutable_receiving_chain_key(), key, state.receiving_chain_key,
                         "receiving_chain_key", conversation_id, user_id));
        PFS_TRY(SealInto(record.mutable_sending_ephemeral_private_key(), key, state.sending_ephemeral_private_key,
                         "sending_ephemeral_private_key", conversation_id, user_id));
        PFS_TRY(SealInto(record.mutable_kyber_secret_key(), key, state.kyber_secret_key,
                         "kyber_secret_key", conversation_id, user_id));
        record.set_has_sending_chain(state.HasSendingChain());
        record.set_has_receiving_chain(state.HasReceivingChain());

        record.set_sending_message_number(state.sending_message_number);
        record.set_receiving_message_number(state.receiving_message_number);
        record.set_sending_chain_length(state.sending_chain_length);
        record.set_receiving_chain_length(state.receiving_chain_length);
        record.set_previous_sending_count(state.previous_sending_count);
        record.set_sending_ephemeral_public_key(
            state.sending_ephemeral_public_key.data(), state.sending_ephemeral_public_key.size());
        record.set_receiving_ephemeral_public_key(
            state.receiving_ephemeral_public_key.data(), state.receiving_ephemeral_public_key.size());
        record.set_is_initiator(state.is_initiator);
        record.set_suite(state.IsHybrid() ? proto::storage::CIPHER_SUITE_HYBRID
                                          : proto::storage::CIPHER_SUITE_CLASSICAL);
        record.set_kyber_public_key(state.kyber_public_key.data(), state.kyber_public_key.size());
        record.set_peer_kyber_public_key(state.peer_kyber_public_key.data(), state.peer_kyber_public_key.size());
        record.set_sending_pqc_ciphertext(state.sending_pqc_ciphertext.data(), state.sending_pqc_ciphertext.size());
        record.set_skipped_key_sequence(state.skipped_key_sequence);
        record.set_version(state.version + 1);
        *record.mutable_created_at() = existing ? existing->created_at() : ToTimestamp(now);
        *record.mutable_updated_at() = ToTimestamp(now);

        if (auto saved = backend_->SaveState(record, state.version); saved.IsErr()) {
            PFS_LOG_FAILURE(Component::Store, "put", saved.UnwrapErr());
            return Fail(saved.UnwrapErr());
        }
        PFS_LOG_EVENT(Component::Store, "put state={} version={}", record.id(), record.version());
        return IdResult::Ok(record.id());
    }

    Result<std::optional<RatchetState>, ProtocolFailure> KeyMaterialStore::Get(
        const std::string& conversation_id,
        const std::string& user_id) {
        using StateResult = Result<std::optional<RatchetState>, ProtocolFailure>;
        auto loaded = backend_->LoadState(conversation_id, user_id);
        if (loaded.IsErr()) {
            return Fail(loaded.UnwrapErr());
        }
        auto record_opt = std::move(loaded).Unwrap();
        if (!record_opt) {
            return StateResult::Ok(std::nullopt);
        }
        const auto& record = *record_opt;

        auto key_result = LoadKey();
        if (key_result.IsErr()) {
            return Fail(key_result.UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        ScopedWipe wipe_key(key);

        RatchetState state;
        state.id = record.id();
        state.conversation_id = record.conversation_id();
        state.user_id = record.user_id();

        auto opened = OpenInto(state.root_key, key, record.has_root_key(), record.root_key(),
                               "root_key", conversation_id, user_id);
        if (opened.IsOk()) {
            opened = OpenInto(state.sending_chain_key, key, record.has_sending_chain_key(),
                              record.sending_chain_key(), "sending_chain_key", conversation_id, user_id);
        }
        if (opened.IsOk()) {
            opened = OpenInto(state.receiving_chain_key, key, record.has_receiving_chain_key(),
                              record.receiving_chain_key(), "receiving_chain_key", conversation_id, user_id);
        }
        if (opened.IsOk()) {
            opened = OpenInto(state.sending_ephemeral_private_key, key, record.has_sending_ephemeral_private_key(),
                              record.sending_ephemeral_private_key(), "sending_ephemeral_private_key",
                              conversation_id, user_id);
        }
        if (opened.IsOk()) {
            opened = OpenInto(state.kyber_secret_key, key, record.has_kyber_secret_key(),
                              record.kyber_secret_key(), "kyber_secret_key", conversation_id, user_id);
        }
        if (opened.IsOk() && (state.root_key.size() != kRootKeyBytes ||
                              state.HasSendingChain() != record.has_sending_chain() ||
                              state.HasReceivingChain() != record.has_receiving_chain())) {
            opened = Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::CorruptedState("Stored ratchet state is missing key material"));
        }
        if (opened.IsErr()) {
            state.WipeSecrets();
            PFS_LOG_FAILURE(Component::Store, "get", opened.UnwrapErr());
            return Fail(opened.UnwrapErr());
        }

        state.sending_message_number = record.sending_message_number();
        state.receiving_message_number = record.receiving_message_number();
        state.sending_chain_length = record.sending_chain_length();
        state.receiving_chain_length = record.receiving_chain_length();
        state.previous_sending_count = record.previous_sending_count();
        state.sending_ephemeral_public_key = ToVector(record.sending_ephemeral_public_key());
        state.receiving_ephemeral_public_key = ToVector(record.receiving_ephemeral_public_key());
        state.is_initiator = record.is_initiator();
        state.suite = record.suite() == proto::storage::CIPHER_SUITE_HYBRID
            ? models::CipherSuite::Hybrid
            : models::CipherSuite::Classical;
        state.kyber_public_key = ToVector(record.kyber_public_key());
        state.peer_kyber_public_key = ToVector(record.peer_kyber_public_key());
        state.sending_pqc_ciphertext = ToVector(record.sending_pqc_ciphertext());
        state.skipped_key_sequence = record.skipped_key_sequence();
        state.version = record.version();
        state.created_at = FromTimestamp(record.created_at());
        state.updated_at = FromTimestamp(record.updated_at());

        auto skipped_result = backend_->ListSkippedKeys(record.id());
        if (skipped_result.IsErr()) {
            state.WipeSecrets();
            return Fail(skipped_result.UnwrapErr());
        }
        const auto now = clock_->Now();
        for (const auto& stored : skipped_result.Unwrap()) {
            const auto expires_at = FromTimestamp(stored.expires_at());
            if (expires_at <= now) {
                continue;
            }
            auto key_bytes = OpenField(key, stored.encrypted_key(),
                                       SkippedKeyAad(record.id(), stored.message_key_id()),
                                       "skipped_key");
            if (key_bytes.IsErr()) {
                state.WipeSecrets();
                PFS_LOG_FAILURE(Component::Store, "get", key_bytes.UnwrapErr());
                return Fail(key_bytes.UnwrapErr());
            }
            SkippedMessageKey skipped;
            skipped.message_key_id = stored.message_key_id();
            skipped.key = std::move(key_bytes).Unwrap();
            skipped.chain_length = stored.chain_length();
            skipped.message_number = stored.message_number();
            skipped.sequence = stored.sequence();
            skipped.created_at = FromTimestamp(stored.created_at());
            skipped.expires_at = expires_at;
            state.skipped_keys.emplace(skipped.message_key_id, std::move(skipped));
        }
        return StateResult::Ok(std::move(state));
    }

    Result<bool, ProtocolFailure> KeyMaterialStore::Delete(
        const std::string& conversation_id,
        const std::string& user_id) {
        auto deleted = backend_->DeleteState(conversation_id, user_id);
        if (deleted.IsOk() && deleted.Unwrap()) {
            PFS_LOG_EVENT(Component::Store, "delete conversation={} user={}", conversation_id, user_id);
        }
        return deleted;
    }

    Result<Unit, ProtocolFailure> KeyMaterialStore::PutSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id,
        std::span<const uint8_t> key_bytes,
        const uint32_t chain_length,
        const uint32_t message_number,
        const uint64_t sequence) {
        if (ratchet_state_id.empty() || message_key_id.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Ratchet state id and message key id are required"));
        }
        if (key_bytes.size() != kMessageKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(
                    compat::format("Skipped message key must be {} bytes", kMessageKeyBytes)));
        }
        auto key_result = LoadKey();
        if (key_result.IsErr()) {
            return Fail(key_result.UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        ScopedWipe wipe_key(key);

        const auto now = clock_->Now();
        StoredSkippedKey record;
        record.set_ratchet_state_id(ratchet_state_id);
        record.set_message_key_id(message_key_id);
        auto sealed = SealField(key, key_bytes,
                                SkippedKeyAad(ratchet_state_id, message_key_id));
        if (sealed.IsErr()) {
            return Fail(sealed.UnwrapErr());
        }
        *record.mutable_encrypted_key() = std::move(sealed).Unwrap();
        record.set_chain_length(chain_length);
        record.set_message_number(message_number);
        record.set_sequence(sequence);
        *record.mutable_created_at() = ToTimestamp(now);
        *record.mutable_expires_at() = ToTimestamp(now + config_.ratchet.SkippedKeyTtl());
        return backend_->SaveSkippedKey(record);
    }

    Result<std::optional<SkippedMessageKey>, ProtocolFailure> KeyMaterialStore::GetSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id) {
        using KeyResult = Result<std::optional<SkippedMessageKey>, ProtocolFailure>;
        auto loaded = backend_->LoadSkippedKey(ratchet_state_id, message_key_id);
        if (loaded.IsErr()) {
            return Fail(loaded.UnwrapErr());
        }
        const auto& stored = loaded.Unwrap();
        if (!stored) {
            return KeyResult::Ok(std::nullopt);
        }
        const auto expires_at = FromTimestamp(stored->expires_at());
        if (expires_at <= clock_->Now()) {
            return KeyResult::Ok(std::nullopt);
        }
        auto key_result = LoadKey();
        if (key_result.IsErr()) {
            return Fail(key_result.UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        ScopedWipe wipe_key(key);

        auto opened = OpenField(key, stored->encrypted_key(),
                                SkippedKeyAad(ratchet_state_id, message_key_id),
                                "skipped_key");
        if (opened.IsErr()) {
            return Fail(opened.UnwrapErr());
        }
        SkippedMessageKey skipped;
        skipped.message_key_id = message_key_id;
        skipped.key = std::move(opened).Unwrap();
        skipped.chain_length = stored->chain_length();
        skipped.message_number = stored->message_number();
        skipped.sequence = stored->sequence();
        skipped.created_at = FromTimestamp(stored->created_at());
        skipped.expires_at = expires_at;
        return KeyResult::Ok(std::move(skipped));
    }

    Result<bool, ProtocolFailure> KeyMaterialStore::DeleteSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id) {
        return backend_->DeleteSkippedKey(ratchet_state_id, message_key_id);
    }

    Result<size_t, ProtocolFailure> KeyMaterialStore::CleanupExpired() {
        auto removed = backend_->DeleteSkippedKeysExpiredAt(clock_->Now());
        if (removed.IsErr()) {
            PFS_LOG_FAILURE(Component::Cleanup, "skipped key cleanup", removed.UnwrapErr());
            return removed;
        }
        if (removed.Unwrap() > 0) {
            PFS_LOG_EVENT(Component::Cleanup, "removed {} expired skipped keys", removed.Unwrap());
        }
        return removed;
    }

    Result<models::RatchetStatistics, ProtocolFailure> KeyMaterialStore::Statistics(
        const std::string& conversation_id,
        const std::string& user_id) {
        using StatsResult = Result<models::RatchetStatistics, ProtocolFailure>;
        auto loaded = backend_->LoadState(conversation_id, user_id);
        if (loaded.IsErr()) {
            return Fail(loaded.UnwrapErr());
        }
        const auto& record = loaded.Unwrap();
        if (!record) {
            return StatsResult::Err(ProtocolFailure::RatchetNotInitialized(
                "No ratchet state for this conversation and user"));
        }
        auto skipped = backend_->ListSkippedKeys(record->id());
        if (skipped.IsErr()) {
            return Fail(skipped.UnwrapErr());
        }
        const auto now = clock_->Now();
        models::RatchetStatistics stats;
        stats.sending_message_number = record->sending_message_number();
        stats.receiving_message_number = record->receiving_message_number();
        stats.sending_chain_length = record->sending_chain_length();
        stats.receiving_chain_length = record->receiving_chain_length();
        for (const auto& key : skipped.Unwrap()) {
            if (FromTimestamp(key.expires_at()) > now) {
                stats.skipped_keys_count += 1;
            }
        }
        stats.created_at = FromTimestamp(record->created_at());
        stats.updated_at = FromTimestamp(record->updated_at());
        return StatsResult::Ok(stats);
    }

    Result<std::vector<models::RatchetStateSummary>, ProtocolFailure> KeyMaterialStore::ListConversationStates(
        const std::string& conversation_id) {
        auto listed = backend_->ListStates(conversation_id);
        if (listed.IsErr()) {
            return Fail(listed.UnwrapErr());
        }
        std::vector<models::RatchetStateSummary> summaries;
        for (const auto& record : listed.Unwrap()) {
            models::RatchetStateSummary summary;
            summary.id = record.id();
            summary.user_id = record.user_id();
            summary.sending_chain_length = record.sending_chain_length();
            summary.receiving_chain_length = record.receiving_chain_length();
            summary.version = record.version();
            summary.updated_at = FromTimestamp(record.updated_at());
            summaries.push_back(std::move(summary));
        }
        return Result<std::vector<models::RatchetStateSummary>, ProtocolFailure>::Ok(std::move(summaries));
    }

    models::StoreHealth KeyMaterialStore::HealthCheck() {
        models::StoreHealth health;
        auto counts = backend_->Count(clock_->Now());
        if (counts.IsErr()) {
            PFS_LOG_FAILURE(Component::Store, "health check", counts.UnwrapErr());
            return health;
        }
        const auto& value = counts.Unwrap();
        health.total_ratchet_states = value.total_states;
        health.total_skipped_keys = value.total_skipped_keys;
        health.expired_keys = value.expired_skipped_keys;
        health.healthy = true;
        return health;
    }

}  // namespace pfs::protocol::storage
