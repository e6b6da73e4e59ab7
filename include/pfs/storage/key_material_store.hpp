#pragma once

#include "pfs/configuration/service_config.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/interfaces/i_state_key_provider.hpp"
#include "pfs/interfaces/i_storage_backend.hpp"
#include "pfs/models/ratchet_state.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pfs::protocol::storage {

/**
 * @brief Encrypted-at-rest persistence for ratchet state and retained skipped keys.
 *
 * Every secret member of a RatchetState (root key, both chain keys, the sending ephemeral
 * private key, the Kyber secret key) and every skipped message key is sealed separately with
 * AES-256-GCM under the operator key from IStateKeyProvider. The associated data names the
 * field and the owning (conversation, user), so a ciphertext moved to another field or another
 * record fails to open. Any such failure is reported as CorruptedState.
 *
 * Writes are optimistic: Put compares RatchetState::version with the stored version and
 * rejects a stale writer with InvalidState.
 *
 * @code
 * auto store = KeyMaterialStore::Create(backend, key_provider, ServiceConfig::Production(), clock);
 * if (store.IsErr()) { ... }  // Production without a key provider is a Configuration failure
 * @endcode
 */
class KeyMaterialStore {
public:
    /// `key_provider` may be null outside production; a random per-process key is used then.
    static Result<std::unique_ptr<KeyMaterialStore>, ProtocolFailure> Create(
        std::shared_ptr<interfaces::IStorageBackend> backend,
        std::shared_ptr<interfaces::IStateKeyProvider> key_provider,
        const configuration::ServiceConfig& config,
        std::shared_ptr<interfaces::IClock> clock);

    KeyMaterialStore(const KeyMaterialStore&) = delete;
    KeyMaterialStore& operator=(const KeyMaterialStore&) = delete;

    /// Upserts by (conversation, user); returns the ratchet state id. Skipped keys in
    /// `state` are not written here, see PutSkippedKey.
    Result<std::string, ProtocolFailure> Put(
        const std::string& conversation_id,
        const std::string& user_id,
        const models::RatchetState& state);

    /// Decrypted state with its non-expired skipped keys.
    Result<std::optional<models::RatchetState>, ProtocolFailure> Get(
        const std::string& conversation_id,
        const std::string& user_id);

    Result<bool, ProtocolFailure> Delete(
        const std::string& conversation_id,
        const std::string& user_id);

    Result<Unit, ProtocolFailure> PutSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id,
        std::span<const uint8_t> key,
        uint32_t chain_length,
        uint32_t message_number,
        uint64_t sequence = 0);

    Result<std::optional<models::SkippedMessageKey>, ProtocolFailure> GetSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id);

    Result<bool, ProtocolFailure> DeleteSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id);

    /// Removes every skipped key whose expiry has passed; returns how many.
    Result<size_t, ProtocolFailure> CleanupExpired();

    /// Counters only; nothing is decrypted. RatchetNotInitialized when no state exists.
    Result<models::RatchetStatistics, ProtocolFailure> Statistics(
        const std::string& conversation_id,
        const std::string& user_id);

    Result<std::vector<models::RatchetStateSummary>, ProtocolFailure> ListConversationStates(
        const std::string& conversation_id);

    /// Never fails; an unreachable backend reports healthy = false.
    models::StoreHealth HealthCheck();

private:
    KeyMaterialStore(
        std::shared_ptr<interfaces::IStorageBackend> backend,
        std::shared_ptr<interfaces::IStateKeyProvider> key_provider,
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock);

    Result<std::vector<uint8_t>, ProtocolFailure> LoadKey();

    std::shared_ptr<interfaces::IStorageBackend> backend_;
    std::shared_ptr<interfaces::IStateKeyProvider> key_provider_;
    configuration::ServiceConfig config_;
    std::shared_ptr<interfaces::IClock> clock_;
};

}
