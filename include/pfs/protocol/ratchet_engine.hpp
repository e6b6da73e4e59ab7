#pragma once

#include "pfs/configuration/ratchet_config.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/models/ratchet_state.hpp"
#include "pfs/protocol/keyed_mutex.hpp"
#include "pfs/protocol/ratchet_session.hpp"
#include "pfs/storage/key_material_store.hpp"
#include "wire/envelope.pb.h"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pfs::protocol {

struct InitializeOptions {
    /// Replace an existing state instead of failing with AlreadyInitialized.
    bool reset = false;
    std::optional<HybridKeys> hybrid;
};

/**
 * @brief Keyed ratchet service: one RatchetSession per (conversation, user), persisted
 * through KeyMaterialStore between calls.
 *
 * Calls for the same (conversation, user) are serialized; different pairs run in parallel.
 * Each call loads the state, runs the transition and writes the result back before the lock
 * is released, so two concurrent Encrypts never share a message number.
 *
 * @code
 * auto alice = engine.Initialize("conv", "alice", secret, true, {});
 * auto envelope = engine.Encrypt("conv", "alice", plaintext, {});
 * auto plaintext = engine.Decrypt("conv", "bob", envelope.Unwrap(), {});
 * @endcode
 */
class RatchetEngine {
public:
    RatchetEngine(
        std::shared_ptr<storage::KeyMaterialStore> store,
        configuration::RatchetConfig config,
        std::shared_ptr<interfaces::IClock> clock);

    RatchetEngine(const RatchetEngine&) = delete;
    RatchetEngine& operator=(const RatchetEngine&) = delete;

    Result<bool, ProtocolFailure> HasState(
        const std::string& conversation_id,
        const std::string& user_id);

    Result<models::RatchetState, ProtocolFailure> Initialize(
        const std::string& conversation_id,
        const std::string& user_id,
        std::span<const uint8_t> shared_secret,
        bool is_initiator,
        const InitializeOptions& options);

    Result<proto::wire::RatchetEnvelope, ProtocolFailure> Encrypt(
        const std::string& conversation_id,
        const std::string& user_id,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const std::string& conversation_id,
        const std::string& user_id,
        const proto::wire::RatchetEnvelope& envelope,
        std::span<const uint8_t> associated_data = {});

    /// Deletes the state and its skipped keys. False when there was nothing to delete.
    Result<bool, ProtocolFailure> Reset(
        const std::string& conversation_id,
        const std::string& user_id);

    Result<models::RatchetStatistics, ProtocolFailure> Statistics(
        const std::string& conversation_id,
        const std::string& user_id);

private:
    Result<RatchetSession, ProtocolFailure> LoadSession(
        const std::string& conversation_id,
        const std::string& user_id);

    Result<Unit, ProtocolFailure> PersistSkippedKeyChanges(
        const std::string& ratchet_state_id,
        SkippedKeyChanges& changes);

    static std::string LockKey(const std::string& conversation_id, const std::string& user_id);

    std::shared_ptr<storage::KeyMaterialStore> store_;
    configuration::RatchetConfig config_;
    std::shared_ptr<interfaces::IClock> clock_;
    KeyedMutex locks_;
};

}
