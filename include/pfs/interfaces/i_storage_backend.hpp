#pragma once
#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "storage/ratchet_store.pb.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pfs::protocol::interfaces {

struct BackendCounts {
    size_t total_states = 0;
    size_t total_skipped_keys = 0;
    size_t expired_skipped_keys = 0;
};

/**
 * Persistence for already-encrypted ratchet records. Implementations only see
 * EncryptedField payloads, never plaintext keys.
 *
 * Every method reports backend trouble as StorageUnavailable. SaveState is a
 * compare-and-swap on the stored version: it fails with InvalidState when the stored
 * version is not `expected_version` (0 meaning "no record yet").
 */
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    virtual Result<std::optional<proto::storage::StoredRatchetState>, ProtocolFailure>
    LoadState(const std::string& conversation_id, const std::string& user_id) = 0;

    virtual Result<Unit, ProtocolFailure>
    SaveState(const proto::storage::StoredRatchetState& record, uint64_t expected_version) = 0;

    /// Removes the state and all of its skipped keys.
    virtual Result<bool, ProtocolFailure>
    DeleteState(const std::string& conversation_id, const std::string& user_id) = 0;

    virtual Result<std::vector<proto::storage::StoredRatchetState>, ProtocolFailure>
    ListStates(const std::string& conversation_id) = 0;

    virtual Result<Unit, ProtocolFailure>
    SaveSkippedKey(const proto::storage::StoredSkippedKey& record) = 0;

    virtual Result<std::optional<proto::storage::StoredSkippedKey>, ProtocolFailure>
    LoadSkippedKey(const std::string& ratchet_state_id, const std::string& message_key_id) = 0;

    virtual Result<std::vector<proto::storage::StoredSkippedKey>, ProtocolFailure>
    ListSkippedKeys(const std::string& ratchet_state_id) = 0;

    virtual Result<bool, ProtocolFailure>
    DeleteSkippedKey(const std::string& ratchet_state_id, const std::string& message_key_id) = 0;

    /// Deletes by predicate (expires_at <= now); returns how many went.
    virtual Result<size_t, ProtocolFailure> DeleteSkippedKeysExpiredAt(TimePoint now) = 0;

    virtual Result<BackendCounts, ProtocolFailure> Count(TimePoint now) = 0;
};

}
