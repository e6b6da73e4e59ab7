#pragma once

#include "pfs/interfaces/i_storage_backend.hpp"

#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace pfs::protocol::storage {

/// Process-local IStorageBackend. Default backend for development and the test suite.
class InMemoryStorageBackend final : public interfaces::IStorageBackend {
public:
    Result<std::optional<proto::storage::StoredRatchetState>, ProtocolFailure>
    LoadState(const std::string& conversation_id, const std::string& user_id) override;

    Result<Unit, ProtocolFailure>
    SaveState(const proto::storage::StoredRatchetState& record, uint64_t expected_version) override;

    Result<bool, ProtocolFailure>
    DeleteState(const std::string& conversation_id, const std::string& user_id) override;

    Result<std::vector<proto::storage::StoredRatchetState>, ProtocolFailure>
    ListStates(const std::string& conversation_id) override;

    Result<Unit, ProtocolFailure>
    SaveSkippedKey(const proto::storage::StoredSkippedKey& record) override;

    Result<std::optional<proto::storage::StoredSkippedKey>, ProtocolFailure>
    LoadSkippedKey(const std::string& ratchet_state_id, const std::string& message_key_id) override;

    Result<std::vector<proto::storage::StoredSkippedKey>, ProtocolFailure>
    ListSkippedKeys(const std::string& ratchet_state_id) override;

    Result<bool, ProtocolFailure>
    DeleteSkippedKey(const std::string& ratchet_state_id, const std::string& message_key_id) override;

    Result<size_t, ProtocolFailure> DeleteSkippedKeysExpiredAt(interfaces::TimePoint now) override;

    Result<interfaces::BackendCounts, ProtocolFailure> Count(interfaces::TimePoint now) override;

private:
    using StateKey = std::pair<std::string, std::string>;
    using SkippedKey = std::pair<std::string, std::string>;

    std::mutex lock_;
    std::map<StateKey, proto::storage::StoredRatchetState> states_;
    std::map<SkippedKey, proto::storage::StoredSkippedKey> skipped_keys_;
};

}
