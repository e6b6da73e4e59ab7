#include "pfs/storage/in_memory_storage_backend.hpp"
#include "pfs/core/format.hpp"
#include "pfs/storage/proto_time.hpp"

namespace pfs::protocol::storage {
    using proto::storage::StoredRatchetState;
    using proto::storage::StoredSkippedKey;

    Result<std::optional<StoredRatchetState>, ProtocolFailure> InMemoryStorageBackend::LoadState(
        const std::string& conversation_id,
        const std::string& user_id) {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = states_.find({conversation_id, user_id});
        if (it == states_.end()) {
            return Result<std::optional<StoredRatchetState>, ProtocolFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<StoredRatchetState>, ProtocolFailure>::Ok(it->second);
    }

    Result<Unit, ProtocolFailure> InMemoryStorageBackend::SaveState(
        const StoredRatchetState& record,
        const uint64_t expected_version) {
        std::lock_guard<std::mutex> guard(lock_);
        const StateKey key{record.conversation_id(), record.user_id()};
        const auto it = states_.find(key);
        const uint64_t stored_version = it == states_.end() ? 0 : it->second.version();
        if (stored_version != expected_version) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(
                    compat::format("Ratchet state version conflict (stored {}, expected {})",
                                   stored_version, expected_version)));
        }
        states_[key] = record;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<bool, ProtocolFailure> InMemoryStorageBackend::DeleteState(
        const std::string& conversation_id,
        const std::string& user_id) {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = states_.find({conversation_id, user_id});
        if (it == states_.end()) {
            return Result<bool, ProtocolFailure>::Ok(false);
        }
        const std::string state_id = it->second.id();
        states_.erase(it);
        std::erase_if(skipped_keys_, [&state_id](const auto& entry) {
            return entry.first.first == state_id;
        });
        return Result<bool, ProtocolFailure>::Ok(true);
    }

    Result<std::vector<StoredRatchetState>, ProtocolFailure> InMemoryStorageBackend::ListStates(
        const std::string& conversation_id) {
        std::lock_guard<std::mutex> guard(lock_);
        std::vector<StoredRatchetState> records;
        for (auto it = states_.lower_bound({conversation_id, std::string()});
             it != states_.end() && it->first.first == conversation_id; ++it) {
            records.push_back(it->second);
        }
        return Result<std::vector<StoredRatchetState>, ProtocolFailure>::Ok(std::move(records));
    }

    Result<Unit, ProtocolFailure> InMemoryStorageBackend::SaveSkippedKey(const StoredSkippedKey& record) {
        std::lock_guard<std::mutex> guard(lock_);
        skipped_keys_[{record.ratchet_state_id(), record.message_key_id()}] = record;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::optional<StoredSkippedKey>, ProtocolFailure> InMemoryStorageBackend::LoadSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id) {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = skipped_keys_.find({ratchet_state_id, message_key_id});
        if (it == skipped_keys_.end()) {
            return Result<std::optional<StoredSkippedKey>, ProtocolFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<StoredSkippedKey>, ProtocolFailure>::Ok(it->second);
    }

    Result<std::vector<StoredSkippedKey>, ProtocolFailure> InMemoryStorageBackend::ListSkippedKeys(
        const std::string& ratchet_state_id) {
        std::lock_guard<std::mutex> guard(lock_);
        std::vector<StoredSkippedKey> records;
        for (auto it = skipped_keys_.lower_bound({ratchet_state_id, std::string()});
             it != skipped_keys_.end() && it->first.first == ratchet_state_id; ++it) {
            records.push_back(it->second);
        }
        return Result<std::vector<StoredSkippedKey>, ProtocolFailure>::Ok(std::move(records));
    }

    Result<bool, ProtocolFailure> InMemoryStorageBackend::DeleteSkippedKey(
        const std::string& ratchet_state_id,
        const std::string& message_key_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<bool, ProtocolFailure>::Ok(
            skipped_keys_.erase({ratchet_state_id, message_key_id}) > 0);
    }

    Result<size_t, ProtocolFailure> InMemoryStorageBackend::DeleteSkippedKeysExpiredAt(
        const interfaces::TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        const size_t removed = std::erase_if(skipped_keys_, [now](const auto& entry) {
            return FromTimestamp(entry.second.expires_at()) <= now;
        });
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

    Result<interfaces::BackendCounts, ProtocolFailure> InMemoryStorageBackend::Count(
        const interfaces::TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        interfaces::BackendCounts counts;
        counts.total_states = states_.size();
        counts.total_skipped_keys = skipped_keys_.size();
        for (const auto& [key, record] : skipped_keys_) {
            if (FromTimestamp(record.expires_at()) <= now) {
                counts.expired_skipped_keys += 1;
            }
        }
        return Result<interfaces::BackendCounts, ProtocolFailure>::Ok(counts);
    }

}  // namespace pfs::protocol::storage
