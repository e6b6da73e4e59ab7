#include "pfs/coordination/in_memory_coordination_store.hpp"

#include <algorithm>

namespace pfs::protocol::coordination {
    using models::AlgorithmNegotiation;
    using models::DeviceAuthSession;
    using models::KeyConflict;
    using models::KeyExchange;
    using models::KeySyncPackage;
    using models::RelayedMessage;

    namespace {
        template <typename Record>
        Result<std::optional<Record>, ProtocolFailure> Find(
            const std::map<std::string, Record>& table,
            const std::string& id) {
            const auto it = table.find(id);
            if (it == table.end()) {
                return Result<std::optional<Record>, ProtocolFailure>::Ok(std::nullopt);
            }
            return Result<std::optional<Record>, ProtocolFailure>::Ok(it->second);
        }

        template <typename Record>
        Result<std::vector<Record>, ProtocolFailure> Values(const std::map<std::string, Record>& table) {
            std::vector<Record> records;
            records.reserve(table.size());
            for (const auto& [id, record] : table) {
                records.push_back(record);
            }
            return Result<std::vector<Record>, ProtocolFailure>::Ok(std::move(records));
        }
    }

    Result<std::optional<KeyExchange>, ProtocolFailure> InMemoryCoordinationStore::LoadExchange(
        const std::string& exchange_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Find(exchanges_, exchange_id);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::SaveExchange(const KeyExchange& exchange) {
        std::lock_guard<std::mutex> guard(lock_);
        exchanges_[exchange.id] = exchange;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<KeyExchange>, ProtocolFailure> InMemoryCoordinationStore::ListExchanges() {
        std::lock_guard<std::mutex> guard(lock_);
        return Values(exchanges_);
    }

    Result<bool, ProtocolFailure> InMemoryCoordinationStore::DeleteExchange(const std::string& exchange_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<bool, ProtocolFailure>::Ok(exchanges_.erase(exchange_id) > 0);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::SaveNegotiation(const AlgorithmNegotiation& negotiation) {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = std::find_if(negotiations_.begin(), negotiations_.end(), [&](const auto& stored) {
            return stored.negotiation_id == negotiation.negotiation_id;
        });
        if (it == negotiations_.end()) {
            negotiations_.push_back(negotiation);
        } else {
            *it = negotiation;
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<AlgorithmNegotiation>, ProtocolFailure> InMemoryCoordinationStore::ListNegotiations(
        const std::string& conversation_id) {
        std::lock_guard<std::mutex> guard(lock_);
        std::vector<AlgorithmNegotiation> records;
        for (const auto& negotiation : negotiations_) {
            if (negotiation.conversation_id == conversation_id) {
                records.push_back(negotiation);
            }
        }
        return Result<std::vector<AlgorithmNegotiation>, ProtocolFailure>::Ok(std::move(records));
    }

    Result<std::vector<AlgorithmNegotiation>, ProtocolFailure> InMemoryCoordinationStore::ListAllNegotiations() {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<std::vector<AlgorithmNegotiation>, ProtocolFailure>::Ok(negotiations_);
    }

    Result<bool, ProtocolFailure> InMemoryCoordinationStore::DeleteNegotiation(const std::string& negotiation_id) {
        std::lock_guard<std::mutex> guard(lock_);
        const size_t removed = std::erase_if(negotiations_, [&](const auto& negotiation) {
            return negotiation.negotiation_id == negotiation_id;
        });
        return Result<bool, ProtocolFailure>::Ok(removed > 0);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::AppendMessage(const RelayedMessage& message) {
        std::lock_guard<std::mutex> guard(lock_);
        messages_.push_back(message);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<RelayedMessage>, ProtocolFailure> InMemoryCoordinationStore::ListMessagesSince(
        const interfaces::TimePoint since) {
        std::lock_guard<std::mutex> guard(lock_);
        std::vector<RelayedMessage> records;
        for (const auto& message : messages_) {
            if (message.recorded_at >= since) {
                records.push_back(message);
            }
        }
        return Result<std::vector<RelayedMessage>, ProtocolFailure>::Ok(std::move(records));
    }

    Result<size_t, ProtocolFailure> InMemoryCoordinationStore::DeleteMessagesBefore(const interfaces::TimePoint cutoff) {
        std::lock_guard<std::mutex> guard(lock_);
        const size_t removed = std::erase_if(messages_, [cutoff](const auto& message) {
            return message.recorded_at < cutoff;
        });
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::MarkConversationEncrypted(
        const std::string& conversation_id) {
        std::lock_guard<std::mutex> guard(lock_);
        encrypted_conversations_.insert(conversation_id);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<bool, ProtocolFailure> InMemoryCoordinationStore::IsConversationEncrypted(
        const std::string& conversation_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<bool, ProtocolFailure>::Ok(encrypted_conversations_.contains(conversation_id));
    }

    Result<std::optional<KeySyncPackage>, ProtocolFailure> InMemoryCoordinationStore::LoadPackage(
        const std::string& package_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Find(packages_, package_id);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::SavePackage(const KeySyncPackage& package) {
        std::lock_guard<std::mutex> guard(lock_);
        packages_[package.package_id] = package;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<KeySyncPackage>, ProtocolFailure> InMemoryCoordinationStore::ListPackages() {
        std::lock_guard<std::mutex> guard(lock_);
        return Values(packages_);
    }

    Result<bool, ProtocolFailure> InMemoryCoordinationStore::DeletePackage(const std::string& package_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<bool, ProtocolFailure>::Ok(packages_.erase(package_id) > 0);
    }

    Result<std::optional<DeviceAuthSession>, ProtocolFailure> InMemoryCoordinationStore::LoadAuthSession(
        const std::string& session_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Find(auth_sessions_, session_id);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::SaveAuthSession(const DeviceAuthSession& session) {
        std::lock_guard<std::mutex> guard(lock_);
        auth_sessions_[session.session_id] = session;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<DeviceAuthSession>, ProtocolFailure> InMemoryCoordinationStore::ListAuthSessions() {
        std::lock_guard<std::mutex> guard(lock_);
        return Values(auth_sessions_);
    }

    Result<bool, ProtocolFailure> InMemoryCoordinationStore::DeleteAuthSession(const std::string& session_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<bool, ProtocolFailure>::Ok(auth_sessions_.erase(session_id) > 0);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::MarkDeviceVerified(const std::string& device_id) {
        std::lock_guard<std::mutex> guard(lock_);
        verified_devices_.insert(device_id);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<bool, ProtocolFailure> InMemoryCoordinationStore::IsDeviceVerified(const std::string& device_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<bool, ProtocolFailure>::Ok(verified_devices_.contains(device_id));
    }

    Result<std::optional<KeyConflict>, ProtocolFailure> InMemoryCoordinationStore::LoadConflict(
        const std::string& conflict_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Find(conflicts_, conflict_id);
    }

    Result<Unit, ProtocolFailure> InMemoryCoordinationStore::SaveConflict(const KeyConflict& conflict) {
        std::lock_guard<std::mutex> guard(lock_);
        conflicts_[conflict.conflict_id] = conflict;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<KeyConflict>, ProtocolFailure> InMemoryCoordinationStore::ListConflicts() {
        std::lock_guard<std::mutex> guard(lock_);
        return Values(conflicts_);
    }

    Result<bool, ProtocolFailure> InMemoryCoordinationStore::DeleteConflict(const std::string& conflict_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return Result<bool, ProtocolFailure>::Ok(conflicts_.erase(conflict_id) > 0);
    }

}  // namespace pfs::protocol::coordination
