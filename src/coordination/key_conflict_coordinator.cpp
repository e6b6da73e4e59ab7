#include "pfs/coordination/key_conflict_coordinator.hpp"
#include "pfs/coordination/in_memory_coordination_store.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"

#include <algorithm>

namespace pfs::protocol::coordination {
    using debug::Component;
    using models::ConflictReceipt;
    using models::ConflictStatus;
    using models::ConflictingVersion;
    using models::KeyConflict;
    using models::ResolutionStrategy;

    namespace {
        std::optional<uint64_t> RecommendVersion(const KeyConflict& conflict) {
            switch (conflict.strategy) {
                case ResolutionStrategy::LatestWins: {
                    const auto latest = std::max_element(
                        conflict.versions.begin(), conflict.versions.end(),
                        [](const ConflictingVersion& a, const ConflictingVersion& b) {
                            if (a.version != b.version) {
                                return a.version < b.version;
                            }
                            return a.modified_at < b.modified_at;
                        });
                    return latest->version;
                }
                case ResolutionStrategy::AuthoritativeDevice:
                    for (const auto& version : conflict.versions) {
                        if (version.device_id == conflict.authoritative_device_id) {
                            return version.version;
                        }
                    }
                    return std::nullopt;
                default:
                    return std::nullopt;
            }
        }

        ConflictReceipt ReceiptOf(const KeyConflict& conflict) {
            return ConflictReceipt{conflict.conflict_id, conflict.severity, conflict.status, RecommendVersion(conflict)};
        }

        bool Reports(const KeyConflict& conflict, const std::string& device_id) {
            return std::any_of(conflict.versions.begin(), conflict.versions.end(),
                               [&](const ConflictingVersion& v) { return v.device_id == device_id; });
        }
    }

    KeyConflictCoordinator::KeyConflictCoordinator(
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::ICoordinationEventHandler> events,
        std::shared_ptr<interfaces::ICoordinationStore> store)
        : config_(std::move(config))
        , clock_(clock ? std::move(clock) : std::make_shared<interfaces::SystemClock>())
        , events_(std::move(events))
        , store_(store ? std::move(store) : std::make_shared<InMemoryCoordinationStore>()) {}

    Result<KeyConflict, ProtocolFailure> KeyConflictCoordinator::LoadOpenLocked(const std::string& conflict_id) {
        auto loaded = store_->LoadConflict(conflict_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& found = loaded.Unwrap();
        if (!found) {
            return Result<KeyConflict, ProtocolFailure>::Err(
                ProtocolFailure::ConflictNotFound("Key conflict not found"));
        }
        if (found->status != ConflictStatus::Detected) {
            return Result<KeyConflict, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                compat::format("Key conflict is {}", models::ToString(found->status))));
        }
        return Result<KeyConflict, ProtocolFailure>::Ok(std::move(*found));
    }

    Result<ConflictReceipt, ProtocolFailure> KeyConflictCoordinator::Report(
        const std::string& conversation_id,
        const std::string& key_type,
        const std::vector<ConflictingVersion>& versions,
        const std::string& strategy,
        const std::optional<std::string>& authoritative_device_id) {
        if (conversation_id.empty()) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Conversation id is required"));
        }
        if (!models::IsKnownConflictKeyType(key_type)) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(compat::format("Unknown key type: {}", key_type)));
        }
        const auto parsed_strategy = models::ParseResolutionStrategy(strategy);
        if (!parsed_strategy) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(compat::format("Unknown resolution strategy: {}", strategy)));
        }
        if (versions.size() < 2) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("A conflict needs at least two versions"));
        }
        if (std::any_of(versions.begin(), versions.end(),
                        [](const ConflictingVersion& v) { return v.device_id.empty(); })) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Every version must name its device"));
        }
        const bool diverges = std::any_of(versions.begin() + 1, versions.end(), [&](const ConflictingVersion& v) {
            return v.version != versions.front().version || v.key_hash != versions.front().key_hash;
        });
        if (!diverges) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Reported versions agree"));
        }

        KeyConflict conflict;
        conflict.conversation_id = conversation_id;
        conflict.key_type = key_type;
        conflict.versions = versions;
        conflict.strategy = *parsed_strategy;
        conflict.authoritative_device_id = authoritative_device_id;
        if (conflict.strategy == ResolutionStrategy::AuthoritativeDevice &&
            (!authoritative_device_id || !Reports(conflict, *authoritative_device_id))) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(ProtocolFailure::ValidationError(
                "Authoritative device must be one of the reporting devices"));
        }
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        const auto [lowest, highest] = std::minmax_element(
            versions.begin(), versions.end(),
            [](const ConflictingVersion& a, const ConflictingVersion& b) { return a.version < b.version; });
        conflict.severity = models::AssessConflictSeverity(lowest->version, highest->version);
        conflict.status = ConflictStatus::Detected;
        conflict.conflict_id = crypto::SodiumInterop::RandomHexId(kConflictIdBytes);
        conflict.detected_at = clock_->Now();

        auto receipt = ReceiptOf(conflict);
        {
            std::lock_guard<std::mutex> guard(lock_);
            PFS_TRY(store_->SaveConflict(conflict));
        }
        PFS_LOG_EVENT(Component::Conflict, "detected conflict={} key_type={} severity={}",
                      receipt.conflict_id, key_type, models::ToString(receipt.severity));
        if (events_) {
            events_->OnKeyConflictDetected(receipt.conflict_id, conversation_id);
        }
        return Result<ConflictReceipt, ProtocolFailure>::Ok(std::move(receipt));
    }

    Result<KeyConflict, ProtocolFailure> KeyConflictCoordinator::Get(const std::string& conflict_id) {
        std::lock_guard<std::mutex> guard(lock_);
        auto loaded = store_->LoadConflict(conflict_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& found = loaded.Unwrap();
        if (!found) {
            return Result<KeyConflict, ProtocolFailure>::Err(
                ProtocolFailure::ConflictNotFound("Key conflict not found"));
        }
        return Result<KeyConflict, ProtocolFailure>::Ok(std::move(*found));
    }

    Result<std::vector<KeyConflict>, ProtocolFailure> KeyConflictCoordinator::ListOpen(
        const std::string& conversation_id) {
        std::vector<KeyConflict> open;
        {
            std::lock_guard<std::mutex> guard(lock_);
            auto listed = store_->ListConflicts();
            if (listed.IsErr()) {
                return Fail(std::move(listed).UnwrapErr());
            }
            for (auto& conflict : listed.Unwrap()) {
                if (conflict.conversation_id == conversation_id && conflict.status == ConflictStatus::Detected) {
                    open.push_back(std::move(conflict));
                }
            }
        }
        std::sort(open.begin(), open.end(), [](const KeyConflict& a, const KeyConflict& b) {
            if (a.severity != b.severity) {
                return a.severity > b.severity;
            }
            return a.detected_at < b.detected_at;
        });
        return Result<std::vector<KeyConflict>, ProtocolFailure>::Ok(std::move(open));
    }

    Result<ConflictReceipt, ProtocolFailure> KeyConflictCoordinator::Resolve(
        const std::string& conflict_id,
        const std::string& resolver_device_id,
        const uint64_t version) {
        if (resolver_device_id.empty()) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Resolver device id is required"));
        }
        std::lock_guard<std::mutex> guard(lock_);
        auto loaded = LoadOpenLocked(conflict_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& conflict = loaded.Unwrap();
        if (conflict.strategy == ResolutionStrategy::AuthoritativeDevice) {
            if (resolver_device_id != conflict.authoritative_device_id) {
                return Result<ConflictReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::DeviceUnauthorized("Only the authoritative device may resolve this conflict"));
            }
        } else if (!Reports(conflict, resolver_device_id)) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Resolver did not report a version"));
        }
        const bool reported = std::any_of(conflict.versions.begin(), conflict.versions.end(),
                                          [&](const ConflictingVersion& v) { return v.version == version; });
        if (!reported) {
            return Result<ConflictReceipt, ProtocolFailure>::Err(ProtocolFailure::ValidationError(
                compat::format("Version {} was not reported for this conflict", version)));
        }

        conflict.status = ConflictStatus::Resolved;
        conflict.resolved_version = version;
        conflict.resolved_by = resolver_device_id;
        conflict.resolved_at = clock_->Now();
        PFS_TRY(store_->SaveConflict(conflict));
        PFS_LOG_EVENT(Component::Conflict, "conflict={} resolved to version {}", conflict_id, version);
        return Result<ConflictReceipt, ProtocolFailure>::Ok(ReceiptOf(conflict));
    }

    Result<ConflictReceipt, ProtocolFailure> KeyConflictCoordinator::MarkFailed(
        const std::string& conflict_id,
        const std::string& reason) {
        std::lock_guard<std::mutex> guard(lock_);
        auto loaded = LoadOpenLocked(conflict_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& conflict = loaded.Unwrap();
        conflict.status = ConflictStatus::Failed;
        conflict.failure_reason = reason;
        conflict.resolved_at = clock_->Now();
        PFS_TRY(store_->SaveConflict(conflict));
        PFS_LOG_EVENT(Component::Conflict, "conflict={} failed: {}", conflict_id, reason);
        return Result<ConflictReceipt, ProtocolFailure>::Ok(ReceiptOf(conflict));
    }

    Result<size_t, ProtocolFailure> KeyConflictCoordinator::CleanupExpired() {
        const auto retention_cutoff = clock_->Now() - config_.record_retention;
        std::lock_guard<std::mutex> guard(lock_);
        auto listed = store_->ListConflicts();
        if (listed.IsErr()) {
            return Fail(std::move(listed).UnwrapErr());
        }
        size_t removed = 0;
        for (const auto& conflict : listed.Unwrap()) {
            if (conflict.detected_at >= retention_cutoff) {
                continue;
            }
            auto deleted = store_->DeleteConflict(conflict.conflict_id);
            if (deleted.IsErr()) {
                return Fail(std::move(deleted).UnwrapErr());
            }
            if (deleted.Unwrap()) {
                removed += 1;
            }
        }
        if (removed > 0) {
            PFS_LOG_EVENT(Component::Cleanup, "removed {} key conflicts", removed);
        }
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

}  // namespace pfs::protocol::coordination
