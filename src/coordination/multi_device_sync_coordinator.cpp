#include "pfs/coordination/multi_device_sync_coordinator.hpp"
#include "pfs/coordination/in_memory_coordination_store.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"

#include <algorithm>
#include <span>

namespace pfs::protocol::coordination {
    using debug::Component;
    using models::KeySyncPackage;
    using models::SyncReceipt;
    using models::SyncStatus;

    namespace {
        bool IsPastDeadline(const KeySyncPackage& package, const interfaces::TimePoint now) {
            return package.status == SyncStatus::Pending && now > package.expires_at;
        }

        void DropPayload(KeySyncPackage& package) {
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span(package.encrypted_key_data));
            (void) _wipe;
            package.encrypted_key_data.clear();
            package.encrypted_key_data.shrink_to_fit();
        }
    }

    MultiDeviceSyncCoordinator::MultiDeviceSyncCoordinator(
        std::shared_ptr<interfaces::IDeviceDirectory> directory,
        configuration::ServiceConfig config,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::ICoordinationEventHandler> events,
        std::shared_ptr<interfaces::ICoordinationStore> store)
        : directory_(std::move(directory))
        , config_(std::move(config))
        , clock_(clock ? std::move(clock) : std::make_shared<interfaces::SystemClock>())
        , events_(std::move(events))
        , store_(store ? std::move(store) : std::make_shared<InMemoryCoordinationStore>()) {}

    Result<bool, ProtocolFailure> MultiDeviceSyncCoordinator::IsTrusted(const std::string& device_id) const {
        if (!config_.require_verified_devices) {
            return Result<bool, ProtocolFailure>::Ok(true);
        }
        return store_->IsDeviceVerified(device_id);
    }

    Result<bool, ProtocolFailure> MultiDeviceSyncCoordinator::IsOwnedBy(
        const std::string& device_id,
        const std::string& user_id) const {
        if (!directory_) {
            return Result<bool, ProtocolFailure>::Err(
                ProtocolFailure::Configuration("No device directory configured"));
        }
        auto owner = directory_->OwnerOf(device_id);
        if (owner.IsErr()) {
            return Fail(owner.UnwrapErr());
        }
        const auto& found = owner.Unwrap();
        return Result<bool, ProtocolFailure>::Ok(found.has_value() && *found == user_id);
    }

    Result<SyncReceipt, ProtocolFailure> MultiDeviceSyncCoordinator::CreatePackage(
        const std::string& user_id,
        const std::string& from_device_id,
        const std::string& to_device_id,
        const models::EncryptedKeyPackage& package,
        const models::SyncMetadata& metadata) {
        if (user_id.empty() || from_device_id.empty() || to_device_id.empty()) {
            return Result<SyncReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("User and device ids are required"));
        }
        if (package.encrypted_data.empty()) {
            return Result<SyncReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Sync package carries no key data"));
        }
        const auto from_owned = IsOwnedBy(from_device_id, user_id);
        if (from_owned.IsErr()) {
            return Fail(from_owned.UnwrapErr());
        }
        const auto to_owned = IsOwnedBy(to_device_id, user_id);
        if (to_owned.IsErr()) {
            return Fail(to_owned.UnwrapErr());
        }
        if (!from_owned.Unwrap() || !to_owned.Unwrap()) {
            return Result<SyncReceipt, ProtocolFailure>::Err(
                ProtocolFailure::DeviceOwnershipMismatch("Both devices must belong to the user"));
        }
        for (const auto* device_id : {&from_device_id, &to_device_id}) {
            auto trusted = IsTrusted(*device_id);
            if (trusted.IsErr()) {
                return Fail(std::move(trusted).UnwrapErr());
            }
            if (!trusted.Unwrap()) {
                return Result<SyncReceipt, ProtocolFailure>::Err(ProtocolFailure::DeviceUnauthorized(
                    compat::format("Device {} has not been verified", *device_id)));
            }
        }
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<SyncReceipt, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        const auto now = clock_->Now();
        KeySyncPackage record;
        record.package_id = crypto::SodiumInterop::RandomHexId(kPackageIdBytes);
        record.user_id = user_id;
        record.from_device_id = from_device_id;
        record.to_device_id = to_device_id;
        record.key_type = metadata.key_type;
        record.conversation_id = metadata.conversation_id;
        record.encrypted_key_data = package.encrypted_data;
        record.integrity_hash = package.integrity_hash;
        record.signature = package.signature;
        record.encryption_method = package.encryption_method;
        record.priority = metadata.priority;
        record.status = SyncStatus::Pending;
        record.created_at = now;
        record.expires_at = now + config_.sync_package_ttl;

        SyncReceipt receipt{record.package_id, record.status, record.expires_at};
        {
            std::lock_guard<std::mutex> guard(lock_);
            PFS_TRY(store_->SavePackage(record));
        }
        PFS_LOG_EVENT(Component::Sync, "created package={} priority={}",
                      receipt.package_id, models::ToString(metadata.priority));
        if (events_) {
            events_->OnSyncPackageCreated(receipt.package_id, to_device_id);
        }
        return Result<SyncReceipt, ProtocolFailure>::Ok(std::move(receipt));
    }

    Result<std::vector<KeySyncPackage>, ProtocolFailure> MultiDeviceSyncCoordinator::ListPending(
        const std::string& device_id,
        const std::string& user_id) {
        const auto owned = IsOwnedBy(device_id, user_id);
        if (owned.IsErr()) {
            return Fail(owned.UnwrapErr());
        }
        if (!owned.Unwrap()) {
            return Result<std::vector<KeySyncPackage>, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Device is not owned by the caller"));
        }

        const auto now = clock_->Now();
        std::vector<KeySyncPackage> pending;
        {
            std::lock_guard<std::mutex> guard(lock_);
            auto listed = store_->ListPackages();
            if (listed.IsErr()) {
                return Fail(std::move(listed).UnwrapErr());
            }
            for (auto& package : listed.Unwrap()) {
                if (package.to_device_id != device_id || package.status != SyncStatus::Pending) {
                    continue;
                }
                if (IsPastDeadline(package, now)) {
                    package.status = SyncStatus::Expired;
                    DropPayload(package);
                    PFS_TRY(store_->SavePackage(package));
                    continue;
                }
                pending.push_back(std::move(package));
            }
        }
        std::sort(pending.begin(), pending.end(), [](const auto& a, const auto& b) {
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            return a.created_at < b.created_at;
        });
        return Result<std::vector<KeySyncPackage>, ProtocolFailure>::Ok(std::move(pending));
    }

    Result<SyncReceipt, ProtocolFailure> MultiDeviceSyncCoordinator::MarkProcessed(
        const std::string& package_id,
        const std::string& user_id,
        const bool success,
        const std::optional<std::string>& error_message) {
        std::string to_device_id;
        {
            std::lock_guard<std::mutex> guard(lock_);
            auto loaded = store_->LoadPackage(package_id);
            if (loaded.IsErr()) {
                return Fail(std::move(loaded).UnwrapErr());
            }
            if (!loaded.Unwrap()) {
                return Result<SyncReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::PackageNotFound("Sync package not found"));
            }
            to_device_id = loaded.Unwrap()->to_device_id;
        }

        // Directory lookups stay outside the package lock.
        const auto owned = IsOwnedBy(to_device_id, user_id);
        if (owned.IsErr()) {
            return Fail(owned.UnwrapErr());
        }
        if (!owned.Unwrap()) {
            return Result<SyncReceipt, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Caller does not own the destination device"));
        }

        const auto now = clock_->Now();
        std::lock_guard<std::mutex> guard(lock_);
        auto loaded = store_->LoadPackage(package_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        if (!loaded.Unwrap()) {
            return Result<SyncReceipt, ProtocolFailure>::Err(
                ProtocolFailure::PackageNotFound("Sync package not found"));
        }
        auto& package = *loaded.Unwrap();
        if (package.status != SyncStatus::Pending) {
            return Result<SyncReceipt, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                compat::format("Sync package is {}", models::ToString(package.status))));
        }
        if (IsPastDeadline(package, now)) {
            package.status = SyncStatus::Expired;
        } else {
            package.status = success ? SyncStatus::Processed : SyncStatus::Failed;
            package.processed_at = now;
            package.error_message = error_message;
        }
        // The payload is only ever handed out while pending.
        DropPayload(package);
        PFS_TRY(store_->SavePackage(package));
        if (package.status == SyncStatus::Expired) {
            return Result<SyncReceipt, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Sync package is expired"));
        }
        PFS_LOG_EVENT(Component::Sync, "package={} marked {}", package_id, models::ToString(package.status));
        return Result<SyncReceipt, ProtocolFailure>::Ok(
            SyncReceipt{package.package_id, package.status, package.expires_at});
    }

    Result<size_t, ProtocolFailure> MultiDeviceSyncCoordinator::CleanupExpired() {
        const auto now = clock_->Now();
        const auto retention_cutoff = now - config_.record_retention;
        std::lock_guard<std::mutex> guard(lock_);
        auto listed = store_->ListPackages();
        if (listed.IsErr()) {
            return Fail(std::move(listed).UnwrapErr());
        }
        size_t removed = 0;
        for (const auto& package : listed.Unwrap()) {
            const bool expired = package.status == SyncStatus::Expired || IsPastDeadline(package, now);
            const bool retired = package.status != SyncStatus::Pending && package.created_at < retention_cutoff;
            if (!expired && !retired) {
                continue;
            }
            auto deleted = store_->DeletePackage(package.package_id);
            if (deleted.IsErr()) {
                return Fail(std::move(deleted).UnwrapErr());
            }
            if (deleted.Unwrap()) {
                removed += 1;
            }
        }
        if (removed > 0) {
            PFS_LOG_EVENT(Component::Cleanup, "removed {} sync packages", removed);
        }
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

}  // namespace pfs::protocol::coordination
