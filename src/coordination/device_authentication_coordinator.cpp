#include "pfs/coordination/device_authentication_coordinator.hpp"
#include "pfs/coordination/in_memory_coordination_store.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"

#include <algorithm>
#include <span>

namespace pfs::protocol::coordination {
    using debug::Component;
    using models::DeviceAuthReceipt;
    using models::DeviceAuthRequest;
    using models::DeviceAuthSession;
    using models::DeviceAuthStatus;

    namespace {
        std::span<const uint8_t> AsBytes(const std::string& text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }

        Result<std::vector<uint8_t>, ProtocolFailure> DigestCode(
            const std::string& code,
            const std::vector<uint8_t>& salt) {
            return crypto::SodiumInterop::KeyedHash(AsBytes(code), salt, kVerificationDigestBytes)
                .MapErr([](const SodiumFailure& sf) { return ProtocolFailure::FromSodiumFailure(sf); });
        }

        DeviceAuthReceipt ReceiptOf(const DeviceAuthSession& session) {
            const uint32_t remaining = session.attempts >= session.max_attempts
                ? 0
                : session.max_attempts - session.attempts;
            return DeviceAuthReceipt{session.session_id, session.status, remaining, session.expires_at};
        }

        bool IsFinished(const DeviceAuthSession& session) {
            return session.status == DeviceAuthStatus::Verified || session.status == DeviceAuthStatus::Failed;
        }
    }

    DeviceAuthenticationCoordinator::DeviceAuthenticationCoordinator(
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

    Result<bool, ProtocolFailure> DeviceAuthenticationCoordinator::IsOwnedBy(
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

    Result<DeviceAuthSession, ProtocolFailure> DeviceAuthenticationCoordinator::LoadLocked(
        const std::string& session_id) {
        auto loaded = store_->LoadAuthSession(session_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& found = loaded.Unwrap();
        if (!found) {
            return Result<DeviceAuthSession, ProtocolFailure>::Err(
                ProtocolFailure::SessionNotFound("Device authentication session not found"));
        }
        return Result<DeviceAuthSession, ProtocolFailure>::Ok(std::move(*found));
    }

    Result<Unit, ProtocolFailure> DeviceAuthenticationCoordinator::ExpireIfPastDeadline(
        DeviceAuthSession& session,
        const interfaces::TimePoint now) {
        if (session.status == DeviceAuthStatus::Pending && now > session.expires_at) {
            session.status = DeviceAuthStatus::Expired;
            session.finished_at = now;
            PFS_TRY(store_->SaveAuthSession(session));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<DeviceAuthReceipt, ProtocolFailure> DeviceAuthenticationCoordinator::Open(
        const std::string& user_id,
        const std::string& initiator_device_id,
        const std::string& responder_device_id,
        const std::string& method,
        const models::DeviceAuthChallenge& challenge) {
        if (user_id.empty() || initiator_device_id.empty() || responder_device_id.empty()) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("User and device ids are required"));
        }
        if (initiator_device_id == responder_device_id) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("A device cannot authenticate itself"));
        }
        const auto parsed_method = models::ParseDeviceAuthMethod(method);
        if (!parsed_method) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(compat::format("Unknown authentication method: {}", method)));
        }
        if (challenge.challenge.empty() || challenge.verification_code.empty()) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Challenge and verification code are required"));
        }
        if (*parsed_method == models::DeviceAuthMethod::NumericCode &&
            !std::all_of(challenge.verification_code.begin(), challenge.verification_code.end(),
                         [](const char c) { return c >= '0' && c <= '9'; })) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Numeric verification code must contain digits only"));
        }
        for (const auto* device_id : {&initiator_device_id, &responder_device_id}) {
            auto owned = IsOwnedBy(*device_id, user_id);
            if (owned.IsErr()) {
                return Fail(std::move(owned).UnwrapErr());
            }
            if (!owned.Unwrap()) {
                return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::DeviceOwnershipMismatch("Both devices must belong to the user"));
            }
        }
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        const auto now = clock_->Now();
        DeviceAuthSession session;
        session.session_id = crypto::SodiumInterop::RandomHexId(kAuthSessionIdBytes);
        session.user_id = user_id;
        session.initiator_device_id = initiator_device_id;
        session.responder_device_id = responder_device_id;
        session.method = *parsed_method;
        session.status = DeviceAuthStatus::Pending;
        session.challenge = challenge.challenge;
        session.verification_salt = crypto::SodiumInterop::GetRandomBytes(kVerificationSaltBytes);
        auto digest = DigestCode(challenge.verification_code, session.verification_salt);
        if (digest.IsErr()) {
            return Fail(std::move(digest).UnwrapErr());
        }
        session.verification_digest = std::move(digest).Unwrap();
        session.max_attempts = config_.device_auth_max_attempts;
        session.created_at = now;
        session.expires_at = now + config_.device_auth_ttl;

        auto receipt = ReceiptOf(session);
        {
            std::lock_guard<std::mutex> guard(lock_);
            PFS_TRY(store_->SaveAuthSession(session));
        }
        PFS_LOG_EVENT(Component::DeviceAuth, "opened session={} method={}",
                      receipt.session_id, models::ToString(session.method));
        if (events_) {
            events_->OnDeviceAuthenticationRequested(receipt.session_id, responder_device_id);
        }
        return Result<DeviceAuthReceipt, ProtocolFailure>::Ok(std::move(receipt));
    }

    Result<DeviceAuthRequest, ProtocolFailure> DeviceAuthenticationCoordinator::GetRequest(
        const std::string& session_id,
        const std::string& device_id,
        const std::string& user_id) {
        const auto owned = IsOwnedBy(device_id, user_id);
        if (owned.IsErr()) {
            return Fail(owned.UnwrapErr());
        }
        if (!owned.Unwrap()) {
            return Result<DeviceAuthRequest, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Device is not owned by the caller"));
        }

        const auto now = clock_->Now();
        std::lock_guard<std::mutex> guard(lock_);
        auto loaded = LoadLocked(session_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& session = loaded.Unwrap();
        if (session.responder_device_id != device_id || session.user_id != user_id) {
            return Result<DeviceAuthRequest, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Only the responding device may read the challenge"));
        }
        PFS_TRY(ExpireIfPastDeadline(session, now));
        if (session.status == DeviceAuthStatus::Expired) {
            return Result<DeviceAuthRequest, ProtocolFailure>::Err(
                ProtocolFailure::SessionExpired("Device authentication session expired"));
        }
        if (session.status != DeviceAuthStatus::Pending) {
            return Result<DeviceAuthRequest, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                compat::format("Device authentication session is {}", models::ToString(session.status))));
        }
        return Result<DeviceAuthRequest, ProtocolFailure>::Ok(DeviceAuthRequest{
            session.session_id, session.initiator_device_id, session.method, session.challenge, session.expires_at});
    }

    Result<DeviceAuthReceipt, ProtocolFailure> DeviceAuthenticationCoordinator::Verify(
        const std::string& session_id,
        const std::string& device_id,
        const std::string& user_id,
        const std::string& verification_code) {
        if (verification_code.empty()) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Verification code is required"));
        }
        const auto owned = IsOwnedBy(device_id, user_id);
        if (owned.IsErr()) {
            return Fail(owned.UnwrapErr());
        }
        if (!owned.Unwrap()) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Device is not owned by the caller"));
        }

        const auto now = clock_->Now();
        DeviceAuthSession session;
        bool matched = false;
        {
            std::lock_guard<std::mutex> guard(lock_);
            auto loaded = LoadLocked(session_id);
            if (loaded.IsErr()) {
                return Fail(std::move(loaded).UnwrapErr());
            }
            session = std::move(loaded).Unwrap();
            if (session.responder_device_id != device_id || session.user_id != user_id) {
                return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::DeviceUnauthorized("Only the responding device may verify"));
            }
            PFS_TRY(ExpireIfPastDeadline(session, now));
            if (session.status == DeviceAuthStatus::Expired) {
                return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::SessionExpired("Device authentication session expired"));
            }
            if (session.status != DeviceAuthStatus::Pending) {
                return Result<DeviceAuthReceipt, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                    compat::format("Device authentication session is {}", models::ToString(session.status))));
            }

            auto digest = DigestCode(verification_code, session.verification_salt);
            if (digest.IsErr()) {
                return Fail(std::move(digest).UnwrapErr());
            }
            auto equal = crypto::SodiumInterop::ConstantTimeEquals(digest.Unwrap(), session.verification_digest);
            if (equal.IsErr()) {
                return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(equal.UnwrapErr()));
            }
            matched = equal.Unwrap();

            session.attempts += 1;
            if (matched) {
                session.status = DeviceAuthStatus::Verified;
                session.finished_at = now;
            } else if (session.attempts >= session.max_attempts) {
                session.status = DeviceAuthStatus::Failed;
                session.finished_at = now;
            }
            PFS_TRY(store_->SaveAuthSession(session));
            if (matched) {
                PFS_TRY(store_->MarkDeviceVerified(session.initiator_device_id));
                PFS_TRY(store_->MarkDeviceVerified(session.responder_device_id));
            }
        }

        if (!matched) {
            const auto receipt = ReceiptOf(session);
            PFS_LOG_EVENT(Component::DeviceAuth, "session={} mismatch, {} attempts left",
                          session_id, receipt.attempts_remaining);
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(ProtocolFailure::AuthenticationFailure(
                compat::format("Verification code mismatch, {} attempts left", receipt.attempts_remaining)));
        }
        PFS_LOG_EVENT(Component::DeviceAuth, "session={} verified", session_id);
        return Result<DeviceAuthReceipt, ProtocolFailure>::Ok(ReceiptOf(session));
    }

    Result<DeviceAuthReceipt, ProtocolFailure> DeviceAuthenticationCoordinator::Status(
        const std::string& session_id,
        const std::string& device_id,
        const std::string& user_id) {
        const auto owned = IsOwnedBy(device_id, user_id);
        if (owned.IsErr()) {
            return Fail(owned.UnwrapErr());
        }
        if (!owned.Unwrap()) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Device is not owned by the caller"));
        }

        const auto now = clock_->Now();
        std::lock_guard<std::mutex> guard(lock_);
        auto loaded = LoadLocked(session_id);
        if (loaded.IsErr()) {
            return Fail(std::move(loaded).UnwrapErr());
        }
        auto& session = loaded.Unwrap();
        if (session.user_id != user_id ||
            (session.initiator_device_id != device_id && session.responder_device_id != device_id)) {
            return Result<DeviceAuthReceipt, ProtocolFailure>::Err(
                ProtocolFailure::DeviceUnauthorized("Device is not part of this session"));
        }
        PFS_TRY(ExpireIfPastDeadline(session, now));
        return Result<DeviceAuthReceipt, ProtocolFailure>::Ok(ReceiptOf(session));
    }

    Result<bool, ProtocolFailure> DeviceAuthenticationCoordinator::IsVerified(const std::string& device_id) {
        return store_->IsDeviceVerified(device_id);
    }

    Result<size_t, ProtocolFailure> DeviceAuthenticationCoordinator::CleanupExpired() {
        const auto now = clock_->Now();
        const auto retention_cutoff = now - config_.record_retention;
        std::lock_guard<std::mutex> guard(lock_);
        auto listed = store_->ListAuthSessions();
        if (listed.IsErr()) {
            return Fail(std::move(listed).UnwrapErr());
        }
        size_t removed = 0;
        for (const auto& session : listed.Unwrap()) {
            const bool expired = session.status == DeviceAuthStatus::Expired ||
                (session.status == DeviceAuthStatus::Pending && now > session.expires_at);
            const bool retired = IsFinished(session) && session.created_at < retention_cutoff;
            if (!expired && !retired) {
                continue;
            }
            auto deleted = store_->DeleteAuthSession(session.session_id);
            if (deleted.IsErr()) {
                return Fail(std::move(deleted).UnwrapErr());
            }
            if (deleted.Unwrap()) {
                removed += 1;
            }
        }
        if (removed > 0) {
            PFS_LOG_EVENT(Component::Cleanup, "removed {} device authentication sessions", removed);
        }
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

}  // namespace pfs::protocol::coordination
