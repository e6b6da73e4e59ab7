#include <catch2/catch_test_macros.hpp>
#include "pfs/coordination/device_authentication_coordinator.hpp"
#include "pfs/coordination/in_memory_coordination_store.hpp"
#include "pfs/coordination/in_memory_device_directory.hpp"
#include "pfs/coordination/multi_device_sync_coordinator.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "helpers/failing_coordination_store.hpp"
#include "helpers/manual_clock.hpp"
#include "helpers/recording_event_handler.hpp"

#include <chrono>

using namespace pfs::protocol;
using namespace pfs::protocol::test_helpers;
using pfs::protocol::coordination::DeviceAuthenticationCoordinator;
using pfs::protocol::coordination::InMemoryCoordinationStore;
using pfs::protocol::coordination::InMemoryDeviceDirectory;
using models::DeviceAuthMethod;
using models::DeviceAuthStatus;

namespace {
    const std::vector<uint8_t> kChallenge{0xC0, 0xFF, 0xEE};

    struct DeviceAuthFixture {
        DeviceAuthFixture() {
            REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
            directory = std::make_shared<InMemoryDeviceDirectory>();
            directory->Register("alice-phone", "alice");
            directory->Register("alice-laptop", "alice");
            directory->Register("bob-phone", "bob");
            clock = std::make_shared<ManualClock>();
            events = std::make_shared<RecordingEventHandler>();
            store = std::make_shared<InMemoryCoordinationStore>();
            auth = std::make_shared<DeviceAuthenticationCoordinator>(
                directory, configuration::ServiceConfig::Default(), clock, events, store);
        }

        std::string Open(const std::string& method = "numeric_code", const std::string& code = "482913") {
            auto receipt = auth->Open("alice", "alice-phone", "alice-laptop", method,
                                      models::DeviceAuthChallenge{kChallenge, code});
            REQUIRE(receipt.IsOk());
            return receipt.Unwrap().session_id;
        }

        std::shared_ptr<InMemoryDeviceDirectory> directory;
        std::shared_ptr<ManualClock> clock;
        std::shared_ptr<RecordingEventHandler> events;
        std::shared_ptr<InMemoryCoordinationStore> store;
        std::shared_ptr<DeviceAuthenticationCoordinator> auth;
    };
}

TEST_CASE("DeviceAuthenticationCoordinator - Successful ceremony", "[device_auth]") {
    DeviceAuthFixture fixture;
    auto opened = fixture.auth->Open("alice", "alice-phone", "alice-laptop", "qr_code",
                                     models::DeviceAuthChallenge{kChallenge, "scan-me-7f3a"});
    REQUIRE(opened.IsOk());
    const auto id = opened.Unwrap().session_id;
    REQUIRE(id.size() == kAuthSessionIdBytes * 2);
    REQUIRE(opened.Unwrap().status == DeviceAuthStatus::Pending);
    REQUIRE(opened.Unwrap().attempts_remaining == kDeviceAuthMaxAttempts);
    REQUIRE(opened.Unwrap().expires_at == fixture.clock->Now() + std::chrono::minutes(15));

    const auto events = fixture.events->Events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].hook == "auth_requested");
    REQUIRE(events[0].target == "alice-laptop");

    auto stored = fixture.store->LoadAuthSession(id).Unwrap();
    REQUIRE(stored.has_value());
    REQUIRE(stored->verification_digest.size() == kVerificationDigestBytes);
    REQUIRE(stored->verification_salt.size() == kVerificationSaltBytes);

    auto request = fixture.auth->GetRequest(id, "alice-laptop", "alice");
    REQUIRE(request.IsOk());
    REQUIRE(request.Unwrap().initiator_device_id == "alice-phone");
    REQUIRE(request.Unwrap().method == DeviceAuthMethod::QrCode);
    REQUIRE(request.Unwrap().challenge == kChallenge);

    REQUIRE_FALSE(fixture.auth->IsVerified("alice-phone").Unwrap());
    auto verified = fixture.auth->Verify(id, "alice-laptop", "alice", "scan-me-7f3a");
    REQUIRE(verified.IsOk());
    REQUIRE(verified.Unwrap().status == DeviceAuthStatus::Verified);
    REQUIRE(fixture.auth->IsVerified("alice-phone").Unwrap());
    REQUIRE(fixture.auth->IsVerified("alice-laptop").Unwrap());
    REQUIRE(fixture.auth->Status(id, "alice-phone", "alice").Unwrap().status == DeviceAuthStatus::Verified);

    SECTION("A finished session takes no more codes") {
        REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "scan-me-7f3a").UnwrapErr().type ==
                ProtocolFailureType::InvalidState);
        REQUIRE(fixture.auth->GetRequest(id, "alice-laptop", "alice").UnwrapErr().type ==
                ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("DeviceAuthenticationCoordinator - Attempt limit", "[device_auth]") {
    DeviceAuthFixture fixture;
    const auto id = fixture.Open();

    auto first = fixture.auth->Verify(id, "alice-laptop", "alice", "000000");
    REQUIRE(first.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);
    REQUIRE(fixture.auth->Status(id, "alice-laptop", "alice").Unwrap().attempts_remaining == 2);

    SECTION("The right code still works before the limit") {
        REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "482913").IsOk());
    }
    SECTION("Third mismatch fails the session") {
        REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "111111").IsErr());
        REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "222222").UnwrapErr().type ==
                ProtocolFailureType::AuthenticationFailure);
        auto status = fixture.auth->Status(id, "alice-phone", "alice").Unwrap();
        REQUIRE(status.status == DeviceAuthStatus::Failed);
        REQUIRE(status.attempts_remaining == 0);
        REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "482913").UnwrapErr().type ==
                ProtocolFailureType::InvalidState);
        REQUIRE_FALSE(fixture.auth->IsVerified("alice-laptop").Unwrap());
    }
}

TEST_CASE("DeviceAuthenticationCoordinator - Expiry", "[device_auth][expiry]") {
    DeviceAuthFixture fixture;
    const auto id = fixture.Open();

    SECTION("Exactly at the deadline is still live") {
        fixture.clock->Advance(std::chrono::minutes(15));
        REQUIRE(fixture.auth->GetRequest(id, "alice-laptop", "alice").IsOk());
    }
    SECTION("Past the deadline") {
        fixture.clock->Advance(std::chrono::minutes(15) + std::chrono::seconds(1));
        REQUIRE(fixture.auth->GetRequest(id, "alice-laptop", "alice").UnwrapErr().type ==
                ProtocolFailureType::SessionExpired);
        REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "482913").UnwrapErr().type ==
                ProtocolFailureType::SessionExpired);
        REQUIRE(fixture.auth->Status(id, "alice-phone", "alice").Unwrap().status == DeviceAuthStatus::Expired);
        REQUIRE(fixture.auth->CleanupExpired().Unwrap() == 1);
        REQUIRE(fixture.auth->Status(id, "alice-phone", "alice").UnwrapErr().type ==
                ProtocolFailureType::SessionNotFound);
    }
    SECTION("Verified sessions stay for the retention window") {
        REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "482913").IsOk());
        fixture.clock->Advance(std::chrono::hours(1));
        REQUIRE(fixture.auth->CleanupExpired().Unwrap() == 0);
        fixture.clock->Advance(kRecordRetention);
        REQUIRE(fixture.auth->CleanupExpired().Unwrap() == 1);
        REQUIRE(fixture.auth->IsVerified("alice-laptop").Unwrap());
    }
}

TEST_CASE("DeviceAuthenticationCoordinator - Validation and authorization", "[device_auth][validation]") {
    DeviceAuthFixture fixture;
    const models::DeviceAuthChallenge challenge{kChallenge, "482913"};

    REQUIRE(fixture.auth->Open("", "alice-phone", "alice-laptop", "numeric_code", challenge).UnwrapErr().type ==
            ProtocolFailureType::ValidationError);
    REQUIRE(fixture.auth->Open("alice", "alice-phone", "alice-phone", "numeric_code", challenge).UnwrapErr().type ==
            ProtocolFailureType::ValidationError);
    REQUIRE(fixture.auth->Open("alice", "alice-phone", "alice-laptop", "telepathy", challenge).UnwrapErr().type ==
            ProtocolFailureType::ValidationError);
    REQUIRE(fixture.auth->Open("alice", "alice-phone", "alice-laptop", "numeric_code",
                               models::DeviceAuthChallenge{{}, "482913"}).IsErr());
    REQUIRE(fixture.auth->Open("alice", "alice-phone", "alice-laptop", "numeric_code",
                               models::DeviceAuthChallenge{kChallenge, "48a913"}).UnwrapErr().type ==
            ProtocolFailureType::ValidationError);
    REQUIRE(fixture.auth->Open("alice", "alice-phone", "bob-phone", "numeric_code", challenge).UnwrapErr().type ==
            ProtocolFailureType::DeviceOwnershipMismatch);
    REQUIRE(fixture.events->Events().empty());

    const auto id = fixture.Open("mutual_verification", "words-of-agreement");
    REQUIRE(fixture.auth->GetRequest("missing", "alice-laptop", "alice").UnwrapErr().type ==
            ProtocolFailureType::SessionNotFound);
    REQUIRE(fixture.auth->GetRequest(id, "alice-phone", "alice").UnwrapErr().type ==
            ProtocolFailureType::DeviceUnauthorized);
    REQUIRE(fixture.auth->GetRequest(id, "alice-laptop", "bob").UnwrapErr().type ==
            ProtocolFailureType::DeviceUnauthorized);
    REQUIRE(fixture.auth->Verify(id, "bob-phone", "bob", "words-of-agreement").UnwrapErr().type ==
            ProtocolFailureType::DeviceUnauthorized);
    REQUIRE(fixture.auth->Status(id, "bob-phone", "bob").UnwrapErr().type ==
            ProtocolFailureType::DeviceUnauthorized);
    // Rejected callers do not use up attempts.
    REQUIRE(fixture.auth->Status(id, "alice-laptop", "alice").Unwrap().attempts_remaining == kDeviceAuthMaxAttempts);
}

TEST_CASE("DeviceAuthenticationCoordinator - Unlocks verified-only sync", "[device_auth][sync]") {
    DeviceAuthFixture fixture;
    auto config = configuration::ServiceConfig::Default();
    config.require_verified_devices = true;
    coordination::MultiDeviceSyncCoordinator sync(fixture.directory, config, fixture.clock, nullptr, fixture.store);

    models::EncryptedKeyPackage package;
    package.encrypted_data.assign(16, 0x42);
    const models::SyncMetadata metadata{"device_key", "conv-1"};
    REQUIRE(sync.CreatePackage("alice", "alice-phone", "alice-laptop", package, metadata).UnwrapErr().type ==
            ProtocolFailureType::DeviceUnauthorized);

    const auto id = fixture.Open("biometric", "fingerprint-ack");
    REQUIRE(fixture.auth->Verify(id, "alice-laptop", "alice", "fingerprint-ack").IsOk());
    REQUIRE(sync.CreatePackage("alice", "alice-phone", "alice-laptop", package, metadata).IsOk());
}

TEST_CASE("DeviceAuthenticationCoordinator - Store failures propagate", "[device_auth][store]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto directory = std::make_shared<InMemoryDeviceDirectory>();
    directory->Register("alice-phone", "alice");
    directory->Register("alice-laptop", "alice");
    DeviceAuthenticationCoordinator auth(directory, configuration::ServiceConfig::Default(),
                                         std::make_shared<ManualClock>(), nullptr,
                                         std::make_shared<FailingCoordinationStore>());

    REQUIRE(auth.Open("alice", "alice-phone", "alice-laptop", "numeric_code",
                      models::DeviceAuthChallenge{kChallenge, "482913"}).UnwrapErr().type ==
            ProtocolFailureType::StorageUnavailable);
    REQUIRE(auth.Verify("any", "alice-laptop", "alice", "482913").UnwrapErr().type ==
            ProtocolFailureType::StorageUnavailable);
    REQUIRE(auth.IsVerified("alice-laptop").IsErr());
    REQUIRE(auth.CleanupExpired().IsErr());
}
