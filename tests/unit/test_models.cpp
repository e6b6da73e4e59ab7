#include <catch2/catch_test_macros.hpp>
#include "pfs/models/algorithms.hpp"
#include "pfs/models/device_authentication.hpp"
#include "pfs/models/key_conflict.hpp"
#include "pfs/models/key_exchange.hpp"
#include "pfs/models/key_sync_package.hpp"
#include "pfs/models/timeframe.hpp"

using namespace pfs::protocol::models;

TEST_CASE("Models - Algorithm names", "[models]") {
    REQUIRE(ToString(KeyExchangeAlgorithm::X25519Kyber768) == "hybrid");
    REQUIRE(ParseKeyExchangeAlgorithm("x25519") == KeyExchangeAlgorithm::X25519);
    REQUIRE(ParseKeyExchangeAlgorithm("kyber768") == KeyExchangeAlgorithm::Kyber768);
    REQUIRE_FALSE(ParseKeyExchangeAlgorithm("rsa").has_value());
    REQUIRE(ParseSignatureAlgorithm("dilithium3") == SignatureAlgorithm::Dilithium3);
    REQUIRE(ParseEncryptionAlgorithm(ToString(EncryptionAlgorithm::Aes256Gcm)) == EncryptionAlgorithm::Aes256Gcm);

    REQUIRE(IsQuantumResistant(KeyExchangeAlgorithm::X25519Kyber768));
    REQUIRE(IsQuantumResistant(KeyExchangeAlgorithm::Kyber768));
    REQUIRE_FALSE(IsQuantumResistant(KeyExchangeAlgorithm::X25519));

    SelectedAlgorithms defaults;
    REQUIRE(defaults.key_exchange == KeyExchangeAlgorithm::X25519Kyber768);
    REQUIRE(defaults.signature == SignatureAlgorithm::Dilithium3);
    REQUIRE(defaults.encryption == EncryptionAlgorithm::ChaCha20Poly1305);
}

TEST_CASE("Models - Exchange and sync names", "[models]") {
    REQUIRE(ParseExchangeType("initial_setup") == ExchangeType::InitialSetup);
    REQUIRE(ParseExchangeType("ratchet_update") == ExchangeType::RatchetUpdate);
    REQUIRE(ParseExchangeType("pqc_upgrade") == ExchangeType::PqcUpgrade);
    REQUIRE(ParseExchangeType("device_addition") == ExchangeType::DeviceAddition);
    REQUIRE_FALSE(ParseExchangeType("handshake").has_value());
    REQUIRE(ToString(ExchangeStatus::Responded) == "responded");

    REQUIRE(ParseSyncPriority("high") == SyncPriority::High);
    REQUIRE_FALSE(ParseSyncPriority("urgent").has_value());
    REQUIRE(SyncPriority::High > SyncPriority::Medium);
    REQUIRE(ToString(SyncStatus::Processed) == "processed");
}

TEST_CASE("Models - Timeframes", "[models]") {
    REQUIRE(ParseTimeframe("1h") == Timeframe::LastHour);
    REQUIRE(ParseTimeframe("7d") == Timeframe::LastWeek);
    REQUIRE(ParseTimeframe("30d") == Timeframe::LastMonth);
    REQUIRE(ParseTimeframe("forever") == Timeframe::LastDay);
    REQUIRE(Duration(Timeframe::LastHour) == std::chrono::hours(1));
    REQUIRE(Duration(Timeframe::LastMonth) == std::chrono::hours(24 * 30));
    REQUIRE(ToString(Timeframe::LastDay) == "24h");
}

TEST_CASE("Models - Device authentication and conflict names", "[models]") {
    REQUIRE(ParseDeviceAuthMethod("qr_code") == DeviceAuthMethod::QrCode);
    REQUIRE(ParseDeviceAuthMethod("mutual_verification") == DeviceAuthMethod::MutualVerification);
    REQUIRE_FALSE(ParseDeviceAuthMethod("password").has_value());
    REQUIRE(ToString(DeviceAuthStatus::Verified) == "verified");

    REQUIRE(ParseResolutionStrategy("authoritative_device") == ResolutionStrategy::AuthoritativeDevice);
    REQUIRE_FALSE(ParseResolutionStrategy("random").has_value());
    REQUIRE(IsKnownConflictKeyType("hybrid_key"));
    REQUIRE_FALSE(IsKnownConflictKeyType("session_cookie"));
    REQUIRE(ToString(ConflictSeverity::Critical) == "critical");
    REQUIRE(ConflictSeverity::Critical > ConflictSeverity::High);
}
