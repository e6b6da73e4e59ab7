#include <catch2/catch_test_macros.hpp>
#include "pfs/coordination/algorithm_negotiation_ledger.hpp"
#include "pfs/core/constants.hpp"
#include "helpers/failing_coordination_store.hpp"
#include "helpers/manual_clock.hpp"

#include <chrono>

using namespace pfs::protocol;
using namespace pfs::protocol::test_helpers;
using pfs::protocol::coordination::AlgorithmNegotiationLedger;

namespace {
    models::NegotiationOutcome HybridOutcome() {
        models::NegotiationOutcome outcome;
        outcome.selected.key_exchange = models::KeyExchangeAlgorithm::X25519Kyber768;
        outcome.security_level = 3;
        outcome.quantum_resistant = true;
        outcome.hybrid_mode = true;
        return outcome;
    }

    models::NegotiationOutcome ClassicalOutcome() {
        models::NegotiationOutcome outcome;
        outcome.selected.key_exchange = models::KeyExchangeAlgorithm::X25519;
        outcome.selected.signature = models::SignatureAlgorithm::Ed25519;
        return outcome;
    }
}

TEST_CASE("AlgorithmNegotiationLedger - Active negotiation", "[negotiation]") {
    auto clock = std::make_shared<ManualClock>();
    AlgorithmNegotiationLedger ledger(configuration::ServiceConfig::Default(), clock);

    REQUIRE_FALSE(ledger.GetActive("conv-1").Unwrap().has_value());

    auto first = ledger.Record("conv-1", "alice", "bob", ClassicalOutcome());
    REQUIRE(first.IsOk());
    REQUIRE(first.Unwrap().size() == kNegotiationIdBytes * 2);

    SECTION("Latest record wins") {
        auto second = ledger.Record("conv-1", "alice", "bob", HybridOutcome());
        REQUIRE(second.IsOk());
        auto active = ledger.GetActive("conv-1").Unwrap();
        REQUIRE(active.has_value());
        REQUIRE(active->negotiation_id == second.Unwrap());
        REQUIRE(active->achieved_security_level == 3);
        REQUIRE(active->quantum_resistant);
        REQUIRE(active->expires_at == clock->Now() + std::chrono::hours(24 * 30));
    }
    SECTION("Expires after the TTL") {
        clock->Advance(std::chrono::hours(24 * 30) + std::chrono::seconds(1));
        REQUIRE_FALSE(ledger.GetActive("conv-1").Unwrap().has_value());
        REQUIRE_FALSE(ledger.EncryptionStatus("conv-1").Unwrap().has_negotiation);
    }
    SECTION("Conversations are independent") {
        REQUIRE_FALSE(ledger.GetActive("conv-2").Unwrap().has_value());
    }
    SECTION("Ids are required") {
        REQUIRE(ledger.Record("", "alice", "bob", ClassicalOutcome()).UnwrapErr().type ==
                ProtocolFailureType::ValidationError);
        REQUIRE(ledger.Record("conv-1", "alice", "", ClassicalOutcome()).IsErr());
    }
}

TEST_CASE("AlgorithmNegotiationLedger - Encryption status", "[negotiation]") {
    auto clock = std::make_shared<ManualClock>();
    AlgorithmNegotiationLedger ledger(configuration::ServiceConfig::Default(), clock);

    auto status = ledger.EncryptionStatus("conv-1").Unwrap();
    REQUIRE_FALSE(status.encryption_enabled);
    REQUIRE_FALSE(status.has_negotiation);
    REQUIRE(status.algorithm == "none");
    REQUIRE_FALSE(status.negotiated_at.has_value());

    REQUIRE(ledger.RecordMessage("conv-1", "", false).IsOk());
    REQUIRE_FALSE(ledger.EncryptionStatus("conv-1").Unwrap().encryption_enabled);

    REQUIRE(ledger.Record("conv-1", "alice", "bob", HybridOutcome()).IsOk());
    REQUIRE(ledger.RecordMessage("conv-1", std::string(kHybridAlgorithm), true).IsOk());

    status = ledger.EncryptionStatus("conv-1").Unwrap();
    REQUIRE(status.encryption_enabled);
    REQUIRE(status.has_negotiation);
    REQUIRE(status.security_level == 3);
    REQUIRE(status.quantum_resistant);
    REQUIRE(status.algorithm == "hybrid");
    REQUIRE(status.negotiated_at == clock->Now());

    REQUIRE(ledger.RecordMessage("", "x", true).UnwrapErr().type == ProtocolFailureType::ValidationError);
}

TEST_CASE("AlgorithmNegotiationLedger - Statistics", "[negotiation][stats]") {
    auto clock = std::make_shared<ManualClock>();
    AlgorithmNegotiationLedger ledger(configuration::ServiceConfig::Default(), clock);

    REQUIRE(ledger.Stats().Unwrap().total == 0);
    REQUIRE(ledger.Stats().Unwrap().encryption_rate == 0.0);

    // Outside the last hour once the clock moves.
    REQUIRE(ledger.RecordMessage("conv-0", std::string(kClassicalAlgorithm), true).IsOk());
    REQUIRE(ledger.Record("conv-0", "carol", "dave", ClassicalOutcome()).IsOk());
    clock->Advance(std::chrono::hours(2));

    REQUIRE(ledger.Record("conv-1", "alice", "bob", HybridOutcome()).IsOk());
    REQUIRE(ledger.RecordMessage("conv-1", std::string(kHybridAlgorithm), true).IsOk());
    REQUIRE(ledger.RecordMessage("conv-1", std::string(kHybridAlgorithm), true).IsOk());
    REQUIRE(ledger.RecordMessage("conv-1", "", false).IsOk());

    auto hour = ledger.Stats(models::Timeframe::LastHour).Unwrap();
    REQUIRE(hour.total == 3);
    REQUIRE(hour.encrypted == 2);
    REQUIRE(hour.by_algorithm.at(std::string(kHybridAlgorithm)) == 2);
    REQUIRE(hour.by_algorithm.at("none") == 1);
    REQUIRE(hour.encryption_rate == 66.67);
    REQUIRE(hour.negotiations == 1);
    REQUIRE(hour.quantum_resistant_negotiations == 1);

    auto day = ledger.Stats(models::Timeframe::LastDay).Unwrap();
    REQUIRE(day.total == 4);
    REQUIRE(day.encryption_rate == 75.0);
    REQUIRE(day.negotiations == 2);
    REQUIRE(day.quantum_resistant_negotiations == 1);
}

TEST_CASE("AlgorithmNegotiationLedger - Retention sweep", "[negotiation][cleanup]") {
    auto clock = std::make_shared<ManualClock>();
    AlgorithmNegotiationLedger ledger(configuration::ServiceConfig::Default(), clock);

    REQUIRE(ledger.Record("conv-1", "alice", "bob", ClassicalOutcome()).IsOk());
    REQUIRE(ledger.RecordMessage("conv-1", std::string(kClassicalAlgorithm), true).IsOk());
    clock->Advance(std::chrono::hours(24 * 29));
    auto current = ledger.Record("conv-1", "alice", "bob", HybridOutcome());
    REQUIRE(current.IsOk());

    REQUIRE(ledger.CleanupExpired().Unwrap() == 0);

    SECTION("Superseded negotiations and old messages go, the active one stays") {
        clock->Advance(std::chrono::hours(24 * 2));
        REQUIRE(ledger.CleanupExpired().Unwrap() == 2);
        auto active = ledger.GetActive("conv-1").Unwrap();
        REQUIRE(active.has_value());
        REQUIRE(active->negotiation_id == current.Unwrap());
        REQUIRE(ledger.EncryptionStatus("conv-1").Unwrap().encryption_enabled);
        REQUIRE(ledger.Stats(models::Timeframe::LastMonth).Unwrap().total == 0);
    }
    SECTION("Expired negotiations go once the retention window passes") {
        clock->Advance(std::chrono::hours(24 * 31));
        REQUIRE_FALSE(ledger.GetActive("conv-1").Unwrap().has_value());
        REQUIRE(ledger.CleanupExpired().Unwrap() == 3);
        REQUIRE(ledger.Stats(models::Timeframe::LastMonth).Unwrap().negotiations == 0);
        REQUIRE(ledger.EncryptionStatus("conv-1").Unwrap().encryption_enabled);
    }
}

TEST_CASE("AlgorithmNegotiationLedger - Store failures propagate", "[negotiation][store]") {
    AlgorithmNegotiationLedger ledger(configuration::ServiceConfig::Default(), std::make_shared<ManualClock>(),
                                      std::make_shared<FailingCoordinationStore>());
    REQUIRE(ledger.Record("conv-1", "alice", "bob", ClassicalOutcome()).UnwrapErr().type ==
            ProtocolFailureType::StorageUnavailable);
    REQUIRE(ledger.GetActive("conv-1").IsErr());
    REQUIRE(ledger.RecordMessage("conv-1", "", false).IsErr());
    REQUIRE(ledger.EncryptionStatus("conv-1").IsErr());
    REQUIRE(ledger.Stats().IsErr());
    REQUIRE(ledger.CleanupExpired().IsErr());
}
