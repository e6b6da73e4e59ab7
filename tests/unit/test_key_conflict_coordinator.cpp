#include <catch2/catch_test_macros.hpp>
#include "pfs/coordination/key_conflict_coordinator.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "helpers/failing_coordination_store.hpp"
#include "helpers/manual_clock.hpp"
#include "helpers/recording_event_handler.hpp"

#include <chrono>

using namespace pfs::protocol;
using namespace pfs::protocol::test_helpers;
using pfs::protocol::coordination::KeyConflictCoordinator;
using models::ConflictSeverity;
using models::ConflictStatus;
using models::ConflictingVersion;

namespace {
    struct ConflictFixture {
        ConflictFixture() {
            REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
            clock = std::make_shared<ManualClock>();
            events = std::make_shared<RecordingEventHandler>();
            conflicts = std::make_shared<KeyConflictCoordinator>(
                configuration::ServiceConfig::Default(), clock, events);
        }

        std::vector<ConflictingVersion> Versions(uint64_t phone, uint64_t laptop) const {
            return {
                ConflictingVersion{"alice-phone", phone, clock->Now(), {0x01, 0x02}},
                ConflictingVersion{"alice-laptop", laptop, clock->Now() + std::chrono::seconds(5), {0x03, 0x04}},
            };
        }

        std::string Report(uint64_t phone, uint64_t laptop, const std::string& strategy = "latest_wins",
                           const std::string& conversation = "conv-1") {
            auto receipt = conflicts->Report(conversation, "ratchet_state", Versions(phone, laptop), strategy);
            REQUIRE(receipt.IsOk());
            return receipt.Unwrap().conflict_id;
        }

        std::shared_ptr<ManualClock> clock;
        std::shared_ptr<RecordingEventHandler> events;
        std::shared_ptr<KeyConflictCoordinator> conflicts;
    };
}

TEST_CASE("AssessConflictSeverity - Version spread thresholds", "[conflict][models]") {
    REQUIRE(models::AssessConflictSeverity(5, 5) == ConflictSeverity::Low);
    REQUIRE(models::AssessConflictSeverity(1, 3) == ConflictSeverity::Low);
    REQUIRE(models::AssessConflictSeverity(1, 4) == ConflictSeverity::Medium);
    REQUIRE(models::AssessConflictSeverity(1, 6) == ConflictSeverity::Medium);
    REQUIRE(models::AssessConflictSeverity(1, 7) == ConflictSeverity::High);
    REQUIRE(models::AssessConflictSeverity(1, 11) == ConflictSeverity::High);
    REQUIRE(models::AssessConflictSeverity(1, 12) == ConflictSeverity::Critical);
}

TEST_CASE("KeyConflictCoordinator - Report and resolve", "[conflict]") {
    ConflictFixture fixture;
    auto reported = fixture.conflicts->Report("conv-1", "ratchet_state", fixture.Versions(4, 9), "latest_wins");
    REQUIRE(reported.IsOk());
    const auto id = reported.Unwrap().conflict_id;
    REQUIRE(id.size() == kConflictIdBytes * 2);
    REQUIRE(reported.Unwrap().severity == ConflictSeverity::Medium);
    REQUIRE(reported.Unwrap().status == ConflictStatus::Detected);
    REQUIRE(reported.Unwrap().recommended_version == std::optional<uint64_t>(9));

    const auto events = fixture.events->Events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].hook == "conflict_detected");
    REQUIRE(events[0].id == id);
    REQUIRE(events[0].target == "conv-1");

    auto stored = fixture.conflicts->Get(id).Unwrap();
    REQUIRE(stored.versions.size() == 2);
    REQUIRE(stored.detected_at == fixture.clock->Now());

    SECTION("Resolving to a reported version") {
        fixture.clock->Advance(std::chrono::minutes(2));
        auto resolved = fixture.conflicts->Resolve(id, "alice-laptop", 9);
        REQUIRE(resolved.IsOk());
        REQUIRE(resolved.Unwrap().status == ConflictStatus::Resolved);
        auto after = fixture.conflicts->Get(id).Unwrap();
        REQUIRE(after.resolved_version == std::optional<uint64_t>(9));
        REQUIRE(after.resolved_by == std::optional<std::string>("alice-laptop"));
        REQUIRE(after.resolved_at == fixture.clock->Now());
        REQUIRE(fixture.conflicts->ListOpen("conv-1").Unwrap().empty());
        REQUIRE(fixture.conflicts->Resolve(id, "alice-laptop", 9).UnwrapErr().type ==
                ProtocolFailureType::InvalidState);
    }
    SECTION("Unknown versions and outsiders are rejected") {
        REQUIRE(fixture.conflicts->Resolve(id, "alice-laptop", 7).UnwrapErr().type ==
                ProtocolFailureType::ValidationError);
        REQUIRE(fixture.conflicts->Resolve(id, "mallory-tablet", 9).UnwrapErr().type ==
                ProtocolFailureType::DeviceUnauthorized);
        REQUIRE(fixture.conflicts->Resolve("missing", "alice-laptop", 9).UnwrapErr().type ==
                ProtocolFailureType::ConflictNotFound);
        REQUIRE(fixture.conflicts->Get(id).Unwrap().status == ConflictStatus::Detected);
    }
    SECTION("Marked failed") {
        auto failed = fixture.conflicts->MarkFailed(id, "devices disagree on key hash");
        REQUIRE(failed.Unwrap().status == ConflictStatus::Failed);
        REQUIRE(fixture.conflicts->Get(id).Unwrap().failure_reason ==
                std::optional<std::string>("devices disagree on key hash"));
        REQUIRE(fixture.conflicts->MarkFailed(id, "again").UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("KeyConflictCoordinator - Authoritative device", "[conflict]") {
    ConflictFixture fixture;
    auto receipt = fixture.conflicts->Report("conv-1", "device_key", fixture.Versions(12, 2),
                                             "authoritative_device", std::string("alice-phone"));
    REQUIRE(receipt.IsOk());
    const auto id = receipt.Unwrap().conflict_id;
    REQUIRE(receipt.Unwrap().severity == ConflictSeverity::High);
    REQUIRE(receipt.Unwrap().recommended_version == std::optional<uint64_t>(12));

    REQUIRE(fixture.conflicts->Resolve(id, "alice-laptop", 2).UnwrapErr().type ==
            ProtocolFailureType::DeviceUnauthorized);
    REQUIRE(fixture.conflicts->Resolve(id, "alice-phone", 12).IsOk());

    SECTION("The authoritative device must have reported") {
        REQUIRE(fixture.conflicts->Report("conv-1", "device_key", fixture.Versions(1, 2),
                                          "authoritative_device", std::string("alice-tablet"))
                    .UnwrapErr().type == ProtocolFailureType::ValidationError);
        REQUIRE(fixture.conflicts->Report("conv-1", "device_key", fixture.Versions(1, 2),
                                          "authoritative_device").IsErr());
    }
}

TEST_CASE("KeyConflictCoordinator - Manual strategies leave the pick open", "[conflict]") {
    ConflictFixture fixture;
    for (const auto* strategy : {"manual", "consensus", "highest_trust", "merge"}) {
        auto receipt = fixture.conflicts->Report("conv-1", "hybrid_key", fixture.Versions(3, 4), strategy);
        REQUIRE(receipt.IsOk());
        REQUIRE_FALSE(receipt.Unwrap().recommended_version.has_value());
    }
}

TEST_CASE("KeyConflictCoordinator - Report validation", "[conflict][validation]") {
    ConflictFixture fixture;
    const auto versions = fixture.Versions(1, 2);

    REQUIRE(fixture.conflicts->Report("", "ratchet_state", versions, "latest_wins").UnwrapErr().type ==
            ProtocolFailureType::ValidationError);
    REQUIRE(fixture.conflicts->Report("conv-1", "session_cookie", versions, "latest_wins").UnwrapErr().type ==
            ProtocolFailureType::ValidationError);
    REQUIRE(fixture.conflicts->Report("conv-1", "ratchet_state", versions, "coin_flip").UnwrapErr().type ==
            ProtocolFailureType::ValidationError);
    REQUIRE(fixture.conflicts->Report("conv-1", "ratchet_state", {versions.front()}, "latest_wins").IsErr());

    auto agreeing = versions;
    agreeing[1].version = agreeing[0].version;
    agreeing[1].key_hash = agreeing[0].key_hash;
    REQUIRE(fixture.conflicts->Report("conv-1", "ratchet_state", agreeing, "latest_wins").IsErr());

    auto anonymous = versions;
    anonymous[0].device_id.clear();
    REQUIRE(fixture.conflicts->Report("conv-1", "ratchet_state", anonymous, "latest_wins").IsErr());

    // Same version, different key material still diverges.
    auto split = versions;
    split[1].version = split[0].version;
    auto receipt = fixture.conflicts->Report("conv-1", "conversation_key", split, "latest_wins");
    REQUIRE(receipt.IsOk());
    REQUIRE(receipt.Unwrap().severity == ConflictSeverity::Low);
    REQUIRE(fixture.events->Events().size() == 1);
}

TEST_CASE("KeyConflictCoordinator - Open list ordering", "[conflict][ordering]") {
    ConflictFixture fixture;
    const auto low_old = fixture.Report(1, 2);
    fixture.clock->Advance(std::chrono::seconds(1));
    const auto critical = fixture.Report(1, 20);
    fixture.clock->Advance(std::chrono::seconds(1));
    const auto low_new = fixture.Report(3, 4);
    fixture.clock->Advance(std::chrono::seconds(1));
    const auto high = fixture.Report(1, 8);
    fixture.Report(1, 30, "latest_wins", "conv-other");

    auto open = fixture.conflicts->ListOpen("conv-1").Unwrap();
    REQUIRE(open.size() == 4);
    REQUIRE(open[0].conflict_id == critical);
    REQUIRE(open[1].conflict_id == high);
    REQUIRE(open[2].conflict_id == low_old);
    REQUIRE(open[3].conflict_id == low_new);

    REQUIRE(fixture.conflicts->Resolve(critical, "alice-phone", 1).IsOk());
    REQUIRE(fixture.conflicts->ListOpen("conv-1").Unwrap().size() == 3);
}

TEST_CASE("KeyConflictCoordinator - Retention sweep", "[conflict][cleanup]") {
    ConflictFixture fixture;
    const auto open = fixture.Report(1, 2);
    const auto settled = fixture.Report(1, 5);
    REQUIRE(fixture.conflicts->Resolve(settled, "alice-phone", 1).IsOk());

    fixture.clock->Advance(std::chrono::hours(24 * 29));
    REQUIRE(fixture.conflicts->CleanupExpired().Unwrap() == 0);

    fixture.clock->Advance(std::chrono::hours(24 * 2));
    REQUIRE(fixture.conflicts->CleanupExpired().Unwrap() == 2);
    REQUIRE(fixture.conflicts->Get(open).UnwrapErr().type == ProtocolFailureType::ConflictNotFound);
    REQUIRE(fixture.conflicts->Get(settled).UnwrapErr().type == ProtocolFailureType::ConflictNotFound);
}

TEST_CASE("KeyConflictCoordinator - Store failures propagate", "[conflict][store]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto clock = std::make_shared<ManualClock>();
    KeyConflictCoordinator conflicts(configuration::ServiceConfig::Default(), clock, nullptr,
                                     std::make_shared<FailingCoordinationStore>());
    const std::vector<ConflictingVersion> versions{
        {"alice-phone", 1, clock->Now(), {0x01}},
        {"alice-laptop", 2, clock->Now(), {0x02}},
    };
    REQUIRE(conflicts.Report("conv-1", "ratchet_state", versions, "latest_wins").UnwrapErr().type ==
            ProtocolFailureType::StorageUnavailable);
    REQUIRE(conflicts.Get("any").UnwrapErr().type == ProtocolFailureType::StorageUnavailable);
    REQUIRE(conflicts.ListOpen("conv-1").IsErr());
    REQUIRE(conflicts.Resolve("any", "alice-phone", 1).IsErr());
    REQUIRE(conflicts.CleanupExpired().IsErr());
}
