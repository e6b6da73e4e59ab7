#include <catch2/catch_test_macros.hpp>
#include "pfs/coordination/in_memory_coordination_store.hpp"
#include "helpers/manual_clock.hpp"

#include <chrono>

using namespace pfs::protocol;
using namespace pfs::protocol::test_helpers;
using pfs::protocol::coordination::InMemoryCoordinationStore;

namespace {
    models::AlgorithmNegotiation Negotiation(const std::string& id, const std::string& conversation,
                                             interfaces::TimePoint created_at) {
        models::AlgorithmNegotiation negotiation;
        negotiation.negotiation_id = id;
        negotiation.conversation_id = conversation;
        negotiation.initiator_id = "alice";
        negotiation.responder_id = "bob";
        negotiation.created_at = created_at;
        return negotiation;
    }
}

TEST_CASE("InMemoryCoordinationStore - Negotiations keep insertion order", "[store][coordination]") {
    InMemoryCoordinationStore store;
    const ManualClock clock;
    REQUIRE(store.SaveNegotiation(Negotiation("n1", "conv-1", clock.Now())).IsOk());
    REQUIRE(store.SaveNegotiation(Negotiation("n2", "conv-2", clock.Now())).IsOk());
    REQUIRE(store.SaveNegotiation(Negotiation("n3", "conv-1", clock.Now())).IsOk());

    auto first = Negotiation("n1", "conv-1", clock.Now());
    first.is_active = false;
    REQUIRE(store.SaveNegotiation(first).IsOk());

    auto listed = store.ListNegotiations("conv-1").Unwrap();
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[0].negotiation_id == "n1");
    REQUIRE_FALSE(listed[0].is_active);
    REQUIRE(listed[1].negotiation_id == "n3");
    REQUIRE(store.ListAllNegotiations().Unwrap().size() == 3);

    REQUIRE(store.DeleteNegotiation("n1").Unwrap());
    REQUIRE_FALSE(store.DeleteNegotiation("n1").Unwrap());
    REQUIRE(store.ListNegotiations("conv-1").Unwrap().size() == 1);
}

TEST_CASE("InMemoryCoordinationStore - Message window", "[store][coordination]") {
    InMemoryCoordinationStore store;
    ManualClock clock;
    const auto start = clock.Now();
    REQUIRE(store.AppendMessage(models::RelayedMessage{"conv-1", "x25519", true, start}).IsOk());
    clock.Advance(std::chrono::hours(1));
    REQUIRE(store.AppendMessage(models::RelayedMessage{"conv-1", "none", false, clock.Now()}).IsOk());

    REQUIRE(store.ListMessagesSince(start).Unwrap().size() == 2);
    REQUIRE(store.ListMessagesSince(clock.Now()).Unwrap().size() == 1);
    REQUIRE(store.DeleteMessagesBefore(clock.Now()).Unwrap() == 1);
    REQUIRE(store.ListMessagesSince(start).Unwrap().size() == 1);

    REQUIRE_FALSE(store.IsConversationEncrypted("conv-1").Unwrap());
    REQUIRE(store.MarkConversationEncrypted("conv-1").IsOk());
    REQUIRE(store.IsConversationEncrypted("conv-1").Unwrap());
}

TEST_CASE("InMemoryCoordinationStore - Keyed records upsert", "[store][coordination]") {
    InMemoryCoordinationStore store;

    models::KeyConflict conflict;
    conflict.conflict_id = "c1";
    conflict.conversation_id = "conv-1";
    REQUIRE(store.SaveConflict(conflict).IsOk());
    conflict.status = models::ConflictStatus::Resolved;
    REQUIRE(store.SaveConflict(conflict).IsOk());
    REQUIRE(store.ListConflicts().Unwrap().size() == 1);
    REQUIRE(store.LoadConflict("c1").Unwrap()->status == models::ConflictStatus::Resolved);
    REQUIRE_FALSE(store.LoadConflict("c2").Unwrap().has_value());

    models::DeviceAuthSession session;
    session.session_id = "s1";
    REQUIRE(store.SaveAuthSession(session).IsOk());
    REQUIRE(store.DeleteAuthSession("s1").Unwrap());
    REQUIRE_FALSE(store.LoadAuthSession("s1").Unwrap().has_value());

    REQUIRE_FALSE(store.IsDeviceVerified("alice-phone").Unwrap());
    REQUIRE(store.MarkDeviceVerified("alice-phone").IsOk());
    REQUIRE(store.MarkDeviceVerified("alice-phone").IsOk());
    REQUIRE(store.IsDeviceVerified("alice-phone").Unwrap());
}
