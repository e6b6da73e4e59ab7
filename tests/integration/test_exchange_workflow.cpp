#include <catch2/catch_test_macros.hpp>
#include "pfs/coordination/algorithm_negotiation_ledger.hpp"
#include "pfs/coordination/key_exchange_coordinator.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "helpers/key_bundles.hpp"
#include "helpers/ratchet_fixture.hpp"

#include <sodium.h>

using namespace pfs::protocol;
using namespace pfs::protocol::test_helpers;
using namespace pfs::protocol::coordination;

namespace {
    struct Party {
        std::vector<uint8_t> secret_key = std::vector<uint8_t>(crypto_box_SECRETKEYBYTES);
        std::vector<uint8_t> public_key = std::vector<uint8_t>(crypto_box_PUBLICKEYBYTES);

        Party() { crypto_box_keypair(public_key.data(), secret_key.data()); }

        std::vector<uint8_t> Agree(const std::vector<uint8_t>& peer_public) const {
            std::vector<uint8_t> shared(crypto_scalarmult_BYTES);
            REQUIRE(crypto_scalarmult(shared.data(), secret_key.data(), peer_public.data()) == 0);
            return shared;
        }
    };
}

TEST_CASE("Integration - Key exchange feeds the ratchet and the ledger", "[integration][workflow]") {
    RatchetFixture fixture;
    auto ledger = std::make_shared<AlgorithmNegotiationLedger>(configuration::ServiceConfig::Default(), fixture.clock);
    KeyExchangeCoordinator exchanges(configuration::ServiceConfig::Default(), fixture.clock, ledger);

    Party alice;
    Party bob;
    auto alice_bundle = ClassicalBundle();
    alice_bundle.x25519_public_key = alice.public_key;
    auto bob_bundle = ClassicalBundle();
    bob_bundle.x25519_public_key = bob.public_key;

    const std::vector<uint8_t> offer{0x0A};
    auto initiated = exchanges.Initiate("alice", "bob", fixture.conversation, "initial_setup", alice_bundle, offer);
    REQUIRE(initiated.IsOk());
    const auto exchange_id = initiated.Unwrap().exchange_id;

    auto pending = exchanges.ListPending("bob").Unwrap();
    REQUIRE(pending.size() == 1);
    const auto bob_secret = bob.Agree(pending.front().public_key_bundle.x25519_public_key);

    const std::vector<uint8_t> answer{0x0B};
    REQUIRE(exchanges.Respond(exchange_id, "bob", answer, bob_bundle).IsOk());

    auto data = exchanges.GetData(exchange_id, "alice");
    REQUIRE(data.IsOk());
    const auto alice_secret = alice.Agree(data.Unwrap().recipient_public_key_bundle->x25519_public_key);
    REQUIRE(alice_secret == bob_secret);

    REQUIRE(exchanges.Complete(exchange_id, "alice", std::vector<uint8_t>(64, 0x01)).IsOk());

    REQUIRE(fixture.engine->Initialize(fixture.conversation, "alice", alice_secret, true, {}).IsOk());
    REQUIRE(fixture.engine->Initialize(fixture.conversation, "bob", bob_secret, false, {}).IsOk());

    const auto envelope = fixture.Send("alice", "agreed");
    REQUIRE(ledger->RecordMessage(fixture.conversation, envelope.algorithm(), true).IsOk());
    REQUIRE(fixture.Receive("bob", envelope) == "agreed");

    const auto status = ledger->EncryptionStatus(fixture.conversation).Unwrap();
    REQUIRE(status.encryption_enabled);
    REQUIRE(status.has_negotiation);
    REQUIRE(status.algorithm == "x25519");
    REQUIRE(status.security_level == 1);
    REQUIRE_FALSE(status.quantum_resistant);

    const auto stats = ledger->Stats().Unwrap();
    REQUIRE(stats.total == 1);
    REQUIRE(stats.by_algorithm.at(std::string(kClassicalAlgorithm)) == 1);
    REQUIRE(stats.encryption_rate == 100.0);
}

TEST_CASE("Integration - Mismatched secrets never decrypt", "[integration][workflow]") {
    RatchetFixture fixture;
    REQUIRE(fixture.engine->Initialize(fixture.conversation, fixture.alice, TestSharedSecret(0x01), true, {}).IsOk());
    REQUIRE(fixture.engine->Initialize(fixture.conversation, fixture.bob, TestSharedSecret(0x02), false, {}).IsOk());

    const auto envelope = fixture.Send(fixture.alice, "lost");
    REQUIRE(fixture.engine->Decrypt(fixture.conversation, fixture.bob, envelope).UnwrapErr().type ==
            ProtocolFailureType::AuthenticationFailure);
}
