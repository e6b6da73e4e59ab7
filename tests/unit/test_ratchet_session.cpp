#include <catch2/catch_test_macros.hpp>
#include "pfs/protocol/ratchet_session.hpp"
#include "pfs/core/constants.hpp"
#include "helpers/session_pair.hpp"

#include <vector>

using namespace pfs::protocol;
using namespace pfs::protocol::test_helpers;

TEST_CASE("RatchetSession - Bootstrap", "[ratchet][session]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto now = interfaces::TimePoint{};
    const auto secret = TestSharedSecret();

    SECTION("Initiator starts on its own sending chain") {
        auto state = RatchetSession::Bootstrap("conv-1", "alice", secret, true, std::nullopt, now);
        REQUIRE(state.IsOk());
        REQUIRE(state.Unwrap().HasSendingChain());
        REQUIRE(state.Unwrap().HasReceivingChain());
        REQUIRE(state.Unwrap().sending_chain_length == 1);
        REQUIRE(state.Unwrap().sending_message_number == 0);
        REQUIRE_FALSE(state.Unwrap().IsHybrid());
    }
    SECTION("Responder has no receiving chain yet") {
        auto state = RatchetSession::Bootstrap("conv-1", "bob", secret, false, std::nullopt, now);
        REQUIRE(state.IsOk());
        REQUIRE(state.Unwrap().HasSendingChain());
        REQUIRE_FALSE(state.Unwrap().HasReceivingChain());
        REQUIRE(state.Unwrap().sending_chain_length == 0);
    }
    SECTION("Shared secret must be 32 bytes") {
        std::vector<uint8_t> short_secret(16, 0x01);
        auto state = RatchetSession::Bootstrap("conv-1", "alice", short_secret, true, std::nullopt, now);
        REQUIRE(state.UnwrapErr().type == ProtocolFailureType::ValidationError);
    }
    SECTION("Ids are required") {
        auto state = RatchetSession::Bootstrap("", "alice", secret, true, std::nullopt, now);
        REQUIRE(state.UnwrapErr().type == ProtocolFailureType::ValidationError);
    }
    SECTION("Conversation id separates roots") {
        auto first = RatchetSession::Bootstrap("conv-1", "bob", secret, false, std::nullopt, now);
        auto second = RatchetSession::Bootstrap("conv-2", "bob", secret, false, std::nullopt, now);
        REQUIRE(first.Unwrap().root_key != second.Unwrap().root_key);
    }
}

TEST_CASE("RatchetSession - First message header", "[ratchet][session]") {
    auto pair = CreateSessionPair();
    auto envelope = Seal(*pair.alice, "hello bob", pair.now);
    REQUIRE(envelope.message_number() == 0);
    REQUIRE(envelope.chain_length() == 1);
    REQUIRE(envelope.previous_chain_length() == 0);
    REQUIRE(envelope.key_id() == "1-0");
    REQUIRE(envelope.algorithm() == kClassicalAlgorithm);
    REQUIRE(envelope.security_level() == kClassicalSecurityLevel);
    REQUIRE(envelope.ephemeral_public_key().size() == kX25519PublicKeyBytes);
    REQUIRE(envelope.nonce().size() == kAeadNonceBytes);
    REQUIRE(envelope.auth_tag().size() == kAeadTagBytes);
    REQUIRE_FALSE(envelope.has_pqc_ciphertext());
    REQUIRE(Open(*pair.bob, envelope, pair.now) == "hello bob");
}

TEST_CASE("RatchetSession - Ping-pong advances the DH ratchet", "[ratchet][session]") {
    auto pair = CreateSessionPair();
    auto a0 = Seal(*pair.alice, "a0", pair.now);
    REQUIRE(Open(*pair.bob, a0, pair.now) == "a0");

    auto b0 = Seal(*pair.bob, "b0", pair.now);
    REQUIRE(b0.chain_length() == 1);
    REQUIRE(b0.ephemeral_public_key() != a0.ephemeral_public_key());
    REQUIRE(Open(*pair.alice, b0, pair.now) == "b0");

    auto a1 = Seal(*pair.alice, "a1", pair.now);
    REQUIRE(a1.chain_length() == 2);
    REQUIRE(a1.message_number() == 0);
    REQUIRE(a1.previous_chain_length() == 1);
    REQUIRE(a1.ephemeral_public_key() != a0.ephemeral_public_key());
    REQUIRE(Open(*pair.bob, a1, pair.now) == "a1");
}

TEST_CASE("RatchetSession - Responder may speak first", "[ratchet][session]") {
    auto pair = CreateSessionPair();
    auto b0 = Seal(*pair.bob, "from bob", pair.now);
    REQUIRE(b0.chain_length() == 0);
    REQUIRE(Open(*pair.alice, b0, pair.now) == "from bob");
    auto a0 = Seal(*pair.alice, "from alice", pair.now);
    REQUIRE(Open(*pair.bob, a0, pair.now) == "from alice");
}

TEST_CASE("RatchetSession - Out-of-order delivery", "[ratchet][session][skip]") {
    auto pair = CreateSessionPair(configuration::RatchetConfig(10, 4));
    std::vector<proto::wire::RatchetEnvelope> sent;
    for (int i = 0; i < 10; ++i) {
        sent.push_back(Seal(*pair.alice, "m" + std::to_string(i), pair.now));
    }

    REQUIRE(Open(*pair.bob, sent[0], pair.now) == "m0");

    auto outcome = pair.bob->Decrypt(sent[9], {}, pair.now);
    REQUIRE(outcome.IsOk());
    REQUIRE(Text(outcome.Unwrap().plaintext) == "m9");
    // Keys 1..8 were derived; only the newest four survive the cap.
    REQUIRE(pair.bob->State().skipped_keys.size() == 4);
    REQUIRE(outcome.Unwrap().changes.added.size() == 4);
    REQUIRE(outcome.Unwrap().changes.removed.empty());

    SECTION("Evicted keys are gone") {
        auto old = pair.bob->Decrypt(sent[1], {}, pair.now);
        REQUIRE(old.IsErr());
        REQUIRE(old.UnwrapErr().type == ProtocolFailureType::SkipWindowExceeded);
    }
    SECTION("Retained keys decrypt exactly once") {
        auto late = pair.bob->Decrypt(sent[6], {}, pair.now);
        REQUIRE(late.IsOk());
        REQUIRE(Text(late.Unwrap().plaintext) == "m6");
        REQUIRE(late.Unwrap().changes.removed.size() == 1);
        REQUIRE(pair.bob->State().skipped_keys.size() == 3);

        auto replay = pair.bob->Decrypt(sent[6], {}, pair.now);
        REQUIRE(replay.IsErr());
        REQUIRE(replay.UnwrapErr().type == ProtocolFailureType::SkipWindowExceeded);
    }
}

TEST_CASE("RatchetSession - Full-window gap against a small cap", "[ratchet][session][skip]") {
    auto pair = CreateSessionPair(configuration::RatchetConfig(1000, 3));
    std::vector<proto::wire::RatchetEnvelope> sent;
    for (int i = 0; i <= 1000; ++i) {
        sent.push_back(Seal(*pair.alice, "m" + std::to_string(i), pair.now));
    }

    auto outcome = pair.bob->Decrypt(sent[1000], {}, pair.now);
    REQUIRE(outcome.IsOk());
    REQUIRE(pair.bob->State().skipped_keys.size() == 3);
    REQUIRE(outcome.Unwrap().changes.added.size() == 3);

    // The three most recently derived keys are the ones kept.
    REQUIRE(Open(*pair.bob, sent[999], pair.now) == "m999");
    REQUIRE(Open(*pair.bob, sent[997], pair.now) == "m997");
    REQUIRE(Open(*pair.bob, sent[998], pair.now) == "m998");
    REQUIRE(pair.bob->Decrypt(sent[996], {}, pair.now).UnwrapErr().type ==
            ProtocolFailureType::SkipWindowExceeded);
    REQUIRE(pair.bob->Decrypt(sent[0], {}, pair.now).UnwrapErr().type ==
            ProtocolFailureType::SkipWindowExceeded);
}

TEST_CASE("RatchetSession - Gap beyond the skip window", "[ratchet][session][skip]") {
    auto pair = CreateSessionPair(configuration::RatchetConfig(10, 100));
    std::vector<proto::wire::RatchetEnvelope> sent;
    for (int i = 0; i < 12; ++i) {
        sent.push_back(Seal(*pair.alice, "m" + std::to_string(i), pair.now));
    }
    auto too_far = pair.bob->Decrypt(sent[11], {}, pair.now);
    REQUIRE(too_far.IsErr());
    REQUIRE(too_far.UnwrapErr().type == ProtocolFailureType::SkipWindowExceeded);

    // The rejected envelope left no trace.
    REQUIRE(pair.bob->State().skipped_keys.empty());
    REQUIRE_FALSE(pair.bob->State().HasReceivingChain());
    REQUIRE(Open(*pair.bob, sent[0], pair.now) == "m0");
    REQUIRE(Open(*pair.bob, sent[10], pair.now) == "m10");
}

TEST_CASE("RatchetSession - Skipped keys across a DH step", "[ratchet][session][skip]") {
    auto pair = CreateSessionPair();
    auto a0 = Seal(*pair.alice, "a0", pair.now);
    auto a1 = Seal(*pair.alice, "a1", pair.now);
    REQUIRE(Open(*pair.bob, a0, pair.now) == "a0");
    REQUIRE(Open(*pair.alice, Seal(*pair.bob, "b0", pair.now), pair.now) == "b0");

    // New chain from alice; a1 of the previous chain is still in flight.
    auto a2 = Seal(*pair.alice, "a2", pair.now);
    REQUIRE(a2.previous_chain_length() == 2);
    REQUIRE(Open(*pair.bob, a2, pair.now) == "a2");
    REQUIRE(pair.bob->State().skipped_keys.size() == 1);
    REQUIRE(Open(*pair.bob, a1, pair.now) == "a1");
    REQUIRE(pair.bob->State().skipped_keys.empty());
}

TEST_CASE("RatchetSession - Hybrid suite", "[ratchet][session][hybrid]") {
    auto pair = CreateSessionPair(configuration::RatchetConfig::Default(), true);
    auto a0 = Seal(*pair.alice, "quantum hello", pair.now);
    REQUIRE(a0.algorithm() == kHybridAlgorithm);
    REQUIRE(a0.security_level() == kHybridSecurityLevel);
    REQUIRE(a0.has_pqc_ciphertext());
    REQUIRE(a0.pqc_ciphertext().size() == kKyberCiphertextBytes);
    REQUIRE(Open(*pair.bob, a0, pair.now) == "quantum hello");

    auto b0 = Seal(*pair.bob, "reply", pair.now);
    REQUIRE(b0.has_pqc_ciphertext());
    REQUIRE(Open(*pair.alice, b0, pair.now) == "reply");

    SECTION("A new chain without a Kyber ciphertext is rejected") {
        auto a1 = Seal(*pair.alice, "stripped", pair.now);
        a1.clear_pqc_ciphertext();
        auto result = pair.bob->Decrypt(a1, {}, pair.now);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::ValidationError);
    }
}

TEST_CASE("RatchetSession - Caller associated data is bound", "[ratchet][session]") {
    auto pair = CreateSessionPair();
    const auto ad = Bytes("room-42");
    auto envelope = pair.alice->Encrypt(Bytes("bound"), ad, pair.now);
    REQUIRE(envelope.IsOk());

    auto wrong = pair.bob->Decrypt(envelope.Unwrap(), Bytes("room-43"), pair.now);
    REQUIRE(wrong.IsErr());
    REQUIRE(wrong.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);

    auto right = pair.bob->Decrypt(envelope.Unwrap(), ad, pair.now);
    REQUIRE(right.IsOk());
    REQUIRE(Text(right.Unwrap().plaintext) == "bound");
}

TEST_CASE("RatchetSession - Malformed envelopes", "[ratchet][session][validation]") {
    auto pair = CreateSessionPair();
    auto envelope = Seal(*pair.alice, "x", pair.now);
    SECTION("Short nonce") {
        envelope.set_nonce(std::string(8, '\0'));
        REQUIRE(pair.bob->Decrypt(envelope, {}, pair.now).UnwrapErr().type == ProtocolFailureType::ValidationError);
    }
    SECTION("Missing tag") {
        envelope.clear_auth_tag();
        REQUIRE(pair.bob->Decrypt(envelope, {}, pair.now).UnwrapErr().type == ProtocolFailureType::ValidationError);
    }
    SECTION("Short ephemeral key") {
        envelope.set_ephemeral_public_key(std::string(31, '\x01'));
        REQUIRE(pair.bob->Decrypt(envelope, {}, pair.now).UnwrapErr().type == ProtocolFailureType::ValidationError);
    }
}
