#pragma once

#include <catch2/catch_test_macros.hpp>
#include "pfs/configuration/service_config.hpp"
#include "pfs/crypto/kyber_interop.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/protocol/ratchet_engine.hpp"
#include "pfs/storage/in_memory_storage_backend.hpp"
#include "pfs/storage/key_material_store.hpp"
#include "pfs/storage/state_key_providers.hpp"
#include "manual_clock.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pfs::protocol::test_helpers {

inline std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::string Text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

inline std::vector<uint8_t> TestSharedSecret(uint8_t fill = 0x42) {
    return std::vector<uint8_t>(kSharedSecretBytes, fill);
}

/// Kyber key pairs for two parties, cross-wired for the hybrid suite.
struct HybridPair {
    HybridKeys initiator;
    HybridKeys responder;
};

inline HybridPair GenerateHybridPair() {
    using crypto::KyberInterop;
    auto first = KyberInterop::GenerateKyber768KeyPair("test-initiator-kyber");
    REQUIRE(first.IsOk());
    auto second = KyberInterop::GenerateKyber768KeyPair("test-responder-kyber");
    REQUIRE(second.IsOk());
    auto [initiator_sk, initiator_pk] = std::move(first).Unwrap();
    auto [responder_sk, responder_pk] = std::move(second).Unwrap();
    auto initiator_sk_bytes = initiator_sk.ReadBytes(KyberInterop::KYBER_768_SECRET_KEY_SIZE);
    auto responder_sk_bytes = responder_sk.ReadBytes(KyberInterop::KYBER_768_SECRET_KEY_SIZE);
    REQUIRE(initiator_sk_bytes.IsOk());
    REQUIRE(responder_sk_bytes.IsOk());

    HybridPair pair;
    pair.initiator = HybridKeys{initiator_sk_bytes.Unwrap(), initiator_pk, responder_pk};
    pair.responder = HybridKeys{responder_sk_bytes.Unwrap(), responder_pk, initiator_pk};
    return pair;
}

/**
 * In-memory store plus engine on a manual clock. `alice` is the initiator of "conv-1",
 * `bob` the responder; both are bootstrapped by Establish().
 */
struct RatchetFixture {
    explicit RatchetFixture(configuration::RatchetConfig ratchet = configuration::RatchetConfig::Default()) {
        REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
        clock = std::make_shared<ManualClock>();
        backend = std::make_shared<storage::InMemoryStorageBackend>();
        auto provider = storage::StaticStateKeyProvider::Generate();
        REQUIRE(provider.IsOk());
        key_provider = std::move(provider).Unwrap();
        auto config = configuration::ServiceConfig::Default();
        config.ratchet = ratchet;
        auto created = storage::KeyMaterialStore::Create(backend, key_provider, config, clock);
        REQUIRE(created.IsOk());
        store = std::move(created).Unwrap();
        engine = std::make_unique<RatchetEngine>(store, ratchet, clock);
    }

    void Establish(bool hybrid = false) {
        InitializeOptions alice_options;
        InitializeOptions bob_options;
        if (hybrid) {
            auto pair = GenerateHybridPair();
            alice_options.hybrid = pair.initiator;
            bob_options.hybrid = pair.responder;
        }
        const auto secret = TestSharedSecret();
        REQUIRE(engine->Initialize(conversation, alice, secret, true, alice_options).IsOk());
        REQUIRE(engine->Initialize(conversation, bob, secret, false, bob_options).IsOk());
    }

    proto::wire::RatchetEnvelope Send(const std::string& from, const std::string& text) {
        auto envelope = engine->Encrypt(conversation, from, Bytes(text));
        REQUIRE(envelope.IsOk());
        return envelope.Unwrap();
    }

    std::string Receive(const std::string& to, const proto::wire::RatchetEnvelope& envelope) {
        auto plaintext = engine->Decrypt(conversation, to, envelope);
        REQUIRE(plaintext.IsOk());
        return Text(plaintext.Unwrap());
    }

    std::string conversation = "conv-1";
    std::string alice = "alice";
    std::string bob = "bob";
    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<storage::InMemoryStorageBackend> backend;
    std::shared_ptr<interfaces::IStateKeyProvider> key_provider;
    std::shared_ptr<storage::KeyMaterialStore> store;
    std::unique_ptr<RatchetEngine> engine;
};

}
