#pragma once

#include "pfs/models/key_exchange.hpp"

#include <vector>

namespace pfs::protocol::test_helpers {

inline models::PublicKeyBundle ClassicalBundle(uint8_t fill = 0x11) {
    models::PublicKeyBundle bundle;
    bundle.x25519_public_key.assign(32, fill);
    bundle.security_level = 1;
    bundle.selected.key_exchange = models::KeyExchangeAlgorithm::X25519;
    bundle.selected.signature = models::SignatureAlgorithm::Ed25519;
    bundle.capabilities.key_exchange = {models::KeyExchangeAlgorithm::X25519};
    bundle.capabilities.signature = {models::SignatureAlgorithm::Ed25519};
    bundle.capabilities.encryption = {models::EncryptionAlgorithm::ChaCha20Poly1305};
    return bundle;
}

inline models::PublicKeyBundle HybridBundle(uint8_t fill = 0x22) {
    models::PublicKeyBundle bundle;
    bundle.x25519_public_key.assign(32, fill);
    bundle.kyber_public_key = std::vector<uint8_t>(1184, fill);
    bundle.security_level = 3;
    bundle.quantum_resistant = true;
    bundle.hybrid_mode = true;
    bundle.capabilities.key_exchange = {models::KeyExchangeAlgorithm::X25519,
                                        models::KeyExchangeAlgorithm::X25519Kyber768};
    bundle.capabilities.signature = {models::SignatureAlgorithm::Ed25519, models::SignatureAlgorithm::Dilithium3};
    bundle.capabilities.encryption = {models::EncryptionAlgorithm::ChaCha20Poly1305};
    bundle.capabilities.max_security_level = 3;
    return bundle;
}

}
