#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace pfs::protocol::models {

enum class KeyExchangeAlgorithm {
    X25519,
    Kyber768,
    X25519Kyber768
};

enum class SignatureAlgorithm {
    Ed25519,
    Dilithium3,
    Ed25519Dilithium3
};

enum class EncryptionAlgorithm {
    ChaCha20Poly1305,
    Aes256Gcm
};

std::string_view ToString(KeyExchangeAlgorithm algorithm) noexcept;
std::string_view ToString(SignatureAlgorithm algorithm) noexcept;
std::string_view ToString(EncryptionAlgorithm algorithm) noexcept;

std::optional<KeyExchangeAlgorithm> ParseKeyExchangeAlgorithm(std::string_view text) noexcept;
std::optional<SignatureAlgorithm> ParseSignatureAlgorithm(std::string_view text) noexcept;
std::optional<EncryptionAlgorithm> ParseEncryptionAlgorithm(std::string_view text) noexcept;

/// True for algorithms with a post-quantum component.
bool IsQuantumResistant(KeyExchangeAlgorithm algorithm) noexcept;

/// What one party is able to speak. Exchanged inside PublicKeyBundle and archived with the
/// negotiation outcome.
struct CapabilitySet {
    std::set<KeyExchangeAlgorithm> key_exchange;
    std::set<SignatureAlgorithm> signature;
    std::set<EncryptionAlgorithm> encryption;
    uint32_t max_security_level = 1;
    bool supports_pfs = true;
    bool supports_double_ratchet = true;

    bool operator==(const CapabilitySet&) const = default;
};

struct SelectedAlgorithms {
    KeyExchangeAlgorithm key_exchange = KeyExchangeAlgorithm::X25519Kyber768;
    SignatureAlgorithm signature = SignatureAlgorithm::Dilithium3;
    EncryptionAlgorithm encryption = EncryptionAlgorithm::ChaCha20Poly1305;

    bool operator==(const SelectedAlgorithms&) const = default;
};

}
