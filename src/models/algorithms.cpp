#include "pfs/models/algorithms.hpp"

namespace pfs::protocol::models {

std::string_view ToString(const KeyExchangeAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case KeyExchangeAlgorithm::X25519: return "x25519";
        case KeyExchangeAlgorithm::Kyber768: return "kyber768";
        case KeyExchangeAlgorithm::X25519Kyber768: return "hybrid";
    }
    return "unknown";
}

std::string_view ToString(const SignatureAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case SignatureAlgorithm::Ed25519: return "ed25519";
        case SignatureAlgorithm::Dilithium3: return "dilithium3";
        case SignatureAlgorithm::Ed25519Dilithium3: return "hybrid";
    }
    return "unknown";
}

std::string_view ToString(const EncryptionAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case EncryptionAlgorithm::ChaCha20Poly1305: return "chacha20poly1305";
        case EncryptionAlgorithm::Aes256Gcm: return "aes-256-gcm";
    }
    return "unknown";
}

std::optional<KeyExchangeAlgorithm> ParseKeyExchangeAlgorithm(const std::string_view text) noexcept {
    if (text == "x25519") {
        return KeyExchangeAlgorithm::X25519;
    }
    if (text == "kyber768") {
        return KeyExchangeAlgorithm::Kyber768;
    }
    if (text == "hybrid" || text == "x25519+kyber768") {
        return KeyExchangeAlgorithm::X25519Kyber768;
    }
    return std::nullopt;
}

std::optional<SignatureAlgorithm> ParseSignatureAlgorithm(const std::string_view text) noexcept {
    if (text == "ed25519") {
        return SignatureAlgorithm::Ed25519;
    }
    if (text == "dilithium3") {
        return SignatureAlgorithm::Dilithium3;
    }
    if (text == "hybrid" || text == "ed25519+dilithium3") {
        return SignatureAlgorithm::Ed25519Dilithium3;
    }
    return std::nullopt;
}

std::optional<EncryptionAlgorithm> ParseEncryptionAlgorithm(const std::string_view text) noexcept {
    if (text == "chacha20poly1305") {
        return EncryptionAlgorithm::ChaCha20Poly1305;
    }
    if (text == "aes-256-gcm") {
        return EncryptionAlgorithm::Aes256Gcm;
    }
    return std::nullopt;
}

bool IsQuantumResistant(const KeyExchangeAlgorithm algorithm) noexcept {
    return algorithm != KeyExchangeAlgorithm::X25519;
}

}
