#pragma once

#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/crypto/secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace pfs::protocol::crypto {

/// Kyber-768 KEM (ML-KEM-768 parameter set) backed by liboqs.
///
/// liboqs randomness is routed through libsodium's randombytes_buf on first use, so every
/// key pair and encapsulation draws from the same CSPRNG as the X25519 ratchet.
class KyberInterop {
public:
    static constexpr size_t KYBER_768_PUBLIC_KEY_SIZE = 1184;
    static constexpr size_t KYBER_768_SECRET_KEY_SIZE = 2400;
    static constexpr size_t KYBER_768_CIPHERTEXT_SIZE = 1088;
    static constexpr size_t KYBER_768_SHARED_SECRET_SIZE = 32;

    static Result<Unit, SodiumFailure> Initialize();

    /// Returns (secret key in secure memory, public key).
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    GenerateKyber768KeyPair(std::string_view purpose);

    /// Returns (ciphertext, shared secret).
    static Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>
    Encapsulate(std::span<const uint8_t> public_key);

    static Result<SecureMemoryHandle, SodiumFailure>
    Decapsulate(std::span<const uint8_t> ciphertext, const SecureMemoryHandle& secret_key);

    static Result<Unit, SodiumFailure> ValidatePublicKey(std::span<const uint8_t> public_key);

    static Result<Unit, SodiumFailure> ValidateCiphertext(std::span<const uint8_t> ciphertext);

    static Result<Unit, SodiumFailure> ValidateSecretKey(const SecureMemoryHandle& secret_key);

private:
    KyberInterop() = delete;
};

}
