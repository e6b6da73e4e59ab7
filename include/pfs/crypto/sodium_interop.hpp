#pragma once

#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/crypto/secure_memory_handle.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pfs::protocol::crypto {

/**
 * @brief Static facade over libsodium.
 *
 * Initialize() must succeed before any other call; the service constructors
 * (RatchetEngine, KeyMaterialStore, the coordinators) call it for you.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Memory
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    // ========================================================================
    // X25519
    // ========================================================================

    /// Returns (private key in secure memory, public key).
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> private_key);

    /// X25519 scalar multiplication. Rejects low-order peer points (all-zero output).
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeSharedSecret(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key);

    // ========================================================================
    // Hashing
    // ========================================================================

    /// BLAKE2b keyed hash. `key` must be 16..64 bytes and `output_size` 16..64 bytes.
    static Result<std::vector<uint8_t>, SodiumFailure> KeyedHash(
        std::span<const uint8_t> data,
        std::span<const uint8_t> key,
        size_t output_size);

    // ========================================================================
    // Randomness and encoding
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// Lowercase hex of `byte_count` random bytes; used for record identifiers.
    static std::string RandomHexId(size_t byte_count);

    static std::string ToHex(std::span<const uint8_t> data);

    static std::string ToBase64(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view encoded);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

}
