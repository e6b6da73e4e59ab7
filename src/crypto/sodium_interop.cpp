#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"

#include <sodium.h>

#include <algorithm>

namespace pfs::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("sodium_init() failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Memory
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(const std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer of {} bytes exceeds wipe limit", buffer.size())));
    }
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    const std::span<const uint8_t> a,
    const std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    sodium_free(ptr);
}

// ============================================================================
// X25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(const std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (sk_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(sk_result.UnwrapErr()));
    }
    auto sk_handle = std::move(sk_result).Unwrap();

    std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
    int rc = -1;
    auto write_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        rc = crypto_scalarmult_base(public_key.data(), sk.data());
        return rc;
    });
    if (write_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    if (rc != 0) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            compat::format("Failed to derive {} public key", key_purpose)));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(public_key)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::DeriveX25519PublicKey(
    const std::span<const uint8_t> private_key) {
    if (private_key.size() != kX25519PrivateKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ValidationError(
                compat::format("X25519 private key must be {} bytes", kX25519PrivateKeyBytes)));
    }
    std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
    if (crypto_scalarmult_base(public_key.data(), private_key.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration("crypto_scalarmult_base failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(public_key));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ComputeSharedSecret(
    const std::span<const uint8_t> private_key,
    const std::span<const uint8_t> peer_public_key) {
    if (private_key.size() != kX25519PrivateKeyBytes ||
        peer_public_key.size() != kX25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ValidationError("Invalid X25519 key size"));
    }
    std::vector<uint8_t> shared(kX25519SharedSecretBytes);
    if (crypto_scalarmult(shared.data(), private_key.data(), peer_public_key.data()) != 0) {
        SecureWipe(shared);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("X25519 rejected peer public key"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
}

// ============================================================================
// Hashing
// ============================================================================

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::KeyedHash(
    const std::span<const uint8_t> data,
    const std::span<const uint8_t> key,
    const size_t output_size) {
    if (key.size() < crypto_generichash_KEYBYTES_MIN || key.size() > crypto_generichash_KEYBYTES_MAX) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(compat::format("Hash key of {} bytes is out of range", key.size())));
    }
    if (output_size < crypto_generichash_BYTES_MIN || output_size > crypto_generichash_BYTES_MAX) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(compat::format("Hash output of {} bytes is out of range", output_size)));
    }
    std::vector<uint8_t> digest(output_size);
    if (crypto_generichash(digest.data(), digest.size(), data.data(), data.size(), key.data(), key.size()) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("crypto_generichash failed"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(digest));
}

// ============================================================================
// Randomness and encoding
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

std::string SodiumInterop::RandomHexId(const size_t byte_count) {
    auto bytes = GetRandomBytes(byte_count);
    return ToHex(bytes);
}

std::string SodiumInterop::ToHex(const std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.pop_back();
    return out;
}

std::string SodiumInterop::ToBase64(const std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
    out.resize(std::char_traits<char>::length(out.c_str()));
    return out;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(const std::string_view encoded) {
    std::vector<uint8_t> out(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                          " \n\r\t", &decoded_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Malformed base64 input"));
    }
    out.resize(decoded_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(out));
}

}
