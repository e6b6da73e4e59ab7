#include "pfs/crypto/chacha20_poly1305.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"

#include <sodium.h>

namespace pfs::protocol::crypto {

namespace {
    Result<Unit, ProtocolFailure> CheckParameters(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(
                    compat::format("ChaCha20-Poly1305 key must be {} bytes",
                                   crypto_aead_chacha20poly1305_ietf_KEYBYTES)));
        }
        if (nonce.size() != crypto_aead_chacha20poly1305_ietf_NPUBBYTES) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(
                    compat::format("ChaCha20-Poly1305 nonce must be {} bytes",
                                   crypto_aead_chacha20poly1305_ietf_NPUBBYTES)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == kAeadTagBytes);
static_assert(crypto_aead_chacha20poly1305_ietf_NPUBBYTES == kAeadNonceBytes);

Result<SealedMessage, ProtocolFailure> ChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    PFS_TRY(CheckParameters(key, nonce));

    SealedMessage sealed;
    sealed.ciphertext.resize(plaintext.size());
    sealed.auth_tag.resize(kAeadTagBytes);
    unsigned long long tag_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_encrypt_detached(
            sealed.ciphertext.data(),
            sealed.auth_tag.data(), &tag_len,
            plaintext.data(), plaintext.size(),
            associated_data.data(), associated_data.size(),
            nullptr, nonce.data(), key.data()) != 0) {
        return Result<SealedMessage, ProtocolFailure>::Err(
            ProtocolFailure::Encode("ChaCha20-Poly1305 encryption failed"));
    }
    return Result<SealedMessage, ProtocolFailure>::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, ProtocolFailure> ChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> auth_tag,
    std::span<const uint8_t> associated_data) {
    PFS_TRY(CheckParameters(key, nonce));
    if (auth_tag.size() != kAeadTagBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ValidationError(
                compat::format("Authentication tag must be {} bytes", kAeadTagBytes)));
    }

    std::vector<uint8_t> plaintext(ciphertext.size());
    if (crypto_aead_chacha20poly1305_ietf_decrypt_detached(
            plaintext.data(), nullptr,
            ciphertext.data(), ciphertext.size(),
            auth_tag.data(),
            associated_data.data(), associated_data.size(),
            nonce.data(), key.data()) != 0) {
        SodiumInterop::SecureWipe(plaintext);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailure("Message authentication failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(plaintext));
}

}
