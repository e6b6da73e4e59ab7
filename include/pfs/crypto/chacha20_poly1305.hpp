#pragma once
#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace pfs::protocol::crypto {

struct SealedMessage {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> auth_tag;
};

/// IETF ChaCha20-Poly1305 with a detached 16-byte tag (libsodium). Message AEAD of the ratchet.
class ChaCha20Poly1305 {
public:
    [[nodiscard]] static Result<SealedMessage, ProtocolFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /// Tag mismatch yields AuthenticationFailure and no plaintext.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> auth_tag,
        std::span<const uint8_t> associated_data = {});

private:
    ChaCha20Poly1305() = delete;
};

}
