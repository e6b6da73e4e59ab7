#pragma once
#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace pfs::protocol::crypto {

/**
 * AES-256-GCM (OpenSSL EVP) used for ratchet state at rest.
 *
 * Output of Encrypt is ciphertext || 16-byte tag. The caller supplies a fresh random
 * 12-byte nonce per call; KeyMaterialStore draws one per encrypted field.
 * A tag mismatch in Decrypt is reported as AuthenticationFailure.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

private:
    AesGcm() = delete;
};

}
