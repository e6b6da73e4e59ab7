#pragma once

#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace pfs::protocol::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 over OpenSSL's EVP_KDF.
 *
 * Every ratchet key (root, chain, message) and the initial split of the shared secret
 * comes out of DeriveKeyBytes with a distinct info label.
 */
class Hkdf {
public:
    /**
     * @brief Extract-then-expand into `output`.
     *
     * @param ikm Input key material, must be non-empty
     * @param output Destination, at most MAX_OUTPUT_LEN bytes
     * @param salt Optional salt
     * @param info Optional context label
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view info);

    /// HKDF-Extract only; returns the 32-byte PRK.
    static Result<std::vector<uint8_t>, ProtocolFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /// HKDF-Expand only; `prk` must be HASH_LEN bytes.
    static Result<Unit, ProtocolFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
