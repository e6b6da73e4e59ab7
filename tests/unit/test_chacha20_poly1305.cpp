#include <catch2/catch_test_macros.hpp>
#include "pfs/crypto/chacha20_poly1305.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/core/constants.hpp"
using namespace pfs::protocol;
using namespace pfs::protocol::crypto;
TEST_CASE("ChaCha20-Poly1305 - Detached tag round trip", "[chacha20][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(kMessageKeyBytes, 0x10);
    std::vector<uint8_t> nonce(kAeadNonceBytes, 0x20);
    std::vector<uint8_t> plaintext = {'h', 'e', 'l', 'l', 'o'};
    std::vector<uint8_t> ad = {'h', 'd', 'r'};
    auto sealed = ChaCha20Poly1305::Encrypt(key, nonce, plaintext, ad);
    REQUIRE(sealed.IsOk());
    const auto& message = sealed.Unwrap();
    REQUIRE(message.ciphertext.size() == plaintext.size());
    REQUIRE(message.auth_tag.size() == kAeadTagBytes);

    SECTION("Opens with the same inputs") {
        auto opened = ChaCha20Poly1305::Decrypt(key, nonce, message.ciphertext, message.auth_tag, ad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Any flipped bit is an authentication failure") {
        auto ciphertext = message.ciphertext;
        ciphertext[2] ^= 0x80;
        auto result = ChaCha20Poly1305::Decrypt(key, nonce, ciphertext, message.auth_tag, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);

        auto tag = message.auth_tag;
        tag[0] ^= 0x01;
        REQUIRE(ChaCha20Poly1305::Decrypt(key, nonce, message.ciphertext, tag, ad).IsErr());

        std::vector<uint8_t> other_ad = {'x'};
        REQUIRE(ChaCha20Poly1305::Decrypt(key, nonce, message.ciphertext, message.auth_tag, other_ad).IsErr());
    }
    SECTION("Short tag is a validation error") {
        std::vector<uint8_t> short_tag(8, 0x00);
        auto result = ChaCha20Poly1305::Decrypt(key, nonce, message.ciphertext, short_tag, ad);
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::ValidationError);
    }
}
