#include "pfs/protocol/ratchet_session.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/chacha20_poly1305.hpp"
#include "pfs/crypto/hkdf.hpp"
#include "pfs/crypto/kyber_interop.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/debug/event_logger.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace pfs::protocol {
    using crypto::ChaCha20Poly1305;
    using crypto::Hkdf;
    using crypto::KyberInterop;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using debug::Component;
    using models::RatchetState;
    using models::SkippedMessageKey;

    namespace {
        void AppendUint32LE(std::vector<uint8_t>& out, uint32_t value) {
            out.push_back(static_cast<uint8_t>(value & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        }

        void AppendField(std::vector<uint8_t>& out, std::span<const uint8_t> field) {
            AppendUint32LE(out, static_cast<uint32_t>(field.size()));
            out.insert(out.end(), field.begin(), field.end());
        }

        void AppendField(std::vector<uint8_t>& out, std::string_view field) {
            AppendUint32LE(out, static_cast<uint32_t>(field.size()));
            out.insert(out.end(), field.begin(), field.end());
        }

        std::span<const uint8_t> AsBytes(const std::string& value) {
            return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
        }

        void Wipe(std::vector<uint8_t>& bytes) {
            auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
            (void) _wipe;
        }

        std::string_view AlgorithmFor(const RatchetState& state) {
            return state.IsHybrid() ? kHybridAlgorithm : kClassicalAlgorithm;
        }

        uint32_t SecurityLevelFor(const RatchetState& state) {
            return state.IsHybrid() ? kHybridSecurityLevel : kClassicalSecurityLevel;
        }

        /// Everything the AEAD tag covers besides the ciphertext itself. Every variable-length
        /// field is length-prefixed so two different headers never serialize to the same bytes.
        std::vector<uint8_t> BuildEnvelopeAad(
            const std::string& conversation_id,
            const proto::wire::RatchetEnvelope& envelope,
            std::span<const uint8_t> associated_data) {
            std::vector<uint8_t> ad;
            ad.reserve(128 + envelope.pqc_ciphertext().size() + associated_data.size());
            AppendField(ad, kEnvelopeAdLabel);
            AppendUint32LE(ad, kProtocolVersion);
            AppendField(ad, std::string_view(conversation_id));
            AppendField(ad, AsBytes(envelope.ephemeral_public_key()));
            AppendUint32LE(ad, envelope.message_number());
            AppendUint32LE(ad, envelope.chain_length());
            AppendUint32LE(ad, envelope.previous_chain_length());
            AppendField(ad, std::string_view(envelope.key_id()));
            AppendField(ad, std::string_view(envelope.algorithm()));
            AppendUint32LE(ad, envelope.security_level());
            AppendField(ad, AsBytes(envelope.pqc_ciphertext()));
            AppendField(ad, associated_data);
            return ad;
        }

        Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>
        DeriveMessageAndChainKey(std::span<const uint8_t> chain_key) {
            using KeysResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>;
            if (chain_key.size() != kChainKeyBytes) {
                return KeysResult::Err(ProtocolFailure::InvalidState("Chain key missing"));
            }
            auto message_key_result = Hkdf::DeriveKeyBytes(chain_key, kMessageKeyBytes, {}, kMessageInfo);
            if (message_key_result.IsErr()) {
                return KeysResult::Err(message_key_result.UnwrapErr());
            }
            auto next_chain_key_result = Hkdf::DeriveKeyBytes(chain_key, kChainKeyBytes, {}, kChainInfo);
            if (next_chain_key_result.IsErr()) {
                auto message_key = std::move(message_key_result).Unwrap();
                Wipe(message_key);
                return KeysResult::Err(next_chain_key_result.UnwrapErr());
            }
            return KeysResult::Ok(std::make_pair(
                std::move(message_key_result).Unwrap(),
                std::move(next_chain_key_result).Unwrap()));
        }

        /// KDF_RK: (root, dh [|| kyber]) -> (root', chain').
        Result<Unit, ProtocolFailure> RatchetRoot(
            RatchetState& state,
            std::vector<uint8_t>& dh_secret,
            std::vector<uint8_t>& kyber_secret,
            std::vector<uint8_t>& chain_out) {
            std::vector<uint8_t> ikm;
            ikm.reserve(dh_secret.size() + kyber_secret.size());
            ikm.insert(ikm.end(), dh_secret.begin(), dh_secret.end());
            ikm.insert(ikm.end(), kyber_secret.begin(), kyber_secret.end());
            const auto info = kyber_secret.empty() ? kDhRatchetInfo : kHybridRatchetInfo;

            auto ratchet_result = Hkdf::DeriveKeyBytes(ikm, kRootKeyBytes + kChainKeyBytes, state.root_key, info);
            Wipe(ikm);
            Wipe(dh_secret);
            Wipe(kyber_secret);
            if (ratchet_result.IsErr()) {
                return Fail(ratchet_result.UnwrapErr());
            }
            auto ratchet_out = std::move(ratchet_result).Unwrap();
            Wipe(state.root_key);
            state.root_key.assign(ratchet_out.begin(), ratchet_out.begin() + kRootKeyBytes);
            chain_out.assign(ratchet_out.begin() + kRootKeyBytes, ratchet_out.end());
            Wipe(ratchet_out);
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> SendingDhStep(RatchetState& state) {
            if (state.receiving_ephemeral_public_key.size() != kX25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidState("Peer ratchet key missing"));
            }
            auto keypair_result = SodiumInterop::GenerateX25519KeyPair("ratchet-send");
            if (keypair_result.IsErr()) {
                return Fail(keypair_result.UnwrapErr());
            }
            auto [private_handle, public_key] = std::move(keypair_result).Unwrap();
            auto private_result = private_handle.ReadBytes(kX25519PrivateKeyBytes);
            if (private_result.IsErr()) {
                return Fail(ProtocolFailure::FromSodiumFailure(private_result.UnwrapErr()));
            }
            auto private_key = std::move(private_result).Unwrap();

            auto dh_result = SodiumInterop::ComputeSharedSecret(private_key, state.receiving_ephemeral_public_key);
            if (dh_result.IsErr()) {
                Wipe(private_key);
                return Fail(dh_result.UnwrapErr());
            }
            auto dh_secret = std::move(dh_result).Unwrap();

            std::vector<uint8_t> kyber_secret;
            std::vector<uint8_t> kyber_ciphertext;
            if (state.IsHybrid()) {
                auto encap_result = KyberInterop::Encapsulate(state.peer_kyber_public_key);
                if (encap_result.IsErr()) {
                    Wipe(private_key);
                    Wipe(dh_secret);
                    return Fail(ProtocolFailure::FromSodiumFailure(encap_result.UnwrapErr()));
                }
                auto [ciphertext, ss_handle] = std::move(encap_result).Unwrap();
                auto ss_result = ss_handle.ReadBytes(kKyberSharedSecretBytes);
                if (ss_result.IsErr()) {
                    Wipe(private_key);
                    Wipe(dh_secret);
                    return Fail(ProtocolFailure::FromSodiumFailure(ss_result.UnwrapErr()));
                }
                kyber_secret = std::move(ss_result).Unwrap();
                kyber_ciphertext = std::move(ciphertext);
            }

            std::vector<uint8_t> new_chain;
            if (auto root = RatchetRoot(state, dh_secret, kyber_secret, new_chain); root.IsErr()) {
                Wipe(private_key);
                return root;
            }

            Wipe(state.sending_chain_key);
            Wipe(state.sending_ephemeral_private_key);
            state.sending_chain_key = std::move(new_chain);
            state.sending_ephemeral_private_key = std::move(private_key);
            state.sending_ephemeral_public_key = std::move(public_key);
            state.sending_pqc_ciphertext = std::move(kyber_ciphertext);
            state.previous_sending_count = state.sending_message_number;
            state.sending_message_number = 0;
            state.sending_chain_length += 1;
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> ReceivingDhStep(
            RatchetState& state,
            const proto::wire::RatchetEnvelope& envelope) {
            if (state.sending_ephemeral_private_key.size() != kX25519PrivateKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidState("Own ratchet key missing"));
            }
            const auto peer_public = AsBytes(envelope.ephemeral_public_key());
            auto dh_result = SodiumInterop::ComputeSharedSecret(state.sending_ephemeral_private_key, peer_public);
            if (dh_result.IsErr()) {
                return Fail(dh_result.UnwrapErr());
            }
            auto dh_secret = std::move(dh_result).Unwrap();

            std::vector<uint8_t> kyber_secret;
            if (state.IsHybrid()) {
                if (!envelope.has_pqc_ciphertext() ||
                    envelope.pqc_ciphertext().size() != kKyberCiphertextBytes) {
                    Wipe(dh_secret);
                    return Result<Unit, ProtocolFailure>::Err(
                        ProtocolFailure::ValidationError("Hybrid ratchet step without a Kyber-768 ciphertext"));
                }
                auto sk_result = SecureMemoryHandle::FromBytes(state.kyber_secret_key);
                if (sk_result.IsErr()) {
                    Wipe(dh_secret);
                    return Fail(ProtocolFailure::FromSodiumFailure(sk_result.UnwrapErr()));
                }
                auto decap_result = KyberInterop::Decapsulate(AsBytes(envelope.pqc_ciphertext()), sk_result.Unwrap());
                if (decap_result.IsErr()) {
                    Wipe(dh_secret);
                    return Fail(ProtocolFailure::FromSodiumFailure(decap_result.UnwrapErr()));
                }
                auto ss_result = decap_result.Unwrap().ReadBytes(kKyberSharedSecretBytes);
                if (ss_result.IsErr()) {
                    Wipe(dh_secret);
                    return Fail(ProtocolFailure::FromSodiumFailure(ss_result.UnwrapErr()));
                }
                kyber_secret = std::move(ss_result).Unwrap();
            }

            std::vector<uint8_t> new_chain;
            PFS_TRY(RatchetRoot(state, dh_secret, kyber_secret, new_chain));

            Wipe(state.receiving_chain_key);
            state.receiving_chain_key = std::move(new_chain);
            state.receiving_ephemeral_public_key.assign(peer_public.begin(), peer_public.end());
            state.receiving_message_number = 0;
            state.receiving_chain_length += 1;
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        /// Derives and retains the receiving-chain keys up to (not including) `until`.
        Result<Unit, ProtocolFailure> SkipMessageKeys(
            RatchetState& state,
            const uint32_t until,
            const configuration::RatchetConfig& config,
            const interfaces::TimePoint now) {
            if (!state.HasReceivingChain() || until <= state.receiving_message_number) {
                return Result<Unit, ProtocolFailure>::Ok(unit);
            }
            const uint64_t gap = static_cast<uint64_t>(until) - state.receiving_message_number;
            if (!config.AllowsGap(gap)) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::SkipWindowExceeded(
                        compat::format("Message is {} keys ahead of the receiving chain (limit {})",
                                       gap, config.MaxSkip())));
            }
            while (state.receiving_message_number < until) {
                auto derived_result = DeriveMessageAndChainKey(state.receiving_chain_key);
                if (derived_result.IsErr()) {
                    return Fail(derived_result.UnwrapErr());
                }
                auto [message_key, next_chain_key] = std::move(derived_result).Unwrap();
                SkippedMessageKey skipped;
                skipped.message_key_id = RatchetSession::SkippedKeyId(
                    state.receiving_ephemeral_public_key, state.receiving_message_number);
                skipped.key = std::move(message_key);
                skipped.chain_length = state.receiving_chain_length;
                skipped.message_number = state.receiving_message_number;
                skipped.sequence = ++state.skipped_key_sequence;
                skipped.created_at = now;
                skipped.expires_at = now + config.SkippedKeyTtl();
                state.skipped_keys[skipped.message_key_id] = std::move(skipped);

                Wipe(state.receiving_chain_key);
                state.receiving_chain_key = std::move(next_chain_key);
                state.receiving_message_number += 1;
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        void EvictOldestSkippedKeys(RatchetState& state, const size_t limit) {
            if (state.skipped_keys.size() <= limit) {
                return;
            }
            const size_t excess = state.skipped_keys.size() - limit;
            std::vector<decltype(state.skipped_keys)::iterator> by_age;
            by_age.reserve(state.skipped_keys.size());
            for (auto it = state.skipped_keys.begin(); it != state.skipped_keys.end(); ++it) {
                by_age.push_back(it);
            }
            std::nth_element(by_age.begin(), by_age.begin() + static_cast<std::ptrdiff_t>(excess - 1), by_age.end(),
                             [](const auto& a, const auto& b) { return a->second.sequence < b->second.sequence; });
            for (size_t i = 0; i < excess; ++i) {
                Wipe(by_age[i]->second.key);
                state.skipped_keys.erase(by_age[i]);
            }
        }

        SkippedKeyChanges DiffSkippedKeys(const RatchetState& before, const RatchetState& after) {
            SkippedKeyChanges changes;
            for (const auto& [id, key] : after.skipped_keys) {
                if (!before.skipped_keys.contains(id)) {
                    changes.added.push_back(key);
                }
            }
            for (const auto& [id, key] : before.skipped_keys) {
                if (!after.skipped_keys.contains(id)) {
                    changes.removed.push_back(id);
                }
            }
            return changes;
        }

        Result<Unit, ProtocolFailure> ValidateEnvelope(const proto::wire::RatchetEnvelope& envelope) {
            if (envelope.ephemeral_public_key().size() != kX25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::ValidationError("Invalid ephemeral public key size"));
            }
            if (envelope.nonce().size() != kAeadNonceBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::ValidationError("Invalid nonce size"));
            }
            if (envelope.auth_tag().size() != kAeadTagBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::ValidationError("Invalid authentication tag size"));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    Result<RatchetState, ProtocolFailure> RatchetSession::Bootstrap(
        const std::string& conversation_id,
        const std::string& user_id,
        std::span<const uint8_t> shared_secret,
        const bool is_initiator,
        const std::optional<HybridKeys>& hybrid,
        const interfaces::TimePoint now) {
        if (shared_secret.size() != kSharedSecretBytes) {
            return Result<RatchetState, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(
                    compat::format("Shared secret must be {} bytes, got {}",
                                   kSharedSecretBytes, shared_secret.size())));
        }
        if (conversation_id.empty() || user_id.empty()) {
            return Result<RatchetState, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError("Conversation id and user id are required"));
        }

        RatchetState state;
        state.conversation_id = conversation_id;
        state.user_id = user_id;
        state.is_initiator = is_initiator;
        state.created_at = now;
        state.updated_at = now;

        if (hybrid) {
            if (hybrid->kyber_secret_key.size() != kKyberSecretKeyBytes ||
                hybrid->kyber_public_key.size() != kKyberPublicKeyBytes) {
                return Result<RatchetState, ProtocolFailure>::Err(
                    ProtocolFailure::ValidationError("Invalid Kyber-768 key pair sizes"));
            }
            if (auto check = KyberInterop::ValidatePublicKey(hybrid->peer_kyber_public_key); check.IsErr()) {
                return Result<RatchetState, ProtocolFailure>::Err(
                    ProtocolFailure::ValidationError(check.UnwrapErr().message));
            }
            state.suite = models::CipherSuite::Hybrid;
            state.kyber_secret_key = hybrid->kyber_secret_key;
            state.kyber_public_key = hybrid->kyber_public_key;
            state.peer_kyber_public_key = hybrid->peer_kyber_public_key;
        }

        const std::vector<uint8_t> salt(conversation_id.begin(), conversation_id.end());
        auto init_result = Hkdf::DeriveKeyBytes(
            shared_secret, kRootKeyBytes + kX25519PrivateKeyBytes + kChainKeyBytes, salt, kRatchetInitInfo);
        if (init_result.IsErr()) {
            return Fail(init_result.UnwrapErr());
        }
        auto init = std::move(init_result).Unwrap();
        const auto root_end = init.begin() + kRootKeyBytes;
        const auto seed_end = root_end + kX25519PrivateKeyBytes;
        state.root_key.assign(init.begin(), root_end);
        std::vector<uint8_t> bootstrap_private(root_end, seed_end);
        std::vector<uint8_t> responder_chain(seed_end, init.end());
        Wipe(init);

        auto bootstrap_public_result = SodiumInterop::DeriveX25519PublicKey(bootstrap_private);
        if (bootstrap_public_result.IsErr()) {
            Wipe(bootstrap_private);
            Wipe(responder_chain);
            state.WipeSecrets();
            return Fail(bootstrap_public_result.UnwrapErr());
        }
        auto bootstrap_public = std::move(bootstrap_public_result).Unwrap();

        if (!is_initiator) {
            state.sending_ephemeral_private_key = std::move(bootstrap_private);
            state.sending_ephemeral_public_key = std::move(bootstrap_public);
            state.sending_chain_key = std::move(responder_chain);
            return Result<RatchetState, ProtocolFailure>::Ok(std::move(state));
        }

        Wipe(bootstrap_private);
        state.receiving_ephemeral_public_key = std::move(bootstrap_public);
        state.receiving_chain_key = std::move(responder_chain);
        if (auto step = SendingDhStep(state); step.IsErr()) {
            state.WipeSecrets();
            return Fail(step.UnwrapErr());
        }
        return Result<RatchetState, ProtocolFailure>::Ok(std::move(state));
    }

    RatchetSession::RatchetSession(models::RatchetState state, configuration::RatchetConfig config)
        : state_(std::move(state))
        , config_(config) {}

    RatchetSession::~RatchetSession() {
        state_.WipeSecrets();
    }

    std::string RatchetSession::SkippedKeyId(
        std::span<const uint8_t> ephemeral_public_key,
        const uint32_t message_number) {
        return compat::format("{}:{}", SodiumInterop::ToHex(ephemeral_public_key), message_number);
    }

    Result<proto::wire::RatchetEnvelope, ProtocolFailure> RatchetSession::Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data,
        const interfaces::TimePoint now) {
        using EnvelopeResult = Result<proto::wire::RatchetEnvelope, ProtocolFailure>;
        if (!state_.HasSendingChain() || state_.sending_ephemeral_public_key.empty()) {
            return EnvelopeResult::Err(
                ProtocolFailure::RatchetNotInitialized("No sending chain for this session"));
        }
        if (state_.sending_message_number == std::numeric_limits<uint32_t>::max()) {
            return EnvelopeResult::Err(
                ProtocolFailure::InvalidState("Sending chain exhausted"));
        }

        RatchetState next = state_;
        auto derived_result = DeriveMessageAndChainKey(next.sending_chain_key);
        if (derived_result.IsErr()) {
            next.WipeSecrets();
            return EnvelopeResult::Err(derived_result.UnwrapErr());
        }
        auto [message_key, next_chain_key] = std::move(derived_result).Unwrap();
        const uint32_t message_number = next.sending_message_number;
        Wipe(next.sending_chain_key);
        next.sending_chain_key = std::move(next_chain_key);
        next.sending_message_number += 1;
        next.updated_at = now;

        proto::wire::RatchetEnvelope envelope;
        const auto nonce = SodiumInterop::GetRandomBytes(kAeadNonceBytes);
        envelope.set_nonce(nonce.data(), nonce.size());
        envelope.set_ephemeral_public_key(
            next.sending_ephemeral_public_key.data(), next.sending_ephemeral_public_key.size());
        envelope.set_message_number(message_number);
        envelope.set_chain_length(next.sending_chain_length);
        envelope.set_previous_chain_length(next.previous_sending_count);
        envelope.set_key_id(compat::format("{}-{}", next.sending_chain_length, message_number));
        envelope.set_algorithm(std::string(AlgorithmFor(next)));
        envelope.set_security_level(SecurityLevelFor(next));
        if (!next.sending_pqc_ciphertext.empty()) {
            envelope.set_pqc_ciphertext(
                next.sending_pqc_ciphertext.data(), next.sending_pqc_ciphertext.size());
        }

        const auto ad = BuildEnvelopeAad(next.conversation_id, envelope, associated_data);
        auto sealed_result = ChaCha20Poly1305::Encrypt(message_key, nonce, plaintext, ad);
        Wipe(message_key);
        if (sealed_result.IsErr()) {
            next.WipeSecrets();
            return EnvelopeResult::Err(sealed_result.UnwrapErr());
        }
        auto sealed = std::move(sealed_result).Unwrap();
        envelope.set_ciphertext(sealed.ciphertext.data(), sealed.ciphertext.size());
        envelope.set_auth_tag(sealed.auth_tag.data(), sealed.auth_tag.size());

        state_.WipeSecrets();
        state_ = std::move(next);
        PFS_LOG_EVENT(Component::Ratchet, "encrypt conversation={} chain={} message={}",
                      state_.conversation_id, envelope.chain_length(), message_number);
        return EnvelopeResult::Ok(std::move(envelope));
    }

    Result<DecryptOutcome, ProtocolFailure> RatchetSession::Decrypt(
        const proto::wire::RatchetEnvelope& envelope,
        std::span<const uint8_t> associated_data,
        const interfaces::TimePoint now) {
        PFS_TRY(ValidateEnvelope(envelope));

        RatchetState next = state_;
        const auto ephemeral = AsBytes(envelope.ephemeral_public_key());
        const uint32_t message_number = envelope.message_number();
        std::vector<uint8_t> message_key;

        const auto retained = next.skipped_keys.find(SkippedKeyId(ephemeral, message_number));
        if (retained != next.skipped_keys.end()) {
            message_key = std::move(retained->second.key);
            next.skipped_keys.erase(retained);
        } else {
            const bool new_chain = !std::equal(
                ephemeral.begin(), ephemeral.end(),
                next.receiving_ephemeral_public_key.begin(), next.receiving_ephemeral_public_key.end());
            if (new_chain) {
                auto step = SkipMessageKeys(next, envelope.previous_chain_length(), config_, now);
                if (step.IsOk()) {
                    step = ReceivingDhStep(next, envelope);
                }
                if (step.IsOk()) {
                    step = SendingDhStep(next);
                }
                if (step.IsErr()) {
                    next.WipeSecrets();
                    return Fail(step.UnwrapErr());
                }
            } else if (message_number < next.receiving_message_number) {
                next.WipeSecrets();
                return Result<DecryptOutcome, ProtocolFailure>::Err(
                    ProtocolFailure::SkipWindowExceeded("Message key no longer retained"));
            }

            if (auto skip = SkipMessageKeys(next, message_number, config_, now); skip.IsErr()) {
                next.WipeSecrets();
                return Fail(skip.UnwrapErr());
            }
            auto derived_result = DeriveMessageAndChainKey(next.receiving_chain_key);
            if (derived_result.IsErr()) {
                next.WipeSecrets();
                return Fail(derived_result.UnwrapErr());
            }
            auto [derived_key, next_chain_key] = std::move(derived_result).Unwrap();
            message_key = std::move(derived_key);
            Wipe(next.receiving_chain_key);
            next.receiving_chain_key = std::move(next_chain_key);
            next.receiving_message_number = message_number + 1;
        }

        const auto ad = BuildEnvelopeAad(next.conversation_id, envelope, associated_data);
        auto plaintext_result = ChaCha20Poly1305::Decrypt(
            message_key,
            AsBytes(envelope.nonce()),
            AsBytes(envelope.ciphertext()),
            AsBytes(envelope.auth_tag()),
            ad);
        Wipe(message_key);
        if (plaintext_result.IsErr()) {
            next.WipeSecrets();
            PFS_LOG_FAILURE(Component::Ratchet, "decrypt", plaintext_result.UnwrapErr());
            return Fail(plaintext_result.UnwrapErr());
        }

        EvictOldestSkippedKeys(next, config_.MaxSkippedKeys());
        next.updated_at = now;

        DecryptOutcome outcome;
        outcome.plaintext = std::move(plaintext_result).Unwrap();
        outcome.changes = DiffSkippedKeys(state_, next);
        state_.WipeSecrets();
        state_ = std::move(next);
        PFS_LOG_EVENT(Component::Ratchet, "decrypt conversation={} chain={} message={} retained={}",
                      state_.conversation_id, envelope.chain_length(), message_number,
                      state_.skipped_keys.size());
        return Result<DecryptOutcome, ProtocolFailure>::Ok(std::move(outcome));
    }

}  // namespace pfs::protocol
