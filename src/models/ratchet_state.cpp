#include "pfs/models/ratchet_state.hpp"
#include "pfs/crypto/sodium_interop.hpp"

namespace pfs::protocol::models {

namespace {
    void Wipe(std::vector<uint8_t>& bytes) noexcept {
        if (!bytes.empty()) {
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span(bytes));
            (void) _wipe;
        }
    }
}

void RatchetState::WipeSecrets() noexcept {
    Wipe(root_key);
    Wipe(sending_chain_key);
    Wipe(receiving_chain_key);
    Wipe(sending_ephemeral_private_key);
    Wipe(kyber_secret_key);
    for (auto& [id, skipped] : skipped_keys) {
        Wipe(skipped.key);
    }
}

}
