#include "pfs/models/key_exchange.hpp"

namespace pfs::protocol::models {

std::string_view ToString(const ExchangeType type) noexcept {
    switch (type) {
        case ExchangeType::InitialSetup: return "initial_setup";
        case ExchangeType::RatchetUpdate: return "ratchet_update";
        case ExchangeType::PqcUpgrade: return "pqc_upgrade";
        case ExchangeType::DeviceAddition: return "device_addition";
    }
    return "unknown";
}

std::string_view ToString(const ExchangeStatus status) noexcept {
    switch (status) {
        case ExchangeStatus::Pending: return "pending";
        case ExchangeStatus::Responded: return "responded";
        case ExchangeStatus::Completed: return "completed";
        case ExchangeStatus::Expired: return "expired";
    }
    return "unknown";
}

std::optional<ExchangeType> ParseExchangeType(const std::string_view text) noexcept {
    for (const auto type : {ExchangeType::InitialSetup, ExchangeType::RatchetUpdate,
                            ExchangeType::PqcUpgrade, ExchangeType::DeviceAddition}) {
        if (ToString(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

}
