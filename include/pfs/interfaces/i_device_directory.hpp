#pragma once
#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"

#include <optional>
#include <string>

namespace pfs::protocol::interfaces {

/// Resolves a device id to the user that owns it. Backed by the account service in
/// production; InMemoryDeviceDirectory otherwise.
class IDeviceDirectory {
public:
    virtual ~IDeviceDirectory() = default;

    [[nodiscard]] virtual Result<std::optional<std::string>, ProtocolFailure>
    OwnerOf(const std::string& device_id) const = 0;
};

}
