#pragma once

#include "pfs/interfaces/i_device_directory.hpp"

#include <map>
#include <mutex>
#include <string>

namespace pfs::protocol::coordination {

class InMemoryDeviceDirectory final : public interfaces::IDeviceDirectory {
public:
    /// Re-registering a device moves it to the new owner.
    void Register(const std::string& device_id, const std::string& owner_id);

    bool Remove(const std::string& device_id);

    [[nodiscard]] Result<std::optional<std::string>, ProtocolFailure>
    OwnerOf(const std::string& device_id) const override;

private:
    mutable std::mutex lock_;
    std::map<std::string, std::string> owners_;
};

}
