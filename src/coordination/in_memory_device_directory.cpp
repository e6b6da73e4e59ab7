#include "pfs/coordination/in_memory_device_directory.hpp"

namespace pfs::protocol::coordination {

    void InMemoryDeviceDirectory::Register(const std::string& device_id, const std::string& owner_id) {
        std::lock_guard<std::mutex> guard(lock_);
        owners_[device_id] = owner_id;
    }

    bool InMemoryDeviceDirectory::Remove(const std::string& device_id) {
        std::lock_guard<std::mutex> guard(lock_);
        return owners_.erase(device_id) > 0;
    }

    Result<std::optional<std::string>, ProtocolFailure> InMemoryDeviceDirectory::OwnerOf(
        const std::string& device_id) const {
        std::lock_guard<std::mutex> guard(lock_);
        const auto it = owners_.find(device_id);
        if (it == owners_.end()) {
            return Result<std::optional<std::string>, ProtocolFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<std::string>, ProtocolFailure>::Ok(it->second);
    }

}  // namespace pfs::protocol::coordination
