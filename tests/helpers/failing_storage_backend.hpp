#pragma once

#include "pfs/interfaces/i_storage_backend.hpp"

namespace pfs::protocol::test_helpers {

/// Backend whose every call reports StorageUnavailable.
class FailingStorageBackend final : public interfaces::IStorageBackend {
public:
    Result<std::optional<proto::storage::StoredRatchetState>, ProtocolFailure>
    LoadState(const std::string&, const std::string&) override {
        return Fail(Unavailable());
    }

    Result<Unit, ProtocolFailure> SaveState(const proto::storage::StoredRatchetState&, uint64_t) override {
        return Fail(Unavailable());
    }

    Result<bool, ProtocolFailure> DeleteState(const std::string&, const std::string&) override {
        return Fail(Unavailable());
    }

    Result<std::vector<proto::storage::StoredRatchetState>, ProtocolFailure>
    ListStates(const std::string&) override {
        return Fail(Unavailable());
    }

    Result<Unit, ProtocolFailure> SaveSkippedKey(const proto::storage::StoredSkippedKey&) override {
        return Fail(Unavailable());
    }

    Result<std::optional<proto::storage::StoredSkippedKey>, ProtocolFailure>
    LoadSkippedKey(const std::string&, const std::string&) override {
        return Fail(Unavailable());
    }

    Result<std::vector<proto::storage::StoredSkippedKey>, ProtocolFailure>
    ListSkippedKeys(const std::string&) override {
        return Fail(Unavailable());
    }

    Result<bool, ProtocolFailure> DeleteSkippedKey(const std::string&, const std::string&) override {
        return Fail(Unavailable());
    }

    Result<size_t, ProtocolFailure> DeleteSkippedKeysExpiredAt(interfaces::TimePoint) override {
        return Fail(Unavailable());
    }

    Result<interfaces::BackendCounts, ProtocolFailure> Count(interfaces::TimePoint) override {
        return Fail(Unavailable());
    }

private:
    static ProtocolFailure Unavailable() {
        return ProtocolFailure::StorageUnavailable("backend offline");
    }
};

}
