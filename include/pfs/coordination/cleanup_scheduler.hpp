#pragma once

#include "pfs/coordination/algorithm_negotiation_ledger.hpp"
#include "pfs/coordination/device_authentication_coordinator.hpp"
#include "pfs/coordination/key_conflict_coordinator.hpp"
#include "pfs/coordination/key_exchange_coordinator.hpp"
#include "pfs/coordination/multi_device_sync_coordinator.hpp"
#include "pfs/storage/key_material_store.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace pfs::protocol::coordination {

/// Everything one sweep visits. Any member may be null.
struct CleanupTargets {
    std::shared_ptr<storage::KeyMaterialStore> store;
    std::shared_ptr<KeyExchangeCoordinator> exchanges;
    std::shared_ptr<MultiDeviceSyncCoordinator> sync;
    std::shared_ptr<AlgorithmNegotiationLedger> ledger;
    std::shared_ptr<DeviceAuthenticationCoordinator> device_auth;
    std::shared_ptr<KeyConflictCoordinator> conflicts;
};

struct CleanupReport {
    size_t skipped_keys = 0;
    size_t exchanges = 0;
    size_t sync_packages = 0;
    size_t negotiation_records = 0;
    size_t auth_sessions = 0;
    size_t conflicts = 0;
    bool store_failed = false;
    /// A relay sweep hit a store failure; the other sweeps still ran.
    bool coordination_failed = false;
};

/**
 * @brief Periodic expiry and retention sweep over the key store and the relay coordinators.
 *
 * Either call RunOnce from an existing service loop, or Start a background thread that sweeps
 * every `interval`.
 */
class CleanupScheduler {
public:
    CleanupScheduler(CleanupTargets targets, std::chrono::milliseconds interval);

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    ~CleanupScheduler();

    CleanupReport RunOnce();

    /// No-op when already running.
    void Start();

    /// Wakes the worker and joins it. Safe to call twice.
    void Stop();

    [[nodiscard]] bool IsRunning() const;

    /// Sweeps completed by the background thread.
    [[nodiscard]] size_t CompletedRuns() const;

private:
    void Loop();

    CleanupTargets targets_;
    std::chrono::milliseconds interval_;

    mutable std::mutex lock_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    bool running_ = false;
    size_t completed_runs_ = 0;
    std::thread worker_;
};

}
