#include "pfs/coordination/cleanup_scheduler.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/debug/event_logger.hpp"

namespace pfs::protocol::coordination {
    using debug::Component;

    namespace {
        template<typename Target>
        void Sweep(const std::shared_ptr<Target>& target, const char* what, size_t& removed, bool& failed) {
            if (!target) {
                return;
            }
            auto swept = target->CleanupExpired();
            if (swept.IsOk()) {
                removed = swept.Unwrap();
            } else {
                failed = true;
                PFS_LOG_FAILURE(Component::Cleanup, what, swept.UnwrapErr());
            }
        }
    }

    CleanupScheduler::CleanupScheduler(CleanupTargets targets, const std::chrono::milliseconds interval)
        : targets_(std::move(targets))
        , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(kCleanupInterval)) {}

    CleanupScheduler::~CleanupScheduler() {
        Stop();
    }

    CleanupReport CleanupScheduler::RunOnce() {
        CleanupReport report;
        Sweep(targets_.store, "skipped key sweep", report.skipped_keys, report.store_failed);
        Sweep(targets_.exchanges, "exchange sweep", report.exchanges, report.coordination_failed);
        Sweep(targets_.sync, "sync package sweep", report.sync_packages, report.coordination_failed);
        Sweep(targets_.ledger, "negotiation sweep", report.negotiation_records, report.coordination_failed);
        Sweep(targets_.device_auth, "device auth sweep", report.auth_sessions, report.coordination_failed);
        Sweep(targets_.conflicts, "conflict sweep", report.conflicts, report.coordination_failed);
        PFS_LOG_EVENT(Component::Cleanup,
                      "sweep removed keys={} exchanges={} packages={} negotiations={} sessions={} conflicts={}",
                      report.skipped_keys, report.exchanges, report.sync_packages,
                      report.negotiation_records, report.auth_sessions, report.conflicts);
        return report;
    }

    void CleanupScheduler::Start() {
        std::lock_guard<std::mutex> guard(lock_);
        if (running_) {
            return;
        }
        stop_requested_ = false;
        running_ = true;
        worker_ = std::thread([this] { Loop(); });
    }

    void CleanupScheduler::Stop() {
        std::thread worker;
        {
            std::lock_guard<std::mutex> guard(lock_);
            if (!running_ || !worker_.joinable()) {
                return;
            }
            stop_requested_ = true;
            // Only the caller that takes the thread joins it.
            worker = std::move(worker_);
        }
        wake_.notify_all();
        worker.join();
        std::lock_guard<std::mutex> guard(lock_);
        running_ = false;
    }

    bool CleanupScheduler::IsRunning() const {
        std::lock_guard<std::mutex> guard(lock_);
        return running_;
    }

    size_t CleanupScheduler::CompletedRuns() const {
        std::lock_guard<std::mutex> guard(lock_);
        return completed_runs_;
    }

    void CleanupScheduler::Loop() {
        std::unique_lock<std::mutex> lock(lock_);
        while (!stop_requested_) {
            if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                break;
            }
            lock.unlock();
            RunOnce();
            lock.lock();
            completed_runs_ += 1;
        }
    }

}  // namespace pfs::protocol::coordination
