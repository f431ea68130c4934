#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "common/Types.h"

namespace orderguard {
namespace core {

// Periodic jobs on steady timers. Timers live on one io thread, job bodies run
// on a small worker pool. At most one run per job is in flight; a tick that
// finds the previous run still going is skipped, not queued.
class RefreshScheduler {
public:
    using Job = std::function<void()>;

    explicit RefreshScheduler(std::size_t workers = 2);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    // Jobs must be added before start().
    void addJob(const std::string& name, Duration interval, Job job);

    void start();

    // Cancels timers and waits for running jobs. Not restartable.
    void stop();

    bool isRunning() const { return running_.load(); }

    // Dispatch one run of `name` right now. False if it was already in flight.
    bool runNow(const std::string& name);

    // Run an arbitrary task on the worker pool. False once stopped.
    bool post(Job task);

    std::uint64_t runCount(const std::string& name) const;
    std::uint64_t skippedCount(const std::string& name) const;

private:
    struct JobEntry {
        std::string name;
        Duration interval;
        Job job;
        std::optional<boost::asio::steady_timer> timer;
        std::atomic<bool> in_flight{false};
        std::atomic<std::uint64_t> runs{0};
        std::atomic<std::uint64_t> skipped{0};
    };

    void schedule(JobEntry& entry);
    bool dispatch(JobEntry& entry);
    JobEntry* find(const std::string& name) const;

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    boost::asio::thread_pool pool_;
    std::thread io_thread_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<JobEntry>> jobs_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace core
} // namespace orderguard
