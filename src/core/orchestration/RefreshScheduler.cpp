#include "core/orchestration/RefreshScheduler.h"

#include <stdexcept>

#include <boost/asio/post.hpp>

#include "common/Logger.h"

namespace orderguard {
namespace core {

RefreshScheduler::RefreshScheduler(std::size_t workers)
    : pool_(workers == 0 ? 1 : workers) {}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::addJob(const std::string& name, Duration interval, Job job) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("refresh interval must be positive: " + name);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || stopped_) {
        throw std::logic_error("cannot add refresh job after start: " + name);
    }
    auto entry = std::make_unique<JobEntry>();
    entry->name = name;
    entry->interval = interval;
    entry->job = std::move(job);
    entry->timer.emplace(io_);
    jobs_[name] = std::move(entry);
}

void RefreshScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || stopped_) {
        return;
    }
    work_guard_.emplace(boost::asio::make_work_guard(io_));
    for (auto& kv : jobs_) {
        schedule(*kv.second);
    }
    running_ = true;
    io_thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Refresh scheduler stopped: {}", e.what());
        }
    });
    LOG_INFO("Refresh scheduler started ({} jobs)", jobs_.size());
}

void RefreshScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        running_ = false;
    }

    work_guard_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    pool_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : jobs_) {
        if (kv.second->timer) {
            kv.second->timer->cancel();
        }
    }
}

void RefreshScheduler::schedule(JobEntry& entry) {
    entry.timer->expires_after(entry.interval);
    entry.timer->async_wait([this, &entry](const boost::system::error_code& ec) {
        if (ec || stopped_) {
            return;
        }
        dispatch(entry);
        schedule(entry);
    });
}

bool RefreshScheduler::dispatch(JobEntry& entry) {
    bool expected = false;
    if (!entry.in_flight.compare_exchange_strong(expected, true)) {
        ++entry.skipped;
        LOG_DEBUG("Refresh {} still in flight, tick skipped", entry.name);
        return false;
    }

    boost::asio::post(pool_, [&entry]() {
        try {
            entry.job();
        } catch (const std::exception& e) {
            LOG_WARN("Refresh {} failed: {}", entry.name, e.what());
        }
        entry.in_flight.store(false);
        ++entry.runs;
    });
    return true;
}

RefreshScheduler::JobEntry* RefreshScheduler::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(name);
    return it == jobs_.end() ? nullptr : it->second.get();
}

bool RefreshScheduler::runNow(const std::string& name) {
    if (stopped_) {
        return false;
    }
    JobEntry* entry = find(name);
    if (!entry) {
        throw std::invalid_argument("unknown refresh job: " + name);
    }
    return dispatch(*entry);
}

bool RefreshScheduler::post(Job task) {
    if (stopped_ || !running_) {
        return false;
    }
    boost::asio::post(pool_, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_WARN("Background task failed: {}", e.what());
        }
    });
    return true;
}

std::uint64_t RefreshScheduler::runCount(const std::string& name) const {
    const JobEntry* entry = find(name);
    return entry ? entry->runs.load() : 0;
}

std::uint64_t RefreshScheduler::skippedCount(const std::string& name) const {
    const JobEntry* entry = find(name);
    return entry ? entry->skipped.load() : 0;
}

} // namespace core
} // namespace orderguard
