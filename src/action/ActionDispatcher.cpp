/**
 * @file ActionDispatcher.cpp
 * @brief Event queue, cooldown and worker thread
 */

#include "gest/action/ActionDispatcher.hpp"
#include "gest/core/Logger.hpp"
#include "gest/core/exception.h"

#include <chrono>

namespace gest {
namespace action {

std::string dispatch_outcome_to_string(DispatchOutcome outcome) {
    switch (outcome) {
        case DispatchOutcome::QUEUED: return "Queued";
        case DispatchOutcome::UNMAPPED: return "Unmapped";
        case DispatchOutcome::DROPPED: return "Dropped";
        case DispatchOutcome::THROTTLED: return "Throttled";
        default: return "Invalid";
    }
}

ActionDispatcher::ActionDispatcher(ActionMapping mapping, std::shared_ptr<ActionBackend> backend,
                                   size_t queue_capacity)
    : mapping_(std::move(mapping))
    , backend_(std::move(backend))
    , queue_(queue_capacity) {
    if (!backend_) {
        GEST_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                        "ActionDispatcher requires a backend");
    }
    if (queue_capacity == 0) {
        GEST_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                        "ActionDispatcher queue capacity must be > 0");
    }
}

ActionDispatcher::~ActionDispatcher() {
    stop();
}

bool ActionDispatcher::start() {
    if (running_) {
        return false;
    }

    const size_t discarded = queue_.restart();
    if (discarded > 0) {
        LOG_WARNING("ActionDispatcher: discarded " + std::to_string(discarded) + " stale actions");
    }
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        pending_ = 0;
    }

    running_ = true;
    worker_ = std::thread(&ActionDispatcher::worker_loop, this);
    LOG_INFO("ActionDispatcher: started with backend '" + backend_->name() + "', " +
             std::to_string(mapping_.size()) + " mapped labels");
    return true;
}

void ActionDispatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    queue_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }

    const size_t discarded = queue_.size();
    if (discarded > 0) {
        LOG_WARNING("ActionDispatcher: " + std::to_string(discarded) + " queued actions not executed");
    }
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        pending_ = 0;
    }
    idle_cv_.notify_all();

    const DispatcherStats s = stats();
    LOG_INFO("ActionDispatcher: stopped (executed=" + std::to_string(s.executed) +
             ", failed=" + std::to_string(s.failed) + ", unmapped=" + std::to_string(s.unmapped) +
             ", dropped=" + std::to_string(s.dropped) + ", throttled=" + std::to_string(s.throttled) + ")");
}

DispatchOutcome ActionDispatcher::dispatch(const gesture::GestureEvent& event) {
    auto it = mapping_.find(event.label);
    if (it == mapping_.end()) {
        LOG_INFO("ActionDispatcher: no action mapped for '" + event.label + "'");
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.unmapped++;
        return DispatchOutcome::UNMAPPED;
    }

    const ActionDescriptor& descriptor = it->second;

    if (descriptor.cooldown_ms > 0) {
        std::lock_guard<std::mutex> lock(cooldown_mutex_);
        auto last = last_run_.find(event.label);
        if (last != last_run_.end() &&
            event.timestamp - last->second < std::chrono::milliseconds(descriptor.cooldown_ms)) {
            LOG_DEBUG("ActionDispatcher: '" + event.label + "' inside cooldown");
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.throttled++;
            return DispatchOutcome::THROTTLED;
        }
        last_run_[event.label] = event.timestamp;
    }

    if (running_) {
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            pending_++;
        }
        if (queue_.try_push(Job{event.label, descriptor})) {
            return DispatchOutcome::QUEUED;
        }
        finish_job();
    }

    LOG_WARNING("ActionDispatcher: dropped action for '" + event.label +
                (running_ ? "', queue full" : "', dispatcher not running"));
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.dropped++;
    return DispatchOutcome::DROPPED;
}

void ActionDispatcher::worker_loop() {
    while (running_) {
        Job job;
        if (!queue_.pop(job, 100)) {
            continue;
        }

        auto status = backend_->execute(job.descriptor);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            if (status) {
                stats_.executed++;
            } else {
                stats_.failed++;
            }
        }

        if (status) {
            LOG_DEBUG("ActionDispatcher: '" + job.label + "' -> " + job.descriptor.describe());
        } else {
            LOG_ERROR("ActionDispatcher: '" + job.label + "' failed [" +
                      action_error_to_string(*status.error) + "]: " + status.message);
        }

        finish_job();
    }
}

void ActionDispatcher::finish_job() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        if (pending_ > 0) {
            pending_--;
        }
    }
    idle_cv_.notify_all();
}

bool ActionDispatcher::wait_until_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return pending_ == 0; });
}

DispatcherStats ActionDispatcher::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace action
} // namespace gest
