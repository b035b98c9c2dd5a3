/**
 * @file ActionDispatcher.hpp
 * @brief Asynchronous mapping of gesture events to backend actions
 */

#ifndef GEST_ACTION_DISPATCHER_HPP
#define GEST_ACTION_DISPATCHER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "gest/action/ActionBackend.hpp"
#include "gest/action/ActionTypes.hpp"
#include "gest/core/BoundedQueue.hpp"
#include "gest/gesture/GestureTypes.hpp"

namespace gest {
namespace action {

enum class DispatchOutcome {
    QUEUED,      ///< Accepted for execution on the worker thread
    UNMAPPED,    ///< No action configured for the label
    DROPPED,     ///< Queue full or dispatcher not running
    THROTTLED    ///< Inside the action's cooldown
};

std::string dispatch_outcome_to_string(DispatchOutcome outcome);

struct DispatcherStats {
    uint64_t executed = 0;
    uint64_t failed = 0;
    uint64_t unmapped = 0;
    uint64_t dropped = 0;
    uint64_t throttled = 0;
};

/**
 * @brief Looks up each gesture event and runs the mapped action off the caller's thread
 *
 * dispatch() never blocks: the event goes to a bounded queue consumed by one
 * worker thread, so a slow backend cannot stall frame acquisition. Backend
 * failures are logged and counted, never propagated.
 */
class ActionDispatcher {
public:
    ActionDispatcher(ActionMapping mapping, std::shared_ptr<ActionBackend> backend,
                     size_t queue_capacity = 16);
    ~ActionDispatcher();

    ActionDispatcher(const ActionDispatcher&) = delete;
    ActionDispatcher& operator=(const ActionDispatcher&) = delete;

    /**
     * @brief Start the worker thread
     * @return false if already running
     */
    bool start();

    /**
     * @brief Stop the worker; events still queued are discarded
     */
    void stop();

    bool is_running() const { return running_; }

    DispatchOutcome dispatch(const gesture::GestureEvent& event);

    /**
     * @brief Wait until every queued action has been executed
     * @return false on timeout
     */
    bool wait_until_idle(int timeout_ms);

    DispatcherStats stats() const;

    const ActionMapping& mapping() const { return mapping_; }

private:
    struct Job {
        std::string label;
        ActionDescriptor descriptor;
    };

    void worker_loop();
    void finish_job();

    ActionMapping mapping_;
    std::shared_ptr<ActionBackend> backend_;
    core::BoundedQueue<Job> queue_;

    std::thread worker_;
    std::atomic<bool> running_{false};

    std::mutex cooldown_mutex_;
    std::map<std::string, core::Timestamp> last_run_;

    mutable std::mutex stats_mutex_;
    DispatcherStats stats_;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t pending_ = 0;
};

} // namespace action
} // namespace gest

#endif // GEST_ACTION_DISPATCHER_HPP
