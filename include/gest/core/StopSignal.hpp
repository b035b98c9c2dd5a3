#pragma once

#include <atomic>

namespace gest {
namespace core {

/**
 * Cooperative cancellation flag
 *
 * Loops check stop_requested() once per iteration and exit at the next
 * iteration boundary. request_stop() is async-signal-safe.
 */
class StopSignal {
public:
    StopSignal() = default;

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request_stop() noexcept { stopped_.store(true); }

    bool stop_requested() const noexcept { return stopped_.load(); }

    /// Re-arm for another run
    void reset() noexcept { stopped_.store(false); }

private:
    std::atomic<bool> stopped_{false};
};

} // namespace core
} // namespace gest
