#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "gest/camera/CameraTypes.hpp"
#include "gest/camera/CaptureDevice.hpp"
#include "gest/core/types.hpp"

namespace gest {
namespace camera {

class CameraManager;

/**
 * Scoped exclusive ownership of the camera
 *
 * Only one lease exists at a time. Destroying the lease closes the device and
 * frees the camera for the next session (live recognition or recording).
 */
class CameraLease {
public:
    CameraLease(CameraLease&& other) noexcept;
    CameraLease& operator=(CameraLease&& other) noexcept;
    ~CameraLease();

    CameraLease(const CameraLease&) = delete;
    CameraLease& operator=(const CameraLease&) = delete;

    CameraManager& camera() { return *manager_; }

    const std::string& owner() const { return owner_; }

private:
    friend class CameraManager;
    CameraLease(CameraManager* manager, std::string owner);

    void release();

    CameraManager* manager_;
    std::string owner_;
};

/**
 * Capture device lifecycle with fault recovery
 *
 * State machine:
 *   CLOSED -> OPENING -> STREAMING -> RECOVERING -> STREAMING | DEVICE_LOST
 *
 * Recovery runs incrementally inside readFrame(): each call waits at most one
 * read-timeout slice of the current backoff, so a caller checking a stop
 * signal per iteration is never blocked for a whole backoff period.
 *
 * Thread-safety: all methods are safe to call concurrently; frames are meant
 * to be read from a single loop thread.
 */
class CameraManager {
public:
    struct Statistics {
        uint64_t frames_delivered = 0;
        uint64_t read_failures = 0;
        uint64_t recovery_attempts = 0;
        uint64_t recoveries = 0;
        int current_backoff_ms = 0;    ///< Wait before the next reopen attempt, 0 unless recovering
    };

    explicit CameraManager(CaptureDeviceFactory factory = OpenCVCaptureDevice::factory());
    ~CameraManager();

    CameraManager(const CameraManager&) = delete;
    CameraManager& operator=(const CameraManager&) = delete;

    /**
     * Set format and fault policy used by open() and recovery
     */
    void configure(const CameraConfig& config);

    CameraConfig getConfig() const;

    /**
     * Open the first candidate accepting the requested format
     * @return Identifier of the opened device, or NO_DEVICE_AVAILABLE
     */
    core::Result<std::string, CameraError> open(const std::vector<std::string>& deviceCandidates,
                                                int targetWidth, int targetHeight, double targetFps);

    /**
     * Open using the configured candidates and format
     */
    core::Result<std::string, CameraError> open();

    /**
     * Read next frame
     *
     * TRANSIENT_READ_FAILURE: retry allowed (also returned while recovering).
     * DEVICE_LOST: recovery exhausted, close() and open() to restart.
     */
    core::Result<Frame, CameraError> readFrame();

    /**
     * Release the device; the manager returns to CLOSED
     */
    void close();

    CameraState getState() const;

    std::string getActiveDevice() const;

    Statistics getStatistics() const;

    /**
     * Take exclusive ownership of the camera
     * @param owner Name used in logs and busy errors
     * @return Lease, or empty if another owner holds the camera
     */
    std::optional<CameraLease> tryAcquire(const std::string& owner);

    /**
     * Name of the current lease holder, empty if free
     */
    std::string getHolder() const;

private:
    friend class CameraLease;

    core::Result<std::string, CameraError> openCandidatesLocked();
    core::Result<Frame, CameraError> readStreamingLocked();
    core::Result<Frame, CameraError> stepRecoveryLocked();
    void enterRecoveryLocked();
    void closeLocked();
    void releaseLease();

    CaptureDeviceFactory factory_;
    CameraConfig config_;
    std::unique_ptr<CaptureDevice> device_;
    CameraState state_ = CameraState::CLOSED;
    std::string activeDevice_;

    int consecutiveFailures_ = 0;
    int recoveryAttempts_ = 0;
    int currentBackoffMs_ = 0;
    core::Timestamp nextAttemptAt_;
    uint64_t frameCounter_ = 0;
    Statistics stats_;

    mutable std::mutex mutex_;

    mutable std::mutex leaseMutex_;
    std::string holder_;
};

} // namespace camera
} // namespace gest
