#include "gest/camera/CameraManager.hpp"
#include "gest/core/Logger.hpp"

#include <algorithm>
#include <thread>

namespace gest {
namespace camera {

// ============================================================================
// CameraLease
// ============================================================================

CameraLease::CameraLease(CameraManager* manager, std::string owner)
    : manager_(manager), owner_(std::move(owner)) {
}

CameraLease::CameraLease(CameraLease&& other) noexcept
    : manager_(other.manager_), owner_(std::move(other.owner_)) {
    other.manager_ = nullptr;
}

CameraLease& CameraLease::operator=(CameraLease&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        owner_ = std::move(other.owner_);
        other.manager_ = nullptr;
    }
    return *this;
}

CameraLease::~CameraLease() {
    release();
}

void CameraLease::release() {
    if (manager_ != nullptr) {
        manager_->releaseLease();
        manager_ = nullptr;
    }
}

// ============================================================================
// CameraManager
// ============================================================================

CameraManager::CameraManager(CaptureDeviceFactory factory)
    : factory_(std::move(factory)) {
}

CameraManager::~CameraManager() {
    close();
}

void CameraManager::configure(const CameraConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

CameraConfig CameraManager::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

core::Result<std::string, CameraError> CameraManager::open(
    const std::vector<std::string>& deviceCandidates,
    int targetWidth, int targetHeight, double targetFps) {

    std::lock_guard<std::mutex> lock(mutex_);

    config_.devices = deviceCandidates;
    config_.width = targetWidth;
    config_.height = targetHeight;
    config_.fps = targetFps;

    closeLocked();
    frameCounter_ = 0;
    state_ = CameraState::OPENING;

    auto result = openCandidatesLocked();
    state_ = result.isSuccess() ? CameraState::STREAMING : CameraState::CLOSED;
    return result;
}

core::Result<std::string, CameraError> CameraManager::open() {
    CameraConfig config = getConfig();
    return open(config.devices, config.width, config.height, config.fps);
}

core::Result<std::string, CameraError> CameraManager::openCandidatesLocked() {
    std::string failures;

    for (const auto& candidate : config_.devices) {
        std::unique_ptr<CaptureDevice> device = factory_();
        if (!device) {
            break;
        }

        if (device->open(candidate, config_)) {
            device_ = std::move(device);
            activeDevice_ = candidate;
            consecutiveFailures_ = 0;
            LOG_INFO("CameraManager: streaming from device " + candidate);
            return core::Result<std::string, CameraError>::success(candidate);
        }

        // Handle is released by the device destructor when it goes out of scope
        LOG_WARNING("CameraManager: candidate " + candidate + " rejected: " + device->getLastError());
        failures += (failures.empty() ? "" : "; ") + candidate + ": " + device->getLastError();
    }

    activeDevice_.clear();
    return core::Result<std::string, CameraError>::failure(
        CameraError::NO_DEVICE_AVAILABLE,
        failures.empty() ? "No camera candidates configured" : "All candidates failed (" + failures + ")");
}

core::Result<Frame, CameraError> CameraManager::readFrame() {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (state_) {
        case CameraState::STREAMING:
            return readStreamingLocked();
        case CameraState::RECOVERING:
            return stepRecoveryLocked();
        case CameraState::DEVICE_LOST:
            return core::Result<Frame, CameraError>::failure(
                CameraError::DEVICE_LOST, "Device lost after " +
                std::to_string(recoveryAttempts_) + " recovery attempts");
        case CameraState::CLOSED:
        case CameraState::OPENING:
        default:
            return core::Result<Frame, CameraError>::failure(
                CameraError::NO_DEVICE_AVAILABLE, "Camera is not open");
    }
}

core::Result<Frame, CameraError> CameraManager::readStreamingLocked() {
    Frame frame;
    if (device_ && device_->read(frame.image)) {
        consecutiveFailures_ = 0;
        frame.timestamp = core::Clock::now();
        frame.index = ++frameCounter_;
        stats_.frames_delivered++;
        return core::Result<Frame, CameraError>::success(std::move(frame));
    }

    stats_.read_failures++;
    consecutiveFailures_++;
    std::string reason = device_ ? device_->getLastError() : std::string("no device");

    LOG_DEBUG("CameraManager: read failure " + std::to_string(consecutiveFailures_) + "/" +
              std::to_string(config_.failure_threshold) + " (" + reason + ")");

    if (consecutiveFailures_ >= config_.failure_threshold) {
        enterRecoveryLocked();
    }

    return core::Result<Frame, CameraError>::failure(CameraError::TRANSIENT_READ_FAILURE, reason);
}

void CameraManager::enterRecoveryLocked() {
    LOG_WARNING("CameraManager: " + std::to_string(consecutiveFailures_) +
                " consecutive read failures on " + activeDevice_ + ", entering recovery");

    if (device_) {
        device_->release();
        device_.reset();
    }

    state_ = CameraState::RECOVERING;
    recoveryAttempts_ = 0;
    currentBackoffMs_ = config_.backoff_initial_ms;
    stats_.current_backoff_ms = currentBackoffMs_;
    nextAttemptAt_ = core::Clock::now() + std::chrono::milliseconds(currentBackoffMs_);
}

core::Result<Frame, CameraError> CameraManager::stepRecoveryLocked() {
    auto now = core::Clock::now();
    if (now < nextAttemptAt_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(nextAttemptAt_ - now);
        auto slice = std::min(remaining, std::chrono::milliseconds(config_.read_timeout_ms));
        std::this_thread::sleep_for(slice);

        if (core::Clock::now() < nextAttemptAt_) {
            return core::Result<Frame, CameraError>::failure(
                CameraError::TRANSIENT_READ_FAILURE, "Recovering, waiting for backoff");
        }
    }

    recoveryAttempts_++;
    stats_.recovery_attempts++;
    LOG_INFO("CameraManager: recovery attempt " + std::to_string(recoveryAttempts_) + "/" +
             std::to_string(config_.max_recovery_attempts));

    auto opened = openCandidatesLocked();
    if (opened.isSuccess()) {
        state_ = CameraState::STREAMING;
        stats_.recoveries++;
        stats_.current_backoff_ms = 0;
        LOG_INFO("CameraManager: recovered on device " + opened.data);
        return readStreamingLocked();
    }

    if (recoveryAttempts_ >= config_.max_recovery_attempts) {
        state_ = CameraState::DEVICE_LOST;
        LOG_ERROR("CameraManager: device lost, recovery exhausted: " + opened.message);
        return core::Result<Frame, CameraError>::failure(CameraError::DEVICE_LOST, opened.message);
    }

    currentBackoffMs_ = currentBackoffMs_ >= config_.backoff_max_ms / 2
        ? config_.backoff_max_ms
        : std::max(currentBackoffMs_ * 2, 1);
    stats_.current_backoff_ms = currentBackoffMs_;
    nextAttemptAt_ = core::Clock::now() + std::chrono::milliseconds(currentBackoffMs_);
    LOG_WARNING("CameraManager: recovery failed, next attempt in " +
                std::to_string(currentBackoffMs_) + " ms");

    return core::Result<Frame, CameraError>::failure(CameraError::TRANSIENT_READ_FAILURE, opened.message);
}

void CameraManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void CameraManager::closeLocked() {
    if (device_) {
        device_->release();
        device_.reset();
        LOG_INFO("CameraManager: closed device " + activeDevice_);
    }
    activeDevice_.clear();
    consecutiveFailures_ = 0;
    recoveryAttempts_ = 0;
    stats_.current_backoff_ms = 0;
    state_ = CameraState::CLOSED;
}

CameraState CameraManager::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string CameraManager::getActiveDevice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeDevice_;
}

CameraManager::Statistics CameraManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::optional<CameraLease> CameraManager::tryAcquire(const std::string& owner) {
    std::lock_guard<std::mutex> lock(leaseMutex_);
    if (!holder_.empty()) {
        LOG_WARNING("CameraManager: " + owner + " denied, camera held by " + holder_);
        return std::nullopt;
    }
    holder_ = owner;
    LOG_DEBUG("CameraManager: camera acquired by " + owner);
    return CameraLease(this, owner);
}

std::string CameraManager::getHolder() const {
    std::lock_guard<std::mutex> lock(leaseMutex_);
    return holder_;
}

void CameraManager::releaseLease() {
    close();
    std::lock_guard<std::mutex> lock(leaseMutex_);
    LOG_DEBUG("CameraManager: camera released by " + holder_);
    holder_.clear();
}

} // namespace camera
} // namespace gest
