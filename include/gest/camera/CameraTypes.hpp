/**
 * @file CameraTypes.hpp
 * @brief Frame and camera error types shared by capture and recognition
 */

#ifndef GEST_CAMERA_TYPES_HPP
#define GEST_CAMERA_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "gest/core/types.hpp"

namespace gest {
namespace camera {

/**
 * @brief Single captured image
 */
struct Frame {
    cv::Mat image;                 ///< Pixel buffer (BGR for color devices)
    core::Timestamp timestamp;     ///< Capture time
    uint64_t index = 0;            ///< 1-based frame counter of the stream

    int width() const { return image.cols; }
    int height() const { return image.rows; }
    int channels() const { return image.channels(); }
    bool empty() const { return image.empty(); }
};

/**
 * @brief Capture failures
 */
enum class CameraError {
    NO_DEVICE_AVAILABLE,     ///< No candidate could be opened with the requested format
    TRANSIENT_READ_FAILURE,  ///< Single read failed; retry is allowed
    DEVICE_LOST,             ///< Recovery exhausted; manager must be restarted
    CAMERA_BUSY              ///< Another session holds the camera
};

/**
 * @brief Capture lifecycle
 */
enum class CameraState {
    CLOSED,
    OPENING,
    STREAMING,
    RECOVERING,
    DEVICE_LOST
};

/// Upper bound for the recovery backoff (10 minutes)
constexpr int MAX_BACKOFF_MS = 600000;

/**
 * @brief Requested capture format and fault policy
 */
struct CameraConfig {
    std::vector<std::string> devices = {"0"};  ///< Candidates tried in order
    int width = 640;
    int height = 480;
    double fps = 30.0;
    int read_timeout_ms = 100;
    int failure_threshold = 5;        ///< Consecutive read failures before recovery
    int max_recovery_attempts = 5;
    int backoff_initial_ms = 200;
    int backoff_max_ms = 5000;
    bool strict_format = false;       ///< Reject devices reporting another resolution

    bool is_valid() const {
        return !devices.empty() && width > 0 && height > 0 && fps > 0.0 &&
               read_timeout_ms > 0 && failure_threshold > 0 &&
               max_recovery_attempts > 0 && backoff_initial_ms >= 0 &&
               backoff_max_ms >= backoff_initial_ms && backoff_max_ms <= MAX_BACKOFF_MS;
    }
};

inline std::string camera_error_to_string(CameraError error) {
    switch (error) {
        case CameraError::NO_DEVICE_AVAILABLE: return "NoDeviceAvailable";
        case CameraError::TRANSIENT_READ_FAILURE: return "TransientReadFailure";
        case CameraError::DEVICE_LOST: return "DeviceLost";
        case CameraError::CAMERA_BUSY: return "CameraBusy";
        default: return "Invalid";
    }
}

inline std::string camera_state_to_string(CameraState state) {
    switch (state) {
        case CameraState::CLOSED: return "Closed";
        case CameraState::OPENING: return "Opening";
        case CameraState::STREAMING: return "Streaming";
        case CameraState::RECOVERING: return "Recovering";
        case CameraState::DEVICE_LOST: return "DeviceLost";
        default: return "Invalid";
    }
}

} // namespace camera
} // namespace gest

#endif // GEST_CAMERA_TYPES_HPP
