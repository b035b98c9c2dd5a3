/**
 * @file GestureTypes.hpp
 * @brief Core data types for gesture recognition
 *
 * Defines landmark sets, feature vectors, predictions, gesture events and the
 * error enumerations shared by feature extraction, classification and
 * stability filtering.
 */

#ifndef GEST_GESTURE_TYPES_HPP
#define GEST_GESTURE_TYPES_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "gest/core/types.hpp"

namespace gest {
namespace gesture {

/// Number of keypoints per hand produced by the landmark detector
constexpr int NUM_HAND_LANDMARKS = 21;

/**
 * @brief Landmark indices (MediaPipe Hands topology)
 */
namespace landmark {
constexpr int WRIST = 0;
constexpr int THUMB_CMC = 1;
constexpr int THUMB_MCP = 2;
constexpr int THUMB_IP = 3;
constexpr int THUMB_TIP = 4;
constexpr int INDEX_MCP = 5;
constexpr int INDEX_PIP = 6;
constexpr int INDEX_DIP = 7;
constexpr int INDEX_TIP = 8;
constexpr int MIDDLE_MCP = 9;
constexpr int MIDDLE_PIP = 10;
constexpr int MIDDLE_DIP = 11;
constexpr int MIDDLE_TIP = 12;
constexpr int RING_MCP = 13;
constexpr int RING_PIP = 14;
constexpr int RING_DIP = 15;
constexpr int RING_TIP = 16;
constexpr int PINKY_MCP = 17;
constexpr int PINKY_PIP = 18;
constexpr int PINKY_DIP = 19;
constexpr int PINKY_TIP = 20;
} // namespace landmark

/**
 * @brief Handedness reported by the detector
 */
enum class HandSide {
    LEFT,
    RIGHT,
    UNKNOWN
};

/**
 * @brief Keypoints of one detected hand
 *
 * Coordinates are normalized: x, y in [0, 1] relative to the image, z is
 * relative depth (negative = closer to camera).
 */
struct LandmarkSet {
    std::vector<cv::Point3f> points;     ///< Ordered keypoints (21 for a full hand)
    HandSide handedness = HandSide::UNKNOWN;
    float confidence = 0.0f;             ///< Detection confidence [0, 1]
};

/// Fixed-length feature vector; length is set by the feature layout
using FeatureVector = std::vector<float>;

/**
 * @brief Per-frame classifier output
 */
struct Prediction {
    std::string label;
    float confidence = 0.0f;       ///< [0, 1], comparable within one model kind
    std::string model_version;     ///< Version of the artifact that scored the vector
};

/**
 * @brief Debounced occurrence of a stable gesture
 */
struct GestureEvent {
    std::string label;
    HandSide hand = HandSide::UNKNOWN;
    float confidence = 0.0f;       ///< Confidence of the confirming frame
    uint64_t frame_index = 0;      ///< Frame on which the gesture was confirmed
    core::Timestamp timestamp;
};

using GestureEventCallback = std::function<void(const GestureEvent& event)>;

/**
 * @brief Feature extraction failures
 */
enum class FeatureError {
    INSUFFICIENT_LANDMARKS,  ///< Fewer than 21 keypoints
    DEGENERATE_SCALE,        ///< Wrist to middle MCP distance too small to normalize
    INVALID_COORDINATES      ///< NaN or infinite coordinate
};

/**
 * @brief Classifier and artifact failures
 */
enum class ModelError {
    NO_MODEL_LOADED,
    DIMENSION_MISMATCH,
    INVALID_ARTIFACT
};

inline std::string hand_side_to_string(HandSide side) {
    switch (side) {
        case HandSide::LEFT: return "Left";
        case HandSide::RIGHT: return "Right";
        case HandSide::UNKNOWN: return "Unknown";
        default: return "Invalid";
    }
}

inline std::string feature_error_to_string(FeatureError error) {
    switch (error) {
        case FeatureError::INSUFFICIENT_LANDMARKS: return "InsufficientLandmarks";
        case FeatureError::DEGENERATE_SCALE: return "DegenerateScale";
        case FeatureError::INVALID_COORDINATES: return "InvalidCoordinates";
        default: return "Invalid";
    }
}

inline std::string model_error_to_string(ModelError error) {
    switch (error) {
        case ModelError::NO_MODEL_LOADED: return "NoModelLoaded";
        case ModelError::DIMENSION_MISMATCH: return "DimensionMismatch";
        case ModelError::INVALID_ARTIFACT: return "InvalidArtifact";
        default: return "Invalid";
    }
}

} // namespace gesture
} // namespace gest

#endif // GEST_GESTURE_TYPES_HPP
