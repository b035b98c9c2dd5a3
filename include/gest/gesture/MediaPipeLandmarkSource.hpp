#pragma once

/**
 * @file MediaPipeLandmarkSource.hpp
 * @brief Hand landmarks from MediaPipe Hands through an embedded Python interpreter
 *
 * Architecture:
 * - C++ interface (this class) -> pybind11 -> mediapipe.solutions.hands -> TFLite
 * - One Python interpreter per process, created on first use
 * - Python types stay behind the PIMPL so including this header does not pull
 *   in pybind11
 */

#include <memory>
#include <string>
#include <vector>
#include "gest/gesture/LandmarkSource.hpp"

namespace gest {
namespace gesture {

/**
 * @brief MediaPipe Hands options
 */
struct DetectionConfig {
    float min_detection_confidence = 0.5f;
    float min_tracking_confidence = 0.5f;
    int max_hands = 1;
    int model_complexity = 1;   ///< 0 = lite, 1 = full

    bool is_valid() const {
        return min_detection_confidence >= 0.0f && min_detection_confidence <= 1.0f &&
               min_tracking_confidence >= 0.0f && min_tracking_confidence <= 1.0f &&
               max_hands >= 1 && max_hands <= 4 &&
               (model_complexity == 0 || model_complexity == 1);
    }
};

/**
 * @brief LandmarkSource backed by the MediaPipe Hands Python solution
 *
 * Usage example:
 * @code
 * MediaPipeLandmarkSource source(DetectionConfig{});
 * auto hands = source.detect(frame);   // BGR frame from CameraManager
 * for (const auto& hand : hands) { ... }
 * @endcode
 */
class MediaPipeLandmarkSource : public LandmarkSource {
public:
    /**
     * @brief Import mediapipe and create the Hands solution
     * @throws core::DetectorException if Python or mediapipe is unavailable
     */
    explicit MediaPipeLandmarkSource(const DetectionConfig& config);

    ~MediaPipeLandmarkSource() override;

    /**
     * @brief Detect hands in a BGR (or grayscale) frame
     * @return Up to max_hands landmark sets, empty on no hand or detector error
     */
    std::vector<LandmarkSet> detect(const camera::Frame& frame) override;

    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;

    MediaPipeLandmarkSource(const MediaPipeLandmarkSource&) = delete;
    MediaPipeLandmarkSource& operator=(const MediaPipeLandmarkSource&) = delete;
};

} // namespace gesture
} // namespace gest
