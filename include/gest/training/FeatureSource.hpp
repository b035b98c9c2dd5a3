#pragma once

#include <string>
#include "gest/camera/CameraManager.hpp"
#include "gest/gesture/FeatureProcessor.hpp"
#include "gest/gesture/LandmarkSource.hpp"

namespace gest {
namespace training {

/**
 * @brief Result of one capture attempt
 */
struct FeatureCapture {
    enum class Status {
        OK,          ///< features holds a valid vector
        SKIPPED,     ///< No usable hand this attempt; try again
        EXHAUSTED    ///< Source can deliver no more vectors
    };

    Status status = Status::SKIPPED;
    gesture::FeatureVector features;
    std::string reason;
};

/**
 * @brief Pull-based supplier of feature vectors for recording
 */
class FeatureSource {
public:
    virtual ~FeatureSource() = default;

    virtual FeatureCapture next() = 0;
};

/**
 * @brief Camera -> landmarks -> features, first detected hand
 *
 * Transient camera and extraction failures are SKIPPED; a lost or closed
 * camera ends the source.
 */
class CameraFeatureSource : public FeatureSource {
public:
    CameraFeatureSource(camera::CameraManager& camera,
                        gesture::LandmarkSource& landmarks,
                        const gesture::FeatureProcessor& processor);

    FeatureCapture next() override;

private:
    camera::CameraManager& camera_;
    gesture::LandmarkSource& landmarks_;
    const gesture::FeatureProcessor& processor_;
};

} // namespace training
} // namespace gest
