#pragma once

#include <vector>
#include "gest/camera/CameraTypes.hpp"
#include "gest/gesture/GestureTypes.hpp"

namespace gest {
namespace gesture {

/**
 * @brief Per-frame hand keypoint detector
 *
 * A frame without hands yields an empty vector. Implementations report
 * detector faults through logging and an empty result, never by throwing
 * from detect().
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    virtual std::vector<LandmarkSet> detect(const camera::Frame& frame) = 0;
};

} // namespace gesture
} // namespace gest
