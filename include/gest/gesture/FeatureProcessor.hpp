/**
 * @file FeatureProcessor.hpp
 * @brief Landmark set to fixed-length feature vector
 */

#ifndef GEST_GESTURE_FEATURE_PROCESSOR_HPP
#define GEST_GESTURE_FEATURE_PROCESSOR_HPP

#include <cstddef>
#include <string>
#include "gest/core/types.hpp"
#include "gest/gesture/GestureTypes.hpp"

namespace gest {
namespace gesture {

/**
 * @brief Feature layouts; the numeric value is persisted in artifacts
 */
enum class FeatureLayout {
    COORDINATES = 1,             ///< 21 x (x, y, z) = 63 values
    COORDINATES_AND_ANGLES = 2   ///< v1 + 10 fingertip distances + 15 joint angles = 88 values
};

/**
 * @brief Feature extraction options
 */
struct FeatureConfig {
    FeatureLayout layout = FeatureLayout::COORDINATES;

    /// Rotate in-plane so the wrist to middle MCP axis points along -y
    bool rotation_invariant = false;

    /// Mirror left hands along x so both hands share right-hand geometry
    bool mirror_left_hand = false;

    bool operator==(const FeatureConfig& other) const {
        return layout == other.layout && rotation_invariant == other.rotation_invariant &&
               mirror_left_hand == other.mirror_left_hand;
    }

    bool operator!=(const FeatureConfig& other) const { return !(*this == other); }
};

/**
 * @brief Fixed length of a feature layout
 */
size_t feature_length_for(FeatureLayout layout);

std::string feature_layout_to_string(FeatureLayout layout);

/**
 * @brief Map a persisted layout version (1 or 2) to its layout
 * @return false for unknown versions
 */
bool parse_feature_layout(int version, FeatureLayout& layout);

/**
 * @brief e.g. "layout 2, rotation_invariant on, mirror_left_hand off"
 */
std::string feature_config_to_string(const FeatureConfig& config);

/**
 * @brief Normalizes landmarks into the feature vector shared by training and inference
 *
 * Normalization:
 * 1. Wrist (landmark 0) becomes the origin
 * 2. Wrist to middle MCP (landmark 9) distance becomes unit length
 * 3. Optional in-plane rotation of that axis onto -y
 * 4. Optional mirroring of left hands
 *
 * Pure and deterministic: identical input yields an identical vector.
 */
class FeatureProcessor {
public:
    explicit FeatureProcessor(const FeatureConfig& config = FeatureConfig());

    /**
     * @brief Extract feature vector from one hand
     * @return Vector of feature_length() values, or INSUFFICIENT_LANDMARKS,
     *         DEGENERATE_SCALE, INVALID_COORDINATES
     */
    core::Result<FeatureVector, FeatureError> extract(const LandmarkSet& landmarks) const;

    size_t feature_length() const;

    const FeatureConfig& config() const { return config_; }

private:
    FeatureConfig config_;
};

} // namespace gesture
} // namespace gest

#endif // GEST_GESTURE_FEATURE_PROCESSOR_HPP
