/**
 * @file FeatureProcessor.cpp
 * @brief Landmark normalization and feature layouts
 */

#include "gest/gesture/FeatureProcessor.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace gest {
namespace gesture {

namespace {

constexpr float MIN_REFERENCE_DISTANCE = 1e-6f;

constexpr std::array<int, 5> FINGERTIPS = {
    landmark::THUMB_TIP, landmark::INDEX_TIP, landmark::MIDDLE_TIP,
    landmark::RING_TIP, landmark::PINKY_TIP
};

// (previous, joint, next) triplets; 3 joints per finger
constexpr std::array<std::array<int, 3>, 15> JOINT_TRIPLETS = {{
    {landmark::WRIST, landmark::THUMB_CMC, landmark::THUMB_MCP},
    {landmark::THUMB_CMC, landmark::THUMB_MCP, landmark::THUMB_IP},
    {landmark::THUMB_MCP, landmark::THUMB_IP, landmark::THUMB_TIP},
    {landmark::WRIST, landmark::INDEX_MCP, landmark::INDEX_PIP},
    {landmark::INDEX_MCP, landmark::INDEX_PIP, landmark::INDEX_DIP},
    {landmark::INDEX_PIP, landmark::INDEX_DIP, landmark::INDEX_TIP},
    {landmark::WRIST, landmark::MIDDLE_MCP, landmark::MIDDLE_PIP},
    {landmark::MIDDLE_MCP, landmark::MIDDLE_PIP, landmark::MIDDLE_DIP},
    {landmark::MIDDLE_PIP, landmark::MIDDLE_DIP, landmark::MIDDLE_TIP},
    {landmark::WRIST, landmark::RING_MCP, landmark::RING_PIP},
    {landmark::RING_MCP, landmark::RING_PIP, landmark::RING_DIP},
    {landmark::RING_PIP, landmark::RING_DIP, landmark::RING_TIP},
    {landmark::WRIST, landmark::PINKY_MCP, landmark::PINKY_PIP},
    {landmark::PINKY_MCP, landmark::PINKY_PIP, landmark::PINKY_DIP},
    {landmark::PINKY_PIP, landmark::PINKY_DIP, landmark::PINKY_TIP},
}};

constexpr size_t COORDINATE_FEATURES = NUM_HAND_LANDMARKS * 3;
constexpr size_t DISTANCE_FEATURES = FINGERTIPS.size() * (FINGERTIPS.size() - 1) / 2;
constexpr size_t ANGLE_FEATURES = JOINT_TRIPLETS.size();

bool is_finite(const cv::Point3f& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

float length(const cv::Point3f& p) {
    return std::sqrt(p.dot(p));
}

/**
 * @brief Flexion at joint b: 0 for a straight finger, grows as it bends
 */
float flexion_angle(const cv::Point3f& a, const cv::Point3f& b, const cv::Point3f& c) {
    const cv::Point3f u = b - a;
    const cv::Point3f v = c - b;
    const float lu = length(u);
    const float lv = length(v);
    if (lu < MIN_REFERENCE_DISTANCE || lv < MIN_REFERENCE_DISTANCE) {
        return 0.0f;
    }
    float cosine = u.dot(v) / (lu * lv);
    cosine = std::max(-1.0f, std::min(1.0f, cosine));
    return std::acos(cosine);
}

} // namespace

size_t feature_length_for(FeatureLayout layout) {
    switch (layout) {
        case FeatureLayout::COORDINATES:
            return COORDINATE_FEATURES;
        case FeatureLayout::COORDINATES_AND_ANGLES:
            return COORDINATE_FEATURES + DISTANCE_FEATURES + ANGLE_FEATURES;
        default:
            return 0;
    }
}

std::string feature_layout_to_string(FeatureLayout layout) {
    switch (layout) {
        case FeatureLayout::COORDINATES: return "Coordinates";
        case FeatureLayout::COORDINATES_AND_ANGLES: return "CoordinatesAndAngles";
        default: return "Invalid";
    }
}

bool parse_feature_layout(int version, FeatureLayout& layout) {
    switch (version) {
        case 1: layout = FeatureLayout::COORDINATES; return true;
        case 2: layout = FeatureLayout::COORDINATES_AND_ANGLES; return true;
        default: return false;
    }
}

std::string feature_config_to_string(const FeatureConfig& config) {
    return "layout " + std::to_string(static_cast<int>(config.layout)) +
           ", rotation_invariant " + (config.rotation_invariant ? "on" : "off") +
           ", mirror_left_hand " + (config.mirror_left_hand ? "on" : "off");
}

FeatureProcessor::FeatureProcessor(const FeatureConfig& config)
    : config_(config) {
}

size_t FeatureProcessor::feature_length() const {
    return feature_length_for(config_.layout);
}

core::Result<FeatureVector, FeatureError> FeatureProcessor::extract(const LandmarkSet& landmarks) const {
    using ResultType = core::Result<FeatureVector, FeatureError>;

    if (landmarks.points.size() < static_cast<size_t>(NUM_HAND_LANDMARKS)) {
        return ResultType::failure(FeatureError::INSUFFICIENT_LANDMARKS,
            "Expected " + std::to_string(NUM_HAND_LANDMARKS) + " landmarks, got " +
            std::to_string(landmarks.points.size()));
    }

    std::array<cv::Point3f, NUM_HAND_LANDMARKS> points;
    for (int i = 0; i < NUM_HAND_LANDMARKS; ++i) {
        if (!is_finite(landmarks.points[i])) {
            return ResultType::failure(FeatureError::INVALID_COORDINATES,
                "Landmark " + std::to_string(i) + " is not finite");
        }
        points[i] = landmarks.points[i];
    }

    // Translate to wrist origin
    const cv::Point3f wrist = points[landmark::WRIST];
    for (auto& p : points) {
        p -= wrist;
    }

    const float reference = length(points[landmark::MIDDLE_MCP]);
    if (!(reference >= MIN_REFERENCE_DISTANCE)) {
        return ResultType::failure(FeatureError::DEGENERATE_SCALE,
            "Wrist to middle MCP distance " + std::to_string(reference) + " below minimum");
    }

    const float inv_scale = 1.0f / reference;
    for (auto& p : points) {
        p *= inv_scale;
    }

    if (config_.mirror_left_hand && landmarks.handedness == HandSide::LEFT) {
        for (auto& p : points) {
            p.x = -p.x;
        }
    }

    if (config_.rotation_invariant) {
        const cv::Point3f axis = points[landmark::MIDDLE_MCP];
        const float planar = std::sqrt(axis.x * axis.x + axis.y * axis.y);
        // Axis perpendicular to the image plane has no in-plane direction
        if (planar >= MIN_REFERENCE_DISTANCE) {
            const float rotation = static_cast<float>(-CV_PI / 2.0) - std::atan2(axis.y, axis.x);
            const float c = std::cos(rotation);
            const float s = std::sin(rotation);
            for (auto& p : points) {
                const float x = p.x * c - p.y * s;
                const float y = p.x * s + p.y * c;
                p.x = x;
                p.y = y;
            }
        }
    }

    FeatureVector features;
    features.reserve(feature_length());

    for (const auto& p : points) {
        features.push_back(p.x);
        features.push_back(p.y);
        features.push_back(p.z);
    }

    if (config_.layout == FeatureLayout::COORDINATES_AND_ANGLES) {
        for (size_t i = 0; i < FINGERTIPS.size(); ++i) {
            for (size_t j = i + 1; j < FINGERTIPS.size(); ++j) {
                features.push_back(length(points[FINGERTIPS[i]] - points[FINGERTIPS[j]]));
            }
        }
        for (const auto& joint : JOINT_TRIPLETS) {
            features.push_back(flexion_angle(points[joint[0]], points[joint[1]], points[joint[2]]));
        }
    }

    return ResultType::success(std::move(features));
}

} // namespace gesture
} // namespace gest
