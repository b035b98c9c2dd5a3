/**
 * @file GestureClassifier.hpp
 * @brief Feature vector to (label, confidence) with a hot-swappable artifact
 */

#ifndef GEST_GESTURE_CLASSIFIER_HPP
#define GEST_GESTURE_CLASSIFIER_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include "gest/core/types.hpp"
#include "gest/gesture/GestureTypes.hpp"
#include "gest/gesture/ModelArtifact.hpp"

namespace gest {
namespace gesture {

/**
 * @brief Scores feature vectors against the active model artifact
 *
 * Thread-safety: load() may run concurrently with predict(). A predict call
 * takes a reference to the artifact active at its start and scores without
 * holding the lock, so a swap never mixes two artifacts in one prediction.
 */
class GestureClassifier {
public:
    /**
     * @param expected_feature_length Length produced by the live feature
     *        processor; 0 accepts any artifact length
     */
    explicit GestureClassifier(size_t expected_feature_length = 0);

    /**
     * @brief Validate and atomically activate an artifact
     * @return INVALID_ARTIFACT if malformed, DIMENSION_MISMATCH if its feature
     *         length differs from the expected one
     */
    core::Status<ModelError> load(ArtifactPtr artifact);

    /**
     * @brief Read a persisted artifact and activate it
     */
    core::Status<ModelError> load_file(const std::string& path);

    /**
     * @brief Classify one feature vector
     * @return NO_MODEL_LOADED before any load, DIMENSION_MISMATCH on length mismatch,
     *         INVALID_ARTIFACT when the learners cannot score the vector
     */
    core::Result<Prediction, ModelError> predict(const FeatureVector& features) const;

    bool has_model() const;

    ArtifactPtr active_artifact() const;

    size_t expected_feature_length() const { return expected_feature_length_; }

private:
    size_t expected_feature_length_;
    mutable std::mutex mutex_;
    ArtifactPtr artifact_;
};

} // namespace gesture
} // namespace gest

#endif // GEST_GESTURE_CLASSIFIER_HPP
