/**
 * @file GestureClassifier.cpp
 * @brief Artifact swap and per-vector scoring
 */

#include "gest/gesture/GestureClassifier.hpp"
#include "gest/gesture/ModelFamily.hpp"
#include "gest/core/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace gest {
namespace gesture {

GestureClassifier::GestureClassifier(size_t expected_feature_length)
    : expected_feature_length_(expected_feature_length) {
}

core::Status<ModelError> GestureClassifier::load(ArtifactPtr artifact) {
    using StatusType = core::Status<ModelError>;

    if (!artifact) {
        return StatusType::failure(ModelError::INVALID_ARTIFACT, "Null artifact");
    }

    auto valid = validate_artifact(*artifact);
    if (!valid) {
        LOG_ERROR("GestureClassifier: rejected artifact: " + valid.message);
        return valid;
    }

    if (expected_feature_length_ != 0 && artifact->feature_length != expected_feature_length_) {
        const std::string message = "Artifact feature length " + std::to_string(artifact->feature_length) +
                                    " does not match processor length " +
                                    std::to_string(expected_feature_length_);
        LOG_ERROR("GestureClassifier: " + message);
        return StatusType::failure(ModelError::DIMENSION_MISMATCH, message);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifact_ = artifact;
    }

    LOG_INFO("GestureClassifier: active model " + artifact->version + " (" +
             model_kind_to_string(artifact->kind) + ", " +
             std::to_string(artifact->labels.size()) + " labels, " +
             std::to_string(artifact->feature_length) + " features)");
    return StatusType::ok();
}

core::Status<ModelError> GestureClassifier::load_file(const std::string& path) {
    auto loaded = load_artifact(path);
    if (!loaded) {
        LOG_ERROR("GestureClassifier: " + loaded.message);
        return core::Status<ModelError>::failure(*loaded.error, loaded.message);
    }
    return load(loaded.data);
}

core::Result<Prediction, ModelError> GestureClassifier::predict(const FeatureVector& features) const {
    using ResultType = core::Result<Prediction, ModelError>;

    ArtifactPtr artifact;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifact = artifact_;
    }

    if (!artifact) {
        return ResultType::failure(ModelError::NO_MODEL_LOADED, "No model loaded");
    }

    if (features.size() != artifact->feature_length) {
        return ResultType::failure(ModelError::DIMENSION_MISMATCH,
            "Vector length " + std::to_string(features.size()) + ", model expects " +
            std::to_string(artifact->feature_length));
    }

    Scored scored;
    try {
        scored = model_family(artifact->kind).predict(*artifact, artifact->normalize(features));
    } catch (const cv::Exception& e) {
        return ResultType::failure(ModelError::INVALID_ARTIFACT,
            "Model " + artifact->version + " failed to score: " + e.what());
    }
    if (scored.label_index < 0 || scored.label_index >= static_cast<int>(artifact->labels.size())) {
        return ResultType::failure(ModelError::INVALID_ARTIFACT,
            "Model produced label index " + std::to_string(scored.label_index));
    }

    Prediction prediction;
    prediction.label = artifact->labels[scored.label_index];
    prediction.confidence = std::isfinite(scored.confidence)
        ? std::max(0.0f, std::min(1.0f, scored.confidence))
        : 0.0f;
    prediction.model_version = artifact->version;
    return ResultType::success(std::move(prediction));
}

bool GestureClassifier::has_model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return artifact_ != nullptr;
}

ArtifactPtr GestureClassifier::active_artifact() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return artifact_;
}

} // namespace gesture
} // namespace gest
