/**
 * @file ModelArtifact.hpp
 * @brief Fitted classifier artifact and its persisted form
 *
 * An artifact bundles everything inference needs: the model-kind tag, the
 * fitted learners, the ordered label vocabulary, the feature length and
 * extraction settings it was trained on, and the per-feature normalization
 * statistics. Artifacts are immutable once created and shared as
 * std::shared_ptr<const ModelArtifact>.
 */

#ifndef GEST_GESTURE_MODEL_ARTIFACT_HPP
#define GEST_GESTURE_MODEL_ARTIFACT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>
#include "gest/core/types.hpp"
#include "gest/gesture/FeatureProcessor.hpp"
#include "gest/gesture/GestureTypes.hpp"

namespace gest {
namespace gesture {

/**
 * @brief Model family tag
 */
enum class ModelKind {
    SVM,            ///< One-vs-rest margin classifiers
    RANDOM_FOREST   ///< Tree ensemble, vote fractions
};

/**
 * @brief Fitted one-vs-rest SVM separators
 *
 * separators[i] scores label i against the rest; orientation[i] is +1 or -1
 * so that orientation * raw decision value is positive on the label side.
 */
struct SvmModel {
    std::vector<cv::Ptr<cv::ml::SVM>> separators;
    std::vector<float> orientation;
};

/**
 * @brief Fitted random forest; class responses are label indices
 */
struct ForestModel {
    cv::Ptr<cv::ml::RTrees> forest;
};

struct ModelArtifact {
    ModelKind kind = ModelKind::SVM;
    std::string version;
    int64_t created_at_ms = 0;
    std::vector<std::string> labels;      ///< Ordered, stable vocabulary
    size_t feature_length = 0;
    FeatureConfig features;               ///< Extraction settings of the training vectors
    cv::Mat feature_mean;                 ///< 1 x feature_length, CV_32F
    cv::Mat feature_scale;                ///< 1 x feature_length, CV_32F, all > 0
    std::variant<SvmModel, ForestModel> model;

    /**
     * @brief Apply normalization statistics to one vector
     * @return 1 x feature_length CV_32F row
     */
    cv::Mat normalize(const FeatureVector& features) const;
};

using ArtifactPtr = std::shared_ptr<const ModelArtifact>;

/// Version of the persisted document layout
constexpr int ARTIFACT_FORMAT_VERSION = 1;

std::string model_kind_to_string(ModelKind kind);

/**
 * @brief Parse "svm" / "random_forest" (case-insensitive)
 * @return false for unknown names
 */
bool parse_model_kind(const std::string& name, ModelKind& kind);

/**
 * @brief Structural validation: vocabulary, statistics, learners match kind
 */
core::Status<ModelError> validate_artifact(const ModelArtifact& artifact);

/**
 * @brief Persist artifact as an OpenCV FileStorage document (YAML/XML/JSON by extension)
 */
core::Status<ModelError> save_artifact(const ModelArtifact& artifact, const std::string& path);

/**
 * @brief Read and validate a persisted artifact
 * @return INVALID_ARTIFACT when missing, malformed or inconsistent
 */
core::Result<ArtifactPtr, ModelError> load_artifact(const std::string& path);

} // namespace gesture
} // namespace gest

#endif // GEST_GESTURE_MODEL_ARTIFACT_HPP
