/**
 * @file ModelFamily.hpp
 * @brief Capability table of supported model families
 *
 * Each family is a row of free functions selected by ModelKind. Training,
 * inference and persistence dispatch through the table; there is no
 * classifier class hierarchy.
 */

#ifndef GEST_GESTURE_MODEL_FAMILY_HPP
#define GEST_GESTURE_MODEL_FAMILY_HPP

#include <string>
#include <opencv2/core.hpp>
#include "gest/gesture/ModelArtifact.hpp"

namespace gest {
namespace gesture {

/**
 * @brief SVM hyperparameters
 */
struct SvmParameters {
    std::string kernel = "rbf";   ///< "rbf" or "linear"
    double c = 10.0;
    double gamma = 0.0;           ///< <= 0 selects 1 / feature_length
};

/**
 * @brief Random forest hyperparameters
 */
struct ForestParameters {
    int trees = 100;
    int max_depth = 12;
    int min_sample_count = 2;
};

struct FitParameters {
    SvmParameters svm;
    ForestParameters forest;
};

/**
 * @brief Winning label index and its confidence
 */
struct Scored {
    int label_index = -1;
    float confidence = 0.0f;
};

/**
 * @brief Capability row of one model family
 */
struct ModelFamily {
    ModelKind kind;
    const char* name;

    /**
     * Fit learners on normalized samples (rows, CV_32F) with label indices
     * (CV_32S column). Stores the fitted learners into artifact.model.
     */
    bool (*fit)(const cv::Mat& samples, const cv::Mat& label_indices, int num_labels,
                const FitParameters& params, ModelArtifact& artifact, std::string& error);

    /**
     * Score one normalized row against the artifact's learners
     */
    Scored (*predict)(const ModelArtifact& artifact, const cv::Mat& normalized_row);

    /**
     * Write learners inside the current FileStorage mapping
     */
    void (*write)(cv::FileStorage& fs, const ModelArtifact& artifact);

    /**
     * Read learners from the "model" node
     */
    bool (*read)(const cv::FileNode& node, ModelArtifact& artifact, std::string& error);

    /**
     * True when artifact.model holds fitted learners of this family for the vocabulary
     */
    bool (*has_learners)(const ModelArtifact& artifact);
};

/**
 * @brief Capability row for a kind
 */
const ModelFamily& model_family(ModelKind kind);

} // namespace gesture
} // namespace gest

#endif // GEST_GESTURE_MODEL_FAMILY_HPP
