/**
 * @file ModelArtifact.cpp
 * @brief Artifact validation and cv::FileStorage persistence
 */

#include "gest/gesture/ModelArtifact.hpp"
#include "gest/gesture/ModelFamily.hpp"
#include "gest/core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace gest {
namespace gesture {

namespace {

bool is_statistics_row(const cv::Mat& m, size_t length) {
    return !m.empty() && m.type() == CV_32F && m.rows == 1 &&
           static_cast<size_t>(m.cols) == length;
}

} // namespace

cv::Mat ModelArtifact::normalize(const FeatureVector& features) const {
    cv::Mat row(1, static_cast<int>(features.size()), CV_32F);
    for (size_t i = 0; i < features.size(); ++i) {
        row.at<float>(0, static_cast<int>(i)) = features[i];
    }
    cv::subtract(row, feature_mean, row);
    cv::divide(row, feature_scale, row);
    return row;
}

std::string model_kind_to_string(ModelKind kind) {
    return model_family(kind).name;
}

bool parse_model_kind(const std::string& name, ModelKind& kind) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "svm") {
        kind = ModelKind::SVM;
        return true;
    }
    if (lower == "random_forest" || lower == "forest") {
        kind = ModelKind::RANDOM_FOREST;
        return true;
    }
    return false;
}

core::Status<ModelError> validate_artifact(const ModelArtifact& artifact) {
    using StatusType = core::Status<ModelError>;

    if (artifact.labels.empty()) {
        return StatusType::failure(ModelError::INVALID_ARTIFACT, "Empty label vocabulary");
    }
    if (artifact.feature_length == 0) {
        return StatusType::failure(ModelError::INVALID_ARTIFACT, "Feature length is zero");
    }
    if (!is_statistics_row(artifact.feature_mean, artifact.feature_length) ||
        !is_statistics_row(artifact.feature_scale, artifact.feature_length)) {
        return StatusType::failure(ModelError::INVALID_ARTIFACT,
            "Normalization statistics do not match feature length " +
            std::to_string(artifact.feature_length));
    }

    double min_scale = 0.0;
    cv::minMaxLoc(artifact.feature_scale, &min_scale);
    if (!(min_scale > 0.0)) {
        return StatusType::failure(ModelError::INVALID_ARTIFACT, "Non-positive feature scale");
    }

    const ModelFamily& family = model_family(artifact.kind);
    if (!family.has_learners(artifact)) {
        return StatusType::failure(ModelError::INVALID_ARTIFACT,
            std::string("Learners do not match model kind ") + family.name);
    }

    return StatusType::ok();
}

core::Status<ModelError> save_artifact(const ModelArtifact& artifact, const std::string& path) {
    using StatusType = core::Status<ModelError>;

    auto valid = validate_artifact(artifact);
    if (!valid) {
        return valid;
    }

    try {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            return StatusType::failure(ModelError::INVALID_ARTIFACT, "Cannot open " + path + " for writing");
        }

        const ModelFamily& family = model_family(artifact.kind);

        fs << "format_version" << ARTIFACT_FORMAT_VERSION;
        fs << "model_kind" << std::string(family.name);
        fs << "version" << artifact.version;
        fs << "created_at" << std::to_string(artifact.created_at_ms);
        fs << "feature_length" << static_cast<int>(artifact.feature_length);
        fs << "feature_layout_version" << static_cast<int>(artifact.features.layout);
        fs << "rotation_invariant" << static_cast<int>(artifact.features.rotation_invariant);
        fs << "mirror_left_hand" << static_cast<int>(artifact.features.mirror_left_hand);

        fs << "labels" << "[";
        for (const auto& label : artifact.labels) {
            fs << label;
        }
        fs << "]";

        fs << "feature_mean" << artifact.feature_mean;
        fs << "feature_scale" << artifact.feature_scale;

        fs << "model" << "{";
        family.write(fs, artifact);
        fs << "}";

        fs.release();
    } catch (const cv::Exception& e) {
        return StatusType::failure(ModelError::INVALID_ARTIFACT,
            "Failed to write " + path + ": " + e.what());
    }

    LOG_INFO("ModelArtifact: saved " + artifact.version + " (" + model_kind_to_string(artifact.kind) +
             ", " + std::to_string(artifact.labels.size()) + " labels) to " + path);
    return StatusType::ok();
}

core::Result<ArtifactPtr, ModelError> load_artifact(const std::string& path) {
    using ResultType = core::Result<ArtifactPtr, ModelError>;

    if (!std::ifstream(path).good()) {
        return ResultType::failure(ModelError::INVALID_ARTIFACT, "Artifact not found: " + path);
    }

    auto artifact = std::make_shared<ModelArtifact>();

    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT, "Cannot open " + path);
        }

        const int format_version = static_cast<int>(fs["format_version"]);
        if (format_version != ARTIFACT_FORMAT_VERSION) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT,
                "Unsupported artifact format_version " + std::to_string(format_version));
        }

        std::string kind_name;
        fs["model_kind"] >> kind_name;
        if (!parse_model_kind(kind_name, artifact->kind)) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT, "Unknown model_kind '" + kind_name + "'");
        }

        fs["version"] >> artifact->version;

        std::string created_at;
        fs["created_at"] >> created_at;
        try {
            artifact->created_at_ms = created_at.empty() ? 0 : std::stoll(created_at);
        } catch (const std::logic_error&) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT, "Malformed created_at '" + created_at + "'");
        }

        const int feature_length = static_cast<int>(fs["feature_length"]);
        if (feature_length <= 0) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT, "Missing or invalid feature_length");
        }
        artifact->feature_length = static_cast<size_t>(feature_length);
        const int layout_version = static_cast<int>(fs["feature_layout_version"]);
        if (!parse_feature_layout(layout_version, artifact->features.layout)) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT,
                "Unknown feature_layout_version " + std::to_string(layout_version));
        }
        artifact->features.rotation_invariant = static_cast<int>(fs["rotation_invariant"]) != 0;
        artifact->features.mirror_left_hand = static_cast<int>(fs["mirror_left_hand"]) != 0;

        const cv::FileNode labels = fs["labels"];
        if (!labels.isSeq()) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT, "labels must be a sequence");
        }
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            artifact->labels.push_back(static_cast<std::string>(*it));
        }

        fs["feature_mean"] >> artifact->feature_mean;
        fs["feature_scale"] >> artifact->feature_scale;

        std::string error;
        const cv::FileNode model = fs["model"];
        if (!model.isMap() || !model_family(artifact->kind).read(model, *artifact, error)) {
            return ResultType::failure(ModelError::INVALID_ARTIFACT,
                error.empty() ? std::string("model node missing") : error);
        }
    } catch (const cv::Exception& e) {
        return ResultType::failure(ModelError::INVALID_ARTIFACT,
            "Malformed artifact " + path + ": " + e.what());
    }

    auto valid = validate_artifact(*artifact);
    if (!valid) {
        return ResultType::failure(ModelError::INVALID_ARTIFACT, valid.message);
    }

    LOG_INFO("ModelArtifact: loaded " + artifact->version + " from " + path);
    return ResultType::success(std::move(artifact));
}

} // namespace gesture
} // namespace gest
