/**
 * @file ModelFamily.cpp
 * @brief SVM and random forest rows of the model capability table
 */

#include "gest/gesture/ModelFamily.hpp"
#include "gest/core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace gest {
namespace gesture {

namespace {

// ============================================================================
// SVM: one-vs-rest separators, softmax over oriented margins
// ============================================================================

cv::ml::SVM::KernelTypes svm_kernel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "linear" ? cv::ml::SVM::LINEAR : cv::ml::SVM::RBF;
}

float mean_raw_output(const cv::Ptr<cv::ml::SVM>& svm, const cv::Mat& samples) {
    if (samples.empty()) {
        return 0.0f;
    }
    cv::Mat raw;
    svm->predict(samples, raw, cv::ml::StatModel::RAW_OUTPUT);
    return static_cast<float>(cv::mean(raw)[0]);
}

bool svm_fit(const cv::Mat& samples, const cv::Mat& label_indices, int num_labels,
             const FitParameters& params, ModelArtifact& artifact, std::string& error) {
    SvmModel model;
    const double gamma = params.svm.gamma > 0.0 ? params.svm.gamma : 1.0 / std::max(1, samples.cols);

    for (int label = 0; label < num_labels; ++label) {
        cv::Mat binary(label_indices.rows, 1, CV_32S);
        cv::Mat positives;
        cv::Mat negatives;
        for (int r = 0; r < label_indices.rows; ++r) {
            const bool is_label = label_indices.at<int>(r, 0) == label;
            binary.at<int>(r, 0) = is_label ? 1 : 0;
            if (is_label) {
                positives.push_back(samples.row(r));
            } else {
                negatives.push_back(samples.row(r));
            }
        }

        if (positives.empty() || negatives.empty()) {
            error = "Label index " + std::to_string(label) + " has no positive or negative samples";
            return false;
        }

        cv::Ptr<cv::ml::SVM> svm = cv::ml::SVM::create();
        svm->setType(cv::ml::SVM::C_SVC);
        svm->setKernel(svm_kernel(params.svm.kernel));
        svm->setC(params.svm.c);
        if (svm->getKernelType() == cv::ml::SVM::RBF) {
            svm->setGamma(gamma);
        }
        svm->setTermCriteria(cv::TermCriteria(cv::TermCriteria::MAX_ITER + cv::TermCriteria::EPS, 1000, 1e-6));

        if (!svm->train(cv::ml::TrainData::create(samples, cv::ml::ROW_SAMPLE, binary))) {
            error = "SVM training failed for label index " + std::to_string(label);
            return false;
        }

        // Sign of the raw decision value is backend defined; orient it on the data
        const float positive_mean = mean_raw_output(svm, positives);
        const float negative_mean = mean_raw_output(svm, negatives);
        model.orientation.push_back(positive_mean >= negative_mean ? 1.0f : -1.0f);
        model.separators.push_back(svm);
    }

    artifact.model = std::move(model);
    return true;
}

Scored svm_predict(const ModelArtifact& artifact, const cv::Mat& normalized_row) {
    Scored scored;
    const SvmModel* model = std::get_if<SvmModel>(&artifact.model);
    if (model == nullptr || model->separators.empty()) {
        return scored;
    }

    std::vector<float> margins(model->separators.size());
    for (size_t i = 0; i < model->separators.size(); ++i) {
        const float raw = model->separators[i]->predict(normalized_row, cv::noArray(),
                                                        cv::ml::StatModel::RAW_OUTPUT);
        margins[i] = model->orientation[i] * raw;
    }

    const auto best = std::max_element(margins.begin(), margins.end());
    const float peak = *best;
    float total = 0.0f;
    for (float m : margins) {
        total += std::exp(m - peak);
    }

    scored.label_index = static_cast<int>(best - margins.begin());
    scored.confidence = 1.0f / total;
    return scored;
}

void svm_write(cv::FileStorage& fs, const ModelArtifact& artifact) {
    const SvmModel& model = std::get<SvmModel>(artifact.model);
    fs << "separators" << "[";
    for (size_t i = 0; i < model.separators.size(); ++i) {
        fs << "{" << "orientation" << model.orientation[i] << "svm" << "{";
        model.separators[i]->write(fs);
        fs << "}" << "}";
    }
    fs << "]";
}

bool svm_read(const cv::FileNode& node, ModelArtifact& artifact, std::string& error) {
    const cv::FileNode separators = node["separators"];
    if (!separators.isSeq()) {
        error = "model.separators missing";
        return false;
    }

    SvmModel model;
    for (auto it = separators.begin(); it != separators.end(); ++it) {
        const cv::FileNode item = *it;
        cv::Ptr<cv::ml::SVM> svm = cv::Algorithm::read<cv::ml::SVM>(item["svm"]);
        if (!svm || !svm->isTrained()) {
            error = "Separator " + std::to_string(model.separators.size()) + " is not a trained SVM";
            return false;
        }
        const float orientation = static_cast<float>(item["orientation"]);
        model.orientation.push_back(orientation < 0.0f ? -1.0f : 1.0f);
        model.separators.push_back(svm);
    }

    artifact.model = std::move(model);
    return true;
}

bool svm_has_learners(const ModelArtifact& artifact) {
    const SvmModel* model = std::get_if<SvmModel>(&artifact.model);
    if (model == nullptr || model->separators.size() != artifact.labels.size() ||
        model->orientation.size() != model->separators.size()) {
        return false;
    }
    return std::all_of(model->separators.begin(), model->separators.end(),
                       [](const cv::Ptr<cv::ml::SVM>& svm) { return svm && svm->isTrained(); });
}

// ============================================================================
// Random forest: confidence is the winning label's share of tree votes
// ============================================================================

bool forest_fit(const cv::Mat& samples, const cv::Mat& label_indices, int num_labels,
                const FitParameters& params, ModelArtifact& artifact, std::string& error) {
    cv::Ptr<cv::ml::RTrees> forest = cv::ml::RTrees::create();
    forest->setMaxDepth(params.forest.max_depth);
    forest->setMinSampleCount(params.forest.min_sample_count);
    forest->setCalculateVarImportance(false);
    forest->setActiveVarCount(0);
    forest->setTermCriteria(cv::TermCriteria(cv::TermCriteria::MAX_ITER, params.forest.trees, 0.0));

    cv::Ptr<cv::ml::TrainData> data = cv::ml::TrainData::create(samples, cv::ml::ROW_SAMPLE, label_indices);
    if (!forest->train(data)) {
        error = "Random forest training failed";
        return false;
    }

    LOG_DEBUG("ModelFamily: forest fitted with " + std::to_string(params.forest.trees) +
              " trees over " + std::to_string(num_labels) + " labels");

    ForestModel model;
    model.forest = forest;
    artifact.model = std::move(model);
    return true;
}

Scored forest_predict(const ModelArtifact& artifact, const cv::Mat& normalized_row) {
    Scored scored;
    const ForestModel* model = std::get_if<ForestModel>(&artifact.model);
    if (model == nullptr || !model->forest) {
        return scored;
    }

    // Row 0 holds class responses, row 1 the vote counts for the sample
    cv::Mat votes;
    model->forest->getVotes(normalized_row, votes, 0);
    if (votes.rows < 2 || votes.cols == 0) {
        return scored;
    }

    cv::Mat votes32;
    votes.convertTo(votes32, CV_32S);

    int total = 0;
    int best_col = 0;
    for (int c = 0; c < votes32.cols; ++c) {
        const int count = votes32.at<int>(1, c);
        total += count;
        if (count > votes32.at<int>(1, best_col)) {
            best_col = c;
        }
    }

    if (total <= 0) {
        return scored;
    }

    scored.label_index = votes32.at<int>(0, best_col);
    scored.confidence = static_cast<float>(votes32.at<int>(1, best_col)) / static_cast<float>(total);
    return scored;
}

void forest_write(cv::FileStorage& fs, const ModelArtifact& artifact) {
    const ForestModel& model = std::get<ForestModel>(artifact.model);
    fs << "forest" << "{";
    model.forest->write(fs);
    fs << "}";
}

bool forest_read(const cv::FileNode& node, ModelArtifact& artifact, std::string& error) {
    cv::Ptr<cv::ml::RTrees> forest = cv::Algorithm::read<cv::ml::RTrees>(node["forest"]);
    if (!forest || !forest->isTrained()) {
        error = "model.forest is not a trained random forest";
        return false;
    }
    ForestModel model;
    model.forest = forest;
    artifact.model = std::move(model);
    return true;
}

bool forest_has_learners(const ModelArtifact& artifact) {
    const ForestModel* model = std::get_if<ForestModel>(&artifact.model);
    return model != nullptr && model->forest && model->forest->isTrained();
}

const ModelFamily SVM_FAMILY = {
    ModelKind::SVM, "svm",
    svm_fit, svm_predict, svm_write, svm_read, svm_has_learners
};

const ModelFamily FOREST_FAMILY = {
    ModelKind::RANDOM_FOREST, "random_forest",
    forest_fit, forest_predict, forest_write, forest_read, forest_has_learners
};

} // namespace

const ModelFamily& model_family(ModelKind kind) {
    switch (kind) {
        case ModelKind::RANDOM_FOREST:
            return FOREST_FAMILY;
        case ModelKind::SVM:
        default:
            return SVM_FAMILY;
    }
}

} // namespace gesture
} // namespace gest
