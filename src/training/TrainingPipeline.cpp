/**
 * @file TrainingPipeline.cpp
 * @brief Recording loop, stratified split, fitting and evaluation
 */

#include "gest/training/TrainingPipeline.hpp"
#include "gest/gesture/GestureClassifier.hpp"
#include "gest/core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <random>
#include <sstream>

namespace gest {
namespace training {

namespace {

constexpr float MIN_FEATURE_SCALE = 1e-6f;

std::string make_session_id(const std::string& label, int64_t started_ms) {
    return label + "-" + std::to_string(started_ms);
}

cv::Mat to_matrix(const std::vector<const Sample*>& samples, size_t length) {
    cv::Mat matrix(static_cast<int>(samples.size()), static_cast<int>(length), CV_32F);
    for (size_t r = 0; r < samples.size(); ++r) {
        float* row = matrix.ptr<float>(static_cast<int>(r));
        std::copy(samples[r]->features.begin(), samples[r]->features.end(), row);
    }
    return matrix;
}

} // namespace

std::string training_error_to_string(TrainingError error) {
    switch (error) {
        case TrainingError::INSUFFICIENT_LABELS: return "InsufficientLabels";
        case TrainingError::INSUFFICIENT_SAMPLES: return "InsufficientSamples";
        case TrainingError::INVALID_PARAMETER: return "InvalidParameter";
        case TrainingError::INCONSISTENT_FEATURES: return "InconsistentFeatures";
        case TrainingError::FIT_FAILED: return "FitFailed";
        default: return "Invalid";
    }
}

std::string recording_stop_to_string(RecordingStop stop) {
    switch (stop) {
        case RecordingStop::COMPLETED: return "Completed";
        case RecordingStop::CANCELLED: return "Cancelled";
        case RecordingStop::SOURCE_EXHAUSTED: return "SourceExhausted";
        case RecordingStop::ATTEMPTS_EXHAUSTED: return "AttemptsExhausted";
        case RecordingStop::STORE_FAILED: return "StoreFailed";
        case RecordingStop::INVALID_REQUEST: return "InvalidRequest";
        default: return "Invalid";
    }
}

std::string EvaluationReport::summary() const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    out << "accuracy " << accuracy << " (" << correct << "/" << total << ")";
    if (skipped > 0) {
        out << ", " << skipped << " skipped";
    }
    for (size_t i = 0; i < labels.size(); ++i) {
        out << "\n  " << std::left << std::setw(20) << labels[i]
            << " precision " << precision[i] << "  recall " << recall[i];
    }
    return out.str();
}

TrainingPipeline::TrainingPipeline(const TrainingConfig& config, std::shared_ptr<DatasetStore> store)
    : config_(config), store_(std::move(store)) {
}

// ============================================================================
// Recording
// ============================================================================

RecordingResult TrainingPipeline::record_session(const std::string& label, size_t sample_count,
                                                 FeatureSource& source, const core::StopSignal& stop) {
    RecordingResult result;

    if (!DatasetStore::is_storable_label(label) || sample_count == 0) {
        result.stop = RecordingStop::INVALID_REQUEST;
        result.message = "Recording needs a non-empty label without commas or quotes and a positive count";
        LOG_ERROR("TrainingPipeline: " + result.message);
        return result;
    }

    const size_t max_attempts = sample_count * static_cast<size_t>(std::max(1, config_.max_attempt_factor));
    const int64_t started_ms = core::wallClockMillis();
    const std::string session_id = make_session_id(label, started_ms);

    LOG_INFO("TrainingPipeline: recording " + std::to_string(sample_count) + " samples of '" + label +
             "' (session " + session_id + ", max " + std::to_string(max_attempts) + " attempts)");

    while (result.samples.size() < sample_count) {
        if (stop.stop_requested()) {
            result.stop = RecordingStop::CANCELLED;
            result.message = "Cancelled";
            break;
        }
        if (result.attempts >= max_attempts) {
            result.stop = RecordingStop::ATTEMPTS_EXHAUSTED;
            result.message = "Attempt limit reached after " + std::to_string(result.attempts) + " attempts";
            break;
        }

        result.attempts++;
        FeatureCapture capture = source.next();

        if (capture.status == FeatureCapture::Status::EXHAUSTED) {
            result.stop = RecordingStop::SOURCE_EXHAUSTED;
            result.message = capture.reason;
            break;
        }
        if (capture.status == FeatureCapture::Status::SKIPPED) {
            LOG_DEBUG("TrainingPipeline: attempt " + std::to_string(result.attempts) + " skipped: " + capture.reason);
            continue;
        }

        Sample sample;
        sample.features = std::move(capture.features);
        sample.label = label;
        sample.timestamp_ms = core::wallClockMillis();
        sample.session_id = session_id;

        if (store_ && !store_->append(sample)) {
            result.stop = RecordingStop::STORE_FAILED;
            result.message = store_->last_error();
            break;
        }

        result.samples.push_back(std::move(sample));
        if (result.samples.size() % 10 == 0 || result.samples.size() == sample_count) {
            LOG_INFO("TrainingPipeline: '" + label + "' " + std::to_string(result.samples.size()) +
                     "/" + std::to_string(sample_count));
        }
    }

    if (result.stop == RecordingStop::COMPLETED) {
        result.message = "Recorded " + std::to_string(result.samples.size()) + " samples";
        LOG_INFO("TrainingPipeline: " + result.message + " in " + std::to_string(result.attempts) + " attempts");
    } else {
        LOG_WARNING("TrainingPipeline: recording of '" + label + "' ended early (" +
                    recording_stop_to_string(result.stop) + "): " + result.message + ", kept " +
                    std::to_string(result.samples.size()) + " samples");
    }
    return result;
}

// ============================================================================
// Training
// ============================================================================

core::Result<TrainingOutcome, TrainingError> TrainingPipeline::train(const Dataset& dataset,
                                                                     gesture::ModelKind kind) const {
    return train(dataset, kind, config_.test_fraction);
}

core::Result<TrainingOutcome, TrainingError> TrainingPipeline::train(const Dataset& dataset,
                                                                     gesture::ModelKind kind,
                                                                     double test_fraction) const {
    using ResultType = core::Result<TrainingOutcome, TrainingError>;

    if (!(test_fraction >= 0.0 && test_fraction < 1.0)) {
        return ResultType::failure(TrainingError::INVALID_PARAMETER,
            "Test fraction " + std::to_string(test_fraction) + " outside [0, 1)");
    }

    const auto counts = dataset.label_counts();
    if (counts.size() < 2) {
        return ResultType::failure(TrainingError::INSUFFICIENT_LABELS,
            "Training needs at least 2 labels, dataset has " + std::to_string(counts.size()));
    }

    for (const auto& entry : counts) {
        if (entry.second < config_.min_samples_per_label) {
            return ResultType::failure(TrainingError::INSUFFICIENT_SAMPLES,
                "Label '" + entry.first + "' has " + std::to_string(entry.second) + " samples, minimum is " +
                std::to_string(config_.min_samples_per_label));
        }
    }

    const size_t feature_length = dataset.samples().front().features.size();
    for (const auto& sample : dataset.samples()) {
        if (sample.features.size() != feature_length || feature_length == 0) {
            return ResultType::failure(TrainingError::INCONSISTENT_FEATURES,
                "Sample of '" + sample.label + "' has " + std::to_string(sample.features.size()) +
                " features, expected " + std::to_string(feature_length));
        }
    }

    if (dataset.feature_config() && gesture::feature_length_for(dataset.feature_config()->layout) != feature_length) {
        return ResultType::failure(TrainingError::INCONSISTENT_FEATURES,
            "Samples have " + std::to_string(feature_length) + " features, recorded layout " +
            std::to_string(static_cast<int>(dataset.feature_config()->layout)) + " has " +
            std::to_string(gesture::feature_length_for(dataset.feature_config()->layout)));
    }

    // Label vocabulary in sorted order; index = class response
    std::vector<std::string> labels;
    std::map<std::string, int> label_index;
    for (const auto& entry : counts) {
        label_index[entry.first] = static_cast<int>(labels.size());
        labels.push_back(entry.first);
    }

    // Seeded stratified split, at least one training sample per label
    std::map<std::string, std::vector<const Sample*>> by_label;
    for (const auto& sample : dataset.samples()) {
        by_label[sample.label].push_back(&sample);
    }

    std::mt19937 rng(config_.seed);
    std::vector<const Sample*> train_set;
    std::vector<const Sample*> test_set;
    for (auto& entry : by_label) {
        auto& group = entry.second;
        std::shuffle(group.begin(), group.end(), rng);
        size_t held_out = static_cast<size_t>(std::floor(static_cast<double>(group.size()) * test_fraction));
        held_out = std::min(held_out, group.size() - 1);
        test_set.insert(test_set.end(), group.begin(), group.begin() + held_out);
        train_set.insert(train_set.end(), group.begin() + held_out, group.end());
    }

    LOG_INFO("TrainingPipeline: fitting " + gesture::model_kind_to_string(kind) + " on " +
             std::to_string(train_set.size()) + " samples, holding out " + std::to_string(test_set.size()) +
             " (" + std::to_string(labels.size()) + " labels, " + std::to_string(feature_length) + " features)");
    if (!dataset.feature_config()) {
        LOG_WARNING("TrainingPipeline: dataset records no feature settings, assuming " +
                    gesture::feature_config_to_string(config_.features));
    }

    cv::Mat samples = to_matrix(train_set, feature_length);
    cv::Mat responses(static_cast<int>(train_set.size()), 1, CV_32S);
    for (size_t r = 0; r < train_set.size(); ++r) {
        responses.at<int>(static_cast<int>(r), 0) = label_index.at(train_set[r]->label);
    }

    // Normalization statistics from the training split only
    cv::Mat mean;
    cv::Mat scale;
    cv::reduce(samples, mean, 0, cv::REDUCE_AVG, CV_32F);
    cv::Mat centered = samples - cv::repeat(mean, samples.rows, 1);
    cv::reduce(centered.mul(centered), scale, 0, cv::REDUCE_AVG, CV_32F);
    cv::sqrt(scale, scale);
    for (int c = 0; c < scale.cols; ++c) {
        if (!(scale.at<float>(0, c) >= MIN_FEATURE_SCALE)) {
            scale.at<float>(0, c) = 1.0f;
        }
    }
    cv::Mat normalized = centered / cv::repeat(scale, samples.rows, 1);

    auto artifact = std::make_shared<gesture::ModelArtifact>();
    artifact->kind = kind;
    artifact->created_at_ms = core::wallClockMillis();
    artifact->version = gesture::model_kind_to_string(kind) + "-" + std::to_string(artifact->created_at_ms);
    artifact->labels = labels;
    artifact->feature_length = feature_length;
    artifact->features = dataset.feature_config() ? *dataset.feature_config() : config_.features;
    artifact->feature_mean = mean;
    artifact->feature_scale = scale;

    const gesture::ModelFamily& family = gesture::model_family(kind);
    std::string error;
    bool fitted = false;
    try {
        fitted = family.fit(normalized, responses, static_cast<int>(labels.size()), config_.fit, *artifact, error);
    } catch (const cv::Exception& e) {
        error = e.what();
    }

    if (!fitted) {
        LOG_ERROR("TrainingPipeline: fit failed: " + error);
        return ResultType::failure(TrainingError::FIT_FAILED, error);
    }

    TrainingOutcome outcome;
    outcome.artifact = artifact;
    outcome.train_samples = train_set.size();
    outcome.test_samples = test_set.size();
    outcome.report = evaluate_samples(outcome.artifact, test_set);

    LOG_INFO("TrainingPipeline: trained " + artifact->version + ", held-out " + outcome.report.summary());
    return ResultType::success(std::move(outcome));
}

// ============================================================================
// Evaluation
// ============================================================================

EvaluationReport TrainingPipeline::evaluate(const gesture::ArtifactPtr& artifact, const Dataset& dataset) {
    std::vector<const Sample*> samples;
    samples.reserve(dataset.size());
    for (const auto& sample : dataset.samples()) {
        samples.push_back(&sample);
    }
    return evaluate_samples(artifact, samples);
}

EvaluationReport TrainingPipeline::evaluate_samples(const gesture::ArtifactPtr& artifact,
                                                    const std::vector<const Sample*>& samples) {
    EvaluationReport report;
    if (!artifact) {
        report.skipped = samples.size();
        return report;
    }

    report.labels = artifact->labels;
    const int n = static_cast<int>(report.labels.size());
    report.confusion = cv::Mat::zeros(n, n, CV_32S);
    report.precision.assign(n, 0.0);
    report.recall.assign(n, 0.0);

    gesture::GestureClassifier classifier;
    if (!classifier.load(artifact)) {
        report.skipped = samples.size();
        return report;
    }

    std::map<std::string, int> index;
    for (int i = 0; i < n; ++i) {
        index[report.labels[i]] = i;
    }

    for (const Sample* sample : samples) {
        auto truth = index.find(sample->label);
        auto prediction = classifier.predict(sample->features);
        if (truth == index.end() || !prediction) {
            report.skipped++;
            continue;
        }

        const int predicted = index.at(prediction.data.label);
        report.confusion.at<int>(truth->second, predicted)++;
        report.total++;
        if (predicted == truth->second) {
            report.correct++;
        }
    }

    report.accuracy = report.total > 0 ? static_cast<double>(report.correct) / report.total : 0.0;
    for (int k = 0; k < n; ++k) {
        const double hits = report.confusion.at<int>(k, k);
        const double predicted_k = cv::sum(report.confusion.col(k))[0];
        const double actual_k = cv::sum(report.confusion.row(k))[0];
        report.precision[k] = predicted_k > 0 ? hits / predicted_k : 0.0;
        report.recall[k] = actual_k > 0 ? hits / actual_k : 0.0;
    }

    return report;
}

} // namespace training
} // namespace gest
