/**
 * @file TrainingPipeline.hpp
 * @brief Supervised recording, model fitting and held-out evaluation
 */

#ifndef GEST_TRAINING_PIPELINE_HPP
#define GEST_TRAINING_PIPELINE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "gest/core/StopSignal.hpp"
#include "gest/core/types.hpp"
#include "gest/gesture/FeatureProcessor.hpp"
#include "gest/gesture/ModelArtifact.hpp"
#include "gest/gesture/ModelFamily.hpp"
#include "gest/training/Dataset.hpp"
#include "gest/training/FeatureSource.hpp"

namespace gest {
namespace training {

enum class TrainingError {
    INSUFFICIENT_LABELS,    ///< Fewer than two labels
    INSUFFICIENT_SAMPLES,   ///< A label is under the per-label minimum
    INVALID_PARAMETER,      ///< Test fraction or recording request out of range
    INCONSISTENT_FEATURES,  ///< Samples of different lengths
    FIT_FAILED              ///< Learner could not be fitted
};

std::string training_error_to_string(TrainingError error);

struct TrainingConfig {
    std::string dataset_path = "gest_dataset.csv";
    size_t min_samples_per_label = 10;
    double test_fraction = 0.2;
    int max_attempt_factor = 3;           ///< Recording attempts cap = count x factor
    uint32_t seed = 42;                   ///< Split seed; same seed gives the same split
    gesture::FeatureConfig features;      ///< Stamped into artifacts when the dataset records none
    gesture::FitParameters fit;
};

/**
 * @brief Accuracy, per-label precision and recall, confusion matrix
 */
struct EvaluationReport {
    std::vector<std::string> labels;      ///< Row/column order of the matrices
    size_t total = 0;                     ///< Scored samples
    size_t correct = 0;
    size_t skipped = 0;                   ///< Samples with labels outside the vocabulary or unscorable
    double accuracy = 0.0;
    std::vector<double> precision;
    std::vector<double> recall;
    cv::Mat confusion;                    ///< CV_32S, rows = true label, cols = predicted

    std::string summary() const;
};

enum class RecordingStop {
    COMPLETED,
    CANCELLED,
    SOURCE_EXHAUSTED,
    ATTEMPTS_EXHAUSTED,
    STORE_FAILED,
    INVALID_REQUEST
};

std::string recording_stop_to_string(RecordingStop stop);

struct RecordingResult {
    std::vector<Sample> samples;
    size_t attempts = 0;
    RecordingStop stop = RecordingStop::COMPLETED;
    std::string message;

    bool completed() const { return stop == RecordingStop::COMPLETED; }
};

struct TrainingOutcome {
    gesture::ArtifactPtr artifact;
    EvaluationReport report;
    size_t train_samples = 0;
    size_t test_samples = 0;
};

/**
 * @brief Records labeled sessions and fits classifier artifacts
 */
class TrainingPipeline {
public:
    /**
     * @param store Dataset file receiving recorded samples; may be null
     */
    explicit TrainingPipeline(const TrainingConfig& config,
                              std::shared_ptr<DatasetStore> store = nullptr);

    /**
     * @brief Collect sample_count vectors for one label
     *
     * Failed captures do not count. Attempts are capped at
     * sample_count x max_attempt_factor. The stop signal is checked before
     * every attempt. Each sample is appended to the store as it is captured.
     */
    RecordingResult record_session(const std::string& label, size_t sample_count,
                                   FeatureSource& source, const core::StopSignal& stop);

    /**
     * @brief Fit an artifact on a stratified split and evaluate it on the held-out part
     */
    core::Result<TrainingOutcome, TrainingError> train(const Dataset& dataset, gesture::ModelKind kind,
                                                       double test_fraction) const;

    /**
     * @brief Same as train() with the configured test fraction
     */
    core::Result<TrainingOutcome, TrainingError> train(const Dataset& dataset, gesture::ModelKind kind) const;

    /**
     * @brief Score an existing artifact against a dataset
     */
    static EvaluationReport evaluate(const gesture::ArtifactPtr& artifact, const Dataset& dataset);

    const TrainingConfig& config() const { return config_; }

private:
    static EvaluationReport evaluate_samples(const gesture::ArtifactPtr& artifact,
                                             const std::vector<const Sample*>& samples);

    TrainingConfig config_;
    std::shared_ptr<DatasetStore> store_;
};

} // namespace training
} // namespace gest

#endif // GEST_TRAINING_PIPELINE_HPP
