/**
 * @file test_training_pipeline.cpp
 * @brief Unit tests for TrainingPipeline
 *
 * Validates:
 * - Dataset validation (labels, per-label minimum, fraction, lengths)
 * - Seeded stratified split and normalization statistics
 * - Evaluation report contents
 * - Recording sessions against a scripted feature source
 * - Camera-backed feature source over a scripted device
 */

#include <gtest/gtest.h>
#include <gest/training/TrainingPipeline.hpp>
#include <gest/training/FeatureSource.hpp>
#include <gest/camera/CameraManager.hpp>
#include <gest/core/Logger.hpp>
#include "test_support.hpp"

#include <cstdio>
#include <deque>

using namespace gest::training;
using gest::gesture::ModelKind;
using gest::test::cluster_dataset;

/**
 * @brief Feature source replaying a fixed script of captures
 */
class ScriptedFeatureSource : public FeatureSource {
public:
    void add(FeatureCapture::Status status, gest::gesture::FeatureVector features = {}) {
        FeatureCapture capture;
        capture.status = status;
        capture.features = std::move(features);
        capture.reason = status == FeatureCapture::Status::OK ? "" : "scripted";
        script_.push_back(std::move(capture));
    }

    void set_fallback(FeatureCapture::Status status) { fallback_ = status; }

    FeatureCapture next() override {
        calls_++;
        if (script_.empty()) {
            FeatureCapture capture;
            capture.status = fallback_;
            capture.reason = "fallback";
            return capture;
        }
        FeatureCapture capture = std::move(script_.front());
        script_.pop_front();
        return capture;
    }

    size_t calls() const { return calls_; }

private:
    std::deque<FeatureCapture> script_;
    FeatureCapture::Status fallback_ = FeatureCapture::Status::EXHAUSTED;
    size_t calls_ = 0;
};

class TrainingPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        gest::core::Logger::getInstance().setLevel(gest::core::LogLevel::WARNING);
        config_.min_samples_per_label = 10;
        config_.test_fraction = 0.25;
        config_.seed = 42;
        config_.max_attempt_factor = 3;
        config_.fit.forest.trees = 30;
    }

    TrainingConfig config_;
};

TEST_F(TrainingPipelineTest, SingleLabelRejected) {
    TrainingPipeline pipeline(config_);
    auto result = pipeline.train(cluster_dataset({"fist"}, 30, 4), ModelKind::SVM);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*result.error, TrainingError::INSUFFICIENT_LABELS);

    result = pipeline.train(Dataset(), ModelKind::RANDOM_FOREST);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*result.error, TrainingError::INSUFFICIENT_LABELS);
}

TEST_F(TrainingPipelineTest, LabelUnderMinimumRejected) {
    Dataset dataset = cluster_dataset({"a", "b"}, 20, 4);
    Dataset sparse = cluster_dataset({"c"}, 9, 4);
    for (const auto& sample : sparse.samples()) {
        dataset.add(sample);
    }

    TrainingPipeline pipeline(config_);
    auto result = pipeline.train(dataset, ModelKind::SVM);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*result.error, TrainingError::INSUFFICIENT_SAMPLES);
    EXPECT_NE(result.message.find("'c'"), std::string::npos);
}

TEST_F(TrainingPipelineTest, TestFractionOutOfRange) {
    TrainingPipeline pipeline(config_);
    Dataset dataset = cluster_dataset({"a", "b"}, 20, 4);

    for (double fraction : {-0.1, 1.0, 1.5}) {
        auto result = pipeline.train(dataset, ModelKind::SVM, fraction);
        ASSERT_TRUE(result.hasError()) << fraction;
        EXPECT_EQ(*result.error, TrainingError::INVALID_PARAMETER);
    }
}

TEST_F(TrainingPipelineTest, MixedFeatureLengthsRejected) {
    Dataset dataset = cluster_dataset({"a", "b"}, 20, 4);
    Sample odd = dataset.samples().front();
    odd.features.push_back(1.0f);
    dataset.add(odd);

    TrainingPipeline pipeline(config_);
    auto result = pipeline.train(dataset, ModelKind::SVM);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(*result.error, TrainingError::INCONSISTENT_FEATURES);
}

TEST_F(TrainingPipelineTest, StratifiedSplitSizes) {
    TrainingPipeline pipeline(config_);
    auto result = pipeline.train(cluster_dataset({"c", "a", "b"}, 20, 4), ModelKind::SVM);
    ASSERT_TRUE(result.isSuccess()) << result.message;

    // floor(20 * 0.25) = 5 held out per label
    EXPECT_EQ(result.data.test_samples, 15u);
    EXPECT_EQ(result.data.train_samples, 45u);
    EXPECT_EQ(result.data.report.total + result.data.report.skipped, 15u);

    const std::vector<std::string> sorted = {"a", "b", "c"};
    EXPECT_EQ(result.data.artifact->labels, sorted);
    EXPECT_EQ(result.data.report.labels, sorted);
}

TEST_F(TrainingPipelineTest, KeepsOneTrainingSamplePerLabel) {
    config_.min_samples_per_label = 2;
    TrainingPipeline pipeline(config_);
    auto result = pipeline.train(cluster_dataset({"a", "b"}, 2, 4), ModelKind::SVM, 0.9);
    ASSERT_TRUE(result.isSuccess()) << result.message;

    // floor(2 * 0.9) = 1 held out, leaving 1 to train on
    EXPECT_EQ(result.data.train_samples, 2u);
    EXPECT_EQ(result.data.test_samples, 2u);
}

TEST_F(TrainingPipelineTest, SeparableClustersScoreWell) {
    for (ModelKind kind : {ModelKind::SVM, ModelKind::RANDOM_FOREST}) {
        TrainingPipeline pipeline(config_);
        auto result = pipeline.train(cluster_dataset({"a", "b", "c"}, 40, 6), kind);
        ASSERT_TRUE(result.isSuccess()) << result.message;

        const EvaluationReport& report = result.data.report;
        EXPECT_EQ(report.skipped, 0u);
        EXPECT_GE(report.accuracy, 0.95) << gest::gesture::model_kind_to_string(kind);
        ASSERT_EQ(report.precision.size(), 3u);
        ASSERT_EQ(report.recall.size(), 3u);
        EXPECT_EQ(report.confusion.rows, 3);
        EXPECT_EQ(report.confusion.cols, 3);
        EXPECT_EQ(static_cast<size_t>(cv::sum(report.confusion)[0]), report.total);
        EXPECT_EQ(static_cast<size_t>(cv::sum(report.confusion.diag())[0]), report.correct);
        EXPECT_EQ(result.data.artifact->kind, kind);
        EXPECT_EQ(result.data.artifact->version.rfind(gest::gesture::model_kind_to_string(kind) + "-", 0), 0u);
    }
}

TEST_F(TrainingPipelineTest, SameSeedSameSplit) {
    Dataset dataset = cluster_dataset({"a", "b"}, 30, 4);
    TrainingPipeline first(config_);
    TrainingPipeline second(config_);

    auto a = first.train(dataset, ModelKind::SVM);
    auto b = second.train(dataset, ModelKind::SVM);
    ASSERT_TRUE(a.isSuccess());
    ASSERT_TRUE(b.isSuccess());

    EXPECT_EQ(cv::norm(a.data.artifact->feature_mean, b.data.artifact->feature_mean, cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(a.data.artifact->feature_scale, b.data.artifact->feature_scale, cv::NORM_INF), 0.0);
    EXPECT_EQ(a.data.report.correct, b.data.report.correct);
}

TEST_F(TrainingPipelineTest, NormalizationFromTrainingSplit) {
    Dataset dataset = cluster_dataset({"a", "b"}, 20, 3);
    Dataset constant;
    for (Sample sample : dataset.samples()) {
        sample.features[2] = 5.0f;
        constant.add(std::move(sample));
    }

    TrainingPipeline pipeline(config_);
    auto result = pipeline.train(constant, ModelKind::SVM, 0.0);
    ASSERT_TRUE(result.isSuccess()) << result.message;

    const auto& artifact = *result.data.artifact;
    ASSERT_EQ(artifact.feature_mean.cols, 3);
    ASSERT_EQ(artifact.feature_scale.cols, 3);
    EXPECT_NEAR(artifact.feature_mean.at<float>(0, 0), 1.5f, 0.2f);
    EXPECT_FLOAT_EQ(artifact.feature_mean.at<float>(0, 2), 5.0f);
    EXPECT_FLOAT_EQ(artifact.feature_scale.at<float>(0, 2), 1.0f);
    EXPECT_GT(artifact.feature_scale.at<float>(0, 0), 1.0f);
}

TEST_F(TrainingPipelineTest, EvaluateSkipsUnknownLabels) {
    TrainingPipeline pipeline(config_);
    auto trained = pipeline.train(cluster_dataset({"a", "b"}, 20, 4), ModelKind::SVM);
    ASSERT_TRUE(trained.isSuccess());

    Dataset unseen = cluster_dataset({"a", "b", "zzz"}, 5, 4, 3);
    EvaluationReport report = TrainingPipeline::evaluate(trained.data.artifact, unseen);
    EXPECT_EQ(report.total, 10u);
    EXPECT_EQ(report.skipped, 5u);
    EXPECT_NE(report.summary().find("5 skipped"), std::string::npos);

    EvaluationReport empty = TrainingPipeline::evaluate(nullptr, unseen);
    EXPECT_EQ(empty.total, 0u);
    EXPECT_EQ(empty.skipped, 15u);
}

TEST_F(TrainingPipelineTest, RecordSessionPersistsSamples) {
    const std::string path = ::testing::TempDir() + "gest_recording.csv";
    std::remove(path.c_str());
    auto store = std::make_shared<DatasetStore>(path);
    TrainingPipeline pipeline(config_, store);

    ScriptedFeatureSource source;
    source.add(FeatureCapture::Status::OK, {1.0f, 2.0f});
    source.add(FeatureCapture::Status::SKIPPED);
    source.add(FeatureCapture::Status::OK, {3.0f, 4.0f});
    source.add(FeatureCapture::Status::SKIPPED);
    source.add(FeatureCapture::Status::OK, {5.0f, 6.0f});
    source.add(FeatureCapture::Status::OK, {7.0f, 8.0f});

    gest::core::StopSignal stop;
    RecordingResult result = pipeline.record_session("wave", 3, source, stop);

    EXPECT_TRUE(result.completed()) << result.message;
    EXPECT_EQ(result.samples.size(), 3u);
    EXPECT_EQ(result.attempts, 5u);
    EXPECT_EQ(source.calls(), 5u);
    for (const auto& sample : result.samples) {
        EXPECT_EQ(sample.label, "wave");
        EXPECT_EQ(sample.session_id, result.samples.front().session_id);
        EXPECT_EQ(sample.session_id.rfind("wave-", 0), 0u);
    }

    Dataset loaded;
    ASSERT_TRUE(DatasetStore(path).load(loaded));
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_FLOAT_EQ(loaded.samples()[2].features[1], 6.0f);
    std::remove(path.c_str());
}

TEST_F(TrainingPipelineTest, RecordSessionAttemptLimit) {
    TrainingPipeline pipeline(config_);
    ScriptedFeatureSource source;
    source.add(FeatureCapture::Status::OK, {1.0f});
    source.set_fallback(FeatureCapture::Status::SKIPPED);

    gest::core::StopSignal stop;
    RecordingResult result = pipeline.record_session("wave", 4, source, stop);

    EXPECT_EQ(result.stop, RecordingStop::ATTEMPTS_EXHAUSTED);
    EXPECT_EQ(result.attempts, 12u);
    EXPECT_EQ(result.samples.size(), 1u);
}

TEST_F(TrainingPipelineTest, RecordSessionSourceExhausted) {
    TrainingPipeline pipeline(config_);
    ScriptedFeatureSource source;
    source.add(FeatureCapture::Status::OK, {1.0f});
    source.add(FeatureCapture::Status::OK, {2.0f});

    gest::core::StopSignal stop;
    RecordingResult result = pipeline.record_session("wave", 5, source, stop);

    EXPECT_EQ(result.stop, RecordingStop::SOURCE_EXHAUSTED);
    EXPECT_EQ(result.samples.size(), 2u);
}

TEST_F(TrainingPipelineTest, RecordSessionCancelled) {
    TrainingPipeline pipeline(config_);
    ScriptedFeatureSource source;
    source.set_fallback(FeatureCapture::Status::OK);

    gest::core::StopSignal stop;
    stop.request_stop();
    RecordingResult result = pipeline.record_session("wave", 5, source, stop);

    EXPECT_EQ(result.stop, RecordingStop::CANCELLED);
    EXPECT_TRUE(result.samples.empty());
    EXPECT_EQ(source.calls(), 0u);
}

TEST_F(TrainingPipelineTest, RecordSessionRejectsBadRequests) {
    TrainingPipeline pipeline(config_);
    ScriptedFeatureSource source;
    gest::core::StopSignal stop;

    EXPECT_EQ(pipeline.record_session("", 5, source, stop).stop, RecordingStop::INVALID_REQUEST);
    EXPECT_EQ(pipeline.record_session("a,b", 5, source, stop).stop, RecordingStop::INVALID_REQUEST);
    EXPECT_EQ(pipeline.record_session("wave", 0, source, stop).stop, RecordingStop::INVALID_REQUEST);
    EXPECT_EQ(source.calls(), 0u);
}

TEST_F(TrainingPipelineTest, CameraFeatureSourceStages) {
    auto script = std::make_shared<gest::test::DeviceScript>();
    script->available = {"cam"};

    gest::camera::CameraConfig camera_config;
    camera_config.devices = {"cam"};
    gest::camera::CameraManager camera(gest::test::scripted_factory(script));
    camera.configure(camera_config);
    ASSERT_TRUE(camera.open().isSuccess());

    gest::test::ScriptedLandmarkSource landmarks;
    gest::gesture::LandmarkSet partial = gest::test::make_hand(gest::test::Pose::OPEN_PALM);
    partial.points.resize(5);
    landmarks.push({});
    landmarks.push({gest::test::make_hand(gest::test::Pose::OPEN_PALM)});
    landmarks.push({partial});

    gest::gesture::FeatureProcessor processor;
    CameraFeatureSource source(camera, landmarks, processor);

    // No hand, then a usable hand, then too few landmarks
    EXPECT_EQ(source.next().status, FeatureCapture::Status::SKIPPED);
    FeatureCapture usable = source.next();
    ASSERT_EQ(usable.status, FeatureCapture::Status::OK);
    EXPECT_EQ(usable.features.size(), processor.feature_length());
    EXPECT_EQ(source.next().status, FeatureCapture::Status::SKIPPED);

    // Single read failure stays below the recovery threshold
    {
        std::lock_guard<std::mutex> lock(script->mutex);
        script->reads_fail = true;
    }
    EXPECT_EQ(source.next().status, FeatureCapture::Status::SKIPPED);
    EXPECT_EQ(landmarks.calls(), 3u);

    camera.close();
    EXPECT_EQ(source.next().status, FeatureCapture::Status::EXHAUSTED);
}
