/**
 * @file RecognitionPipeline.cpp
 * @brief Live recognition loop
 */

#include "gest/gesture/RecognitionPipeline.hpp"
#include "gest/core/Logger.hpp"

#include <chrono>
#include <mutex>
#include <set>

namespace gest {
namespace gesture {

std::string run_exit_to_string(RunExit exit) {
    switch (exit) {
        case RunExit::STOPPED: return "Stopped";
        case RunExit::DEVICE_LOST: return "DeviceLost";
        case RunExit::NO_DEVICE: return "NoDevice";
        case RunExit::NO_MODEL_LOADED: return "NoModelLoaded";
        case RunExit::CONFIGURATION_ERROR: return "ConfigurationError";
        case RunExit::CAMERA_BUSY: return "CameraBusy";
        default: return "Invalid";
    }
}

class RecognitionPipeline::Impl {
public:
    Impl(camera::CameraManager& camera_, LandmarkSource& landmarks_, const FeatureProcessor& processor_,
         GestureClassifier& classifier_, StabilityFilter& stability_, action::ActionDispatcher& dispatcher_,
         int max_hands_)
        : camera(camera_), landmarks(landmarks_), processor(processor_), classifier(classifier_),
          stability(stability_), dispatcher(dispatcher_), max_hands(max_hands_ > 0 ? max_hands_ : 1) {}

    camera::CameraManager& camera;
    LandmarkSource& landmarks;
    const FeatureProcessor& processor;
    GestureClassifier& classifier;
    StabilityFilter& stability;
    action::ActionDispatcher& dispatcher;
    int max_hands;

    GestureEventCallback callback;

    mutable std::mutex stats_mutex;
    PipelineStats stats;

    void record_timing(double detection_ms, double total_ms) {
        std::lock_guard<std::mutex> lock(stats_mutex);
        const double n = static_cast<double>(stats.frames_processed);
        stats.avg_detection_ms = (stats.avg_detection_ms * n + detection_ms) / (n + 1.0);
        stats.avg_total_ms = (stats.avg_total_ms * n + total_ms) / (n + 1.0);
        stats.frames_processed++;
    }

    template<typename Fn>
    void update_stats(Fn fn) {
        std::lock_guard<std::mutex> lock(stats_mutex);
        fn(stats);
    }
};

RecognitionPipeline::RecognitionPipeline(camera::CameraManager& camera,
                                         LandmarkSource& landmarks,
                                         const FeatureProcessor& processor,
                                         GestureClassifier& classifier,
                                         StabilityFilter& stability,
                                         action::ActionDispatcher& dispatcher,
                                         int max_hands)
    : pImpl(std::make_unique<Impl>(camera, landmarks, processor, classifier, stability, dispatcher, max_hands))
{
}

RecognitionPipeline::~RecognitionPipeline() = default;

void RecognitionPipeline::set_event_callback(GestureEventCallback callback) {
    pImpl->callback = std::move(callback);
}

PipelineStats RecognitionPipeline::get_stats() const {
    std::lock_guard<std::mutex> lock(pImpl->stats_mutex);
    return pImpl->stats;
}

RunOutcome RecognitionPipeline::run(const core::StopSignal& stop) {
    RunOutcome outcome;

    auto lease = pImpl->camera.tryAcquire("recognition");
    if (!lease) {
        outcome.exit = RunExit::CAMERA_BUSY;
        outcome.message = "Camera held by " + pImpl->camera.getHolder();
        LOG_ERROR("RecognitionPipeline: " + outcome.message);
        return outcome;
    }

    ArtifactPtr artifact = pImpl->classifier.active_artifact();
    if (!artifact) {
        outcome.exit = RunExit::NO_MODEL_LOADED;
        outcome.message = "No model loaded";
        LOG_ERROR("RecognitionPipeline: " + outcome.message);
        return outcome;
    }
    if (artifact->feature_length != pImpl->processor.feature_length()) {
        outcome.exit = RunExit::CONFIGURATION_ERROR;
        outcome.message = "Model " + artifact->version + " expects " + std::to_string(artifact->feature_length) +
                          " features, processor produces " + std::to_string(pImpl->processor.feature_length());
        LOG_ERROR("RecognitionPipeline: " + outcome.message);
        return outcome;
    }
    if (artifact->features != pImpl->processor.config()) {
        outcome.exit = RunExit::CONFIGURATION_ERROR;
        outcome.message = "Model " + artifact->version + " was trained on " +
                          feature_config_to_string(artifact->features) + ", processor uses " +
                          feature_config_to_string(pImpl->processor.config());
        LOG_ERROR("RecognitionPipeline: " + outcome.message);
        return outcome;
    }

    auto opened = lease->camera().open();
    if (!opened) {
        outcome.exit = RunExit::NO_DEVICE;
        outcome.message = opened.message;
        LOG_ERROR("RecognitionPipeline: " + outcome.message);
        return outcome;
    }

    const bool owns_dispatcher = pImpl->dispatcher.start();
    const PipelineStats before = get_stats();

    LOG_INFO("RecognitionPipeline: running on " + opened.data + " with model " + artifact->version);

    while (!stop.stop_requested()) {
        auto frame = lease->camera().readFrame();
        if (frame) {
            process_frame(frame.data);
            continue;
        }

        const camera::CameraError error = *frame.error;
        if (error == camera::CameraError::TRANSIENT_READ_FAILURE) {
            pImpl->update_stats([](PipelineStats& s) { s.read_failures++; });
            continue;
        }

        outcome.exit = error == camera::CameraError::DEVICE_LOST ? RunExit::DEVICE_LOST : RunExit::NO_DEVICE;
        outcome.message = frame.message;
        LOG_ERROR("RecognitionPipeline: camera failure [" + camera::camera_error_to_string(error) + "]: " +
                  frame.message);
        break;
    }

    if (owns_dispatcher) {
        pImpl->dispatcher.stop();
    }

    const PipelineStats after = get_stats();
    outcome.frames = after.frames_processed - before.frames_processed;
    outcome.events = after.events - before.events;
    if (!outcome.is_error()) {
        outcome.message = "Stopped";
    }

    LOG_INFO("RecognitionPipeline: " + run_exit_to_string(outcome.exit) + " after " +
             std::to_string(outcome.frames) + " frames, " + std::to_string(outcome.events) + " events" +
             " (avg detection " + std::to_string(after.avg_detection_ms) + "ms, avg total " +
             std::to_string(after.avg_total_ms) + "ms)");
    return outcome;
}

std::vector<GestureEvent> RecognitionPipeline::process_frame(const camera::Frame& frame) {
    auto start = std::chrono::steady_clock::now();

    std::vector<LandmarkSet> hands = pImpl->landmarks.detect(frame);

    auto detected = std::chrono::steady_clock::now();
    const double detection_ms = std::chrono::duration<double, std::milli>(detected - start).count();

    std::vector<GestureEvent> events = process_landmarks(hands, frame.index, frame.timestamp);

    const double total_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    pImpl->record_timing(detection_ms, total_ms);

    if (frame.index <= 5 || frame.index % 50 == 0) {
        LOG_INFO("RecognitionPipeline: Frame #" + std::to_string(frame.index) + " hands=" +
                 std::to_string(hands.size()) + " detection=" + std::to_string(detection_ms) +
                 "ms total=" + std::to_string(total_ms) + "ms");
    }

    return events;
}

std::vector<GestureEvent> RecognitionPipeline::process_landmarks(const std::vector<LandmarkSet>& hands,
                                                                 uint64_t frame_index,
                                                                 core::Timestamp timestamp) {
    std::vector<GestureEvent> events;
    std::set<HandSide> seen;

    auto emit = [&](const std::optional<GestureEvent>& event) {
        if (!event) {
            return;
        }
        events.push_back(*event);
        pImpl->update_stats([](PipelineStats& s) { s.events++; });
        const action::DispatchOutcome dispatched = pImpl->dispatcher.dispatch(*event);
        LOG_DEBUG("RecognitionPipeline: event '" + event->label + "' " +
                  action::dispatch_outcome_to_string(dispatched));
        if (pImpl->callback) {
            pImpl->callback(*event);
        }
    };

    int considered = 0;
    for (const auto& hand : hands) {
        if (considered >= pImpl->max_hands) {
            break;
        }
        // One state machine per side; a second hand reported on the same side is ignored
        if (!seen.insert(hand.handedness).second) {
            continue;
        }
        considered++;
        pImpl->update_stats([](PipelineStats& s) { s.hands_detected++; });

        auto features = pImpl->processor.extract(hand);
        if (!features) {
            pImpl->update_stats([](PipelineStats& s) { s.feature_failures++; });
            LOG_TRACE("RecognitionPipeline: frame " + std::to_string(frame_index) + " features: " +
                      feature_error_to_string(*features.error));
            emit(pImpl->stability.update_no_gesture(hand.handedness, frame_index, timestamp));
            continue;
        }

        auto prediction = pImpl->classifier.predict(features.data);
        if (!prediction) {
            pImpl->update_stats([](PipelineStats& s) { s.prediction_failures++; });
            LOG_DEBUG("RecognitionPipeline: frame " + std::to_string(frame_index) + " prediction: " +
                      model_error_to_string(*prediction.error) + " " + prediction.message);
            emit(pImpl->stability.update_no_gesture(hand.handedness, frame_index, timestamp));
            continue;
        }

        LOG_TRACE("RecognitionPipeline: frame " + std::to_string(frame_index) + " " +
                  hand_side_to_string(hand.handedness) + " -> " + prediction.data.label + " (" +
                  std::to_string(prediction.data.confidence) + ")");
        emit(pImpl->stability.update(hand.handedness, prediction.data.label, prediction.data.confidence,
                                     frame_index, timestamp));
    }

    for (HandSide side : pImpl->stability.active_hands()) {
        if (seen.count(side) == 0) {
            emit(pImpl->stability.update_no_gesture(side, frame_index, timestamp));
        }
    }

    return events;
}

} // namespace gesture
} // namespace gest
