/**
 * @file RecognitionPipeline.hpp
 * @brief Live loop: camera, landmarks, features, classifier, stability, actions
 *
 * One worker runs the whole chain frame by frame. It only blocks in the
 * camera read (bounded by the read timeout) and checks the stop signal once
 * per iteration. Actions run on the dispatcher's own thread.
 */

#ifndef GEST_GESTURE_RECOGNITION_PIPELINE_HPP
#define GEST_GESTURE_RECOGNITION_PIPELINE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "gest/action/ActionDispatcher.hpp"
#include "gest/camera/CameraManager.hpp"
#include "gest/core/StopSignal.hpp"
#include "gest/gesture/FeatureProcessor.hpp"
#include "gest/gesture/GestureClassifier.hpp"
#include "gest/gesture/GestureTypes.hpp"
#include "gest/gesture/LandmarkSource.hpp"
#include "gest/gesture/StabilityFilter.hpp"

namespace gest {
namespace gesture {

/**
 * @brief Why run() returned
 */
enum class RunExit {
    STOPPED,              ///< Stop signal observed
    DEVICE_LOST,          ///< Camera recovery exhausted
    NO_DEVICE,            ///< No camera candidate could be opened
    NO_MODEL_LOADED,      ///< Classifier has no artifact
    CONFIGURATION_ERROR,  ///< Artifact and feature processor disagree on length or extraction settings
    CAMERA_BUSY           ///< Camera held by another session
};

std::string run_exit_to_string(RunExit exit);

struct RunOutcome {
    RunExit exit = RunExit::STOPPED;
    std::string message;
    uint64_t frames = 0;
    uint64_t events = 0;

    bool is_error() const { return exit != RunExit::STOPPED; }
};

struct PipelineStats {
    uint64_t frames_processed = 0;
    uint64_t read_failures = 0;
    uint64_t hands_detected = 0;
    uint64_t feature_failures = 0;
    uint64_t prediction_failures = 0;
    uint64_t events = 0;
    double avg_detection_ms = 0.0;
    double avg_total_ms = 0.0;
};

class RecognitionPipeline {
public:
    /**
     * @param max_hands Hands considered per frame; extra detections are ignored
     */
    RecognitionPipeline(camera::CameraManager& camera,
                        LandmarkSource& landmarks,
                        const FeatureProcessor& processor,
                        GestureClassifier& classifier,
                        StabilityFilter& stability,
                        action::ActionDispatcher& dispatcher,
                        int max_hands = 1);

    ~RecognitionPipeline();

    /**
     * @brief Run the live loop until stopped or a structural error occurs
     *
     * Holds the camera lease for the whole run and starts the dispatcher if
     * it is not running yet (stopping it again on return).
     */
    RunOutcome run(const core::StopSignal& stop);

    /**
     * @brief One frame through detection and the downstream stages
     * @return Events confirmed on this frame
     */
    std::vector<GestureEvent> process_frame(const camera::Frame& frame);

    /**
     * @brief Downstream stages for already detected hands
     *
     * Hands tracked by the stability filter but absent here are fed a
     * "no gesture" frame.
     */
    std::vector<GestureEvent> process_landmarks(const std::vector<LandmarkSet>& hands,
                                                uint64_t frame_index, core::Timestamp timestamp);

    /**
     * @brief Observer called for every confirmed event (on the loop thread)
     */
    void set_event_callback(GestureEventCallback callback);

    PipelineStats get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;

    RecognitionPipeline(const RecognitionPipeline&) = delete;
    RecognitionPipeline& operator=(const RecognitionPipeline&) = delete;
};

} // namespace gesture
} // namespace gest

#endif // GEST_GESTURE_RECOGNITION_PIPELINE_HPP
