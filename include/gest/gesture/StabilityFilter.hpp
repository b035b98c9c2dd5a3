/**
 * @file StabilityFilter.hpp
 * @brief Per-hand debounce of per-frame predictions into gesture events
 */

#ifndef GEST_GESTURE_STABILITY_FILTER_HPP
#define GEST_GESTURE_STABILITY_FILTER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "gest/core/types.hpp"
#include "gest/gesture/GestureTypes.hpp"

namespace gest {
namespace gesture {

/**
 * @brief Debounce tunables
 */
struct StabilityConfig {
    float confidence_threshold = 0.7f;  ///< Below this a prediction counts as no gesture
    int min_streak = 5;                 ///< Contiguous frames needed to confirm
    int release_frames = 3;             ///< Non-matching frames needed to release a confirmed gesture

    bool is_valid() const {
        return confidence_threshold >= 0.0f && confidence_threshold <= 1.0f &&
               min_streak >= 1 && release_frames >= 1;
    }
};

enum class HoldState {
    IDLE,
    CANDIDATE,
    CONFIRMED
};

/**
 * @brief Snapshot of one hand's hold state
 */
struct HoldStatus {
    HoldState state = HoldState::IDLE;
    std::string label;       ///< Candidate or confirmed label, empty when idle
    int streak = 0;          ///< Contiguous frames of the candidate
    int release_count = 0;   ///< Non-matching frames seen while confirmed
};

std::string hold_state_to_string(HoldState state);

/**
 * @brief Edge-triggered debounce, one state machine per hand
 *
 * IDLE -> CANDIDATE(label, streak) -> CONFIRMED(label) -> IDLE
 *
 * Exactly one event is emitted per hold, on the frame where the candidate
 * streak reaches min_streak. The filter is frame-indexed: only the order of
 * update() calls matters, never wall time.
 */
class StabilityFilter {
public:
    explicit StabilityFilter(const StabilityConfig& config = StabilityConfig());

    /**
     * @brief Feed one frame's prediction for a hand
     * @param label Predicted label, empty for no gesture
     * @param confidence Prediction confidence; below threshold means no gesture
     * @return The gesture event if this frame confirmed a hold
     */
    std::optional<GestureEvent> update(HandSide hand, const std::string& label, float confidence,
                                       uint64_t frame_index, core::Timestamp timestamp);

    /**
     * @brief Feed a frame in which the hand produced no usable prediction
     */
    std::optional<GestureEvent> update_no_gesture(HandSide hand, uint64_t frame_index,
                                                  core::Timestamp timestamp);

    HoldStatus status(HandSide hand) const;

    /**
     * @brief Hands whose state is not IDLE
     */
    std::vector<HandSide> active_hands() const;

    void reset();

    const StabilityConfig& config() const { return config_; }

private:
    std::optional<GestureEvent> advance(HoldStatus& hold, HandSide hand, const std::string& label,
                                        float confidence, uint64_t frame_index,
                                        core::Timestamp timestamp);

    StabilityConfig config_;
    std::map<HandSide, HoldStatus> holds_;
};

} // namespace gesture
} // namespace gest

#endif // GEST_GESTURE_STABILITY_FILTER_HPP
