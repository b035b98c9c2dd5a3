/**
 * @file StabilityFilter.cpp
 * @brief Debounce state machine
 */

#include "gest/gesture/StabilityFilter.hpp"
#include "gest/core/Logger.hpp"

namespace gest {
namespace gesture {

std::string hold_state_to_string(HoldState state) {
    switch (state) {
        case HoldState::IDLE: return "Idle";
        case HoldState::CANDIDATE: return "Candidate";
        case HoldState::CONFIRMED: return "Confirmed";
        default: return "Invalid";
    }
}

StabilityFilter::StabilityFilter(const StabilityConfig& config)
    : config_(config) {
}

std::optional<GestureEvent> StabilityFilter::update(HandSide hand, const std::string& label, float confidence,
                                                    uint64_t frame_index, core::Timestamp timestamp) {
    const bool is_gesture = !label.empty() && confidence >= config_.confidence_threshold;
    HoldStatus& hold = holds_[hand];

    if (hold.state == HoldState::CONFIRMED) {
        if (is_gesture && label == hold.label) {
            hold.release_count = 0;
            return std::nullopt;
        }

        hold.release_count++;
        if (hold.release_count < config_.release_frames) {
            return std::nullopt;
        }

        LOG_DEBUG("StabilityFilter: " + hand_side_to_string(hand) + " released '" + hold.label +
                  "' at frame " + std::to_string(frame_index));
        hold = HoldStatus{};
        // Releasing frame is evaluated again from IDLE
    }

    return advance(hold, hand, is_gesture ? label : std::string(), confidence, frame_index, timestamp);
}

std::optional<GestureEvent> StabilityFilter::update_no_gesture(HandSide hand, uint64_t frame_index,
                                                               core::Timestamp timestamp) {
    return update(hand, std::string(), 0.0f, frame_index, timestamp);
}

std::optional<GestureEvent> StabilityFilter::advance(HoldStatus& hold, HandSide hand, const std::string& label,
                                                     float confidence, uint64_t frame_index,
                                                     core::Timestamp timestamp) {
    if (label.empty()) {
        hold = HoldStatus{};
        return std::nullopt;
    }

    if (hold.state == HoldState::CANDIDATE && hold.label == label) {
        hold.streak++;
    } else {
        hold.state = HoldState::CANDIDATE;
        hold.label = label;
        hold.streak = 1;
        hold.release_count = 0;
    }

    if (hold.streak < config_.min_streak) {
        return std::nullopt;
    }

    hold.state = HoldState::CONFIRMED;
    hold.release_count = 0;

    GestureEvent event;
    event.label = label;
    event.hand = hand;
    event.confidence = confidence;
    event.frame_index = frame_index;
    event.timestamp = timestamp;

    LOG_INFO("StabilityFilter: " + hand_side_to_string(hand) + " confirmed '" + label +
             "' at frame " + std::to_string(frame_index) + " (streak " + std::to_string(hold.streak) + ")");
    return event;
}

HoldStatus StabilityFilter::status(HandSide hand) const {
    auto it = holds_.find(hand);
    return it == holds_.end() ? HoldStatus{} : it->second;
}

std::vector<HandSide> StabilityFilter::active_hands() const {
    std::vector<HandSide> hands;
    for (const auto& entry : holds_) {
        if (entry.second.state != HoldState::IDLE) {
            hands.push_back(entry.first);
        }
    }
    return hands;
}

void StabilityFilter::reset() {
    holds_.clear();
}

} // namespace gesture
} // namespace gest
