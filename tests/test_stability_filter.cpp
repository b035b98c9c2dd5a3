/**
 * @file test_stability_filter.cpp
 * @brief Unit tests for StabilityFilter
 *
 * Validates:
 * - Confirmation after min_streak contiguous frames
 * - Streak reset on label change, low confidence and missing hand
 * - Release after release_frames non-matching frames
 * - Independent state per hand
 * - No repeated event while a gesture is held (random streams)
 */

#include <gtest/gtest.h>
#include <gest/gesture/StabilityFilter.hpp>
#include <gest/core/Logger.hpp>

#include <algorithm>
#include <memory>
#include <random>
#include <vector>

using namespace gest::gesture;

class StabilityFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        gest::core::Logger::getInstance().setLevel(gest::core::LogLevel::WARNING);
        config_.confidence_threshold = 0.7f;
        config_.min_streak = 5;
        config_.release_frames = 3;
        filter_ = std::make_unique<StabilityFilter>(config_);
    }

    std::optional<GestureEvent> feed(const std::string& label, float confidence = 0.9f,
                                     HandSide hand = HandSide::RIGHT) {
        frame_++;
        return filter_->update(hand, label, confidence, frame_, gest::core::Clock::now());
    }

    std::optional<GestureEvent> feed_nothing(HandSide hand = HandSide::RIGHT) {
        frame_++;
        return filter_->update_no_gesture(hand, frame_, gest::core::Clock::now());
    }

    /**
     * @brief Feed the same label n times, returning the events produced
     */
    std::vector<GestureEvent> feed_run(const std::string& label, int n, float confidence = 0.9f) {
        std::vector<GestureEvent> events;
        for (int i = 0; i < n; ++i) {
            auto event = feed(label, confidence);
            if (event) {
                events.push_back(*event);
            }
        }
        return events;
    }

    StabilityConfig config_;
    std::unique_ptr<StabilityFilter> filter_;
    uint64_t frame_ = 0;
};

TEST_F(StabilityFilterTest, ConfirmsOnMinStreakFrame) {
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(feed("thumbs_up").has_value());
    }
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::CANDIDATE);
    EXPECT_EQ(filter_->status(HandSide::RIGHT).streak, 4);

    auto event = feed("thumbs_up", 0.85f);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->label, "thumbs_up");
    EXPECT_EQ(event->hand, HandSide::RIGHT);
    EXPECT_EQ(event->frame_index, 5u);
    EXPECT_FLOAT_EQ(event->confidence, 0.85f);
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::CONFIRMED);
}

TEST_F(StabilityFilterTest, HeldGestureEmitsOnce) {
    auto events = feed_run("fist", 100);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].frame_index, 5u);
}

TEST_F(StabilityFilterTest, LabelChangeRestartsStreak) {
    feed_run("fist", 4);
    EXPECT_FALSE(feed("open_palm").has_value());

    auto status = filter_->status(HandSide::RIGHT);
    EXPECT_EQ(status.state, HoldState::CANDIDATE);
    EXPECT_EQ(status.label, "open_palm");
    EXPECT_EQ(status.streak, 1);

    auto events = feed_run("open_palm", 4);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].label, "open_palm");
}

TEST_F(StabilityFilterTest, LowConfidenceCountsAsNoGesture) {
    feed_run("fist", 4);
    EXPECT_FALSE(feed("fist", 0.5f).has_value());
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::IDLE);

    // Exactly at the threshold counts
    auto events = feed_run("fist", 5, 0.7f);
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(StabilityFilterTest, MissingHandResetsCandidate) {
    feed_run("fist", 4);
    EXPECT_FALSE(feed_nothing().has_value());
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::IDLE);
    EXPECT_TRUE(feed_run("fist", 4).empty());
}

TEST_F(StabilityFilterTest, AlternatingLabelsNeverConfirm) {
    for (int i = 0; i < 50; ++i) {
        EXPECT_FALSE(feed(i % 2 == 0 ? "a" : "b").has_value());
    }
}

TEST_F(StabilityFilterTest, ReleaseRequiresConsecutiveMisses) {
    ASSERT_EQ(feed_run("fist", 5).size(), 1u);

    // Two misses, then the gesture returns: still the same hold
    feed_nothing();
    feed_nothing();
    EXPECT_EQ(filter_->status(HandSide::RIGHT).release_count, 2);
    EXPECT_FALSE(feed("fist").has_value());
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::CONFIRMED);
    EXPECT_EQ(filter_->status(HandSide::RIGHT).release_count, 0);
    EXPECT_TRUE(feed_run("fist", 20).empty());

    // Three misses release it; the gesture can then confirm again
    feed_nothing();
    feed_nothing();
    feed_nothing();
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::IDLE);

    auto events = feed_run("fist", 5);
    ASSERT_EQ(events.size(), 1u);
}

TEST_F(StabilityFilterTest, ReleasingFrameStartsNewCandidate) {
    ASSERT_EQ(feed_run("fist", 5).size(), 1u);

    feed("open_palm");
    feed("open_palm");
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::CONFIRMED);
    feed("open_palm");

    auto status = filter_->status(HandSide::RIGHT);
    EXPECT_EQ(status.state, HoldState::CANDIDATE);
    EXPECT_EQ(status.label, "open_palm");
    EXPECT_EQ(status.streak, 1);

    auto events = feed_run("open_palm", 4);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].label, "open_palm");
}

TEST_F(StabilityFilterTest, HandsTrackedIndependently) {
    feed_run("fist", 3);
    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(feed("open_palm", 0.9f, HandSide::LEFT).has_value());
    }

    // Right hand streak unaffected by the left hand
    feed("fist");
    auto right = feed("fist");
    ASSERT_TRUE(right.has_value());
    EXPECT_EQ(right->hand, HandSide::RIGHT);

    feed("open_palm", 0.9f, HandSide::LEFT);
    auto left = feed("open_palm", 0.9f, HandSide::LEFT);
    ASSERT_TRUE(left.has_value());
    EXPECT_EQ(left->hand, HandSide::LEFT);

    auto active = filter_->active_hands();
    EXPECT_EQ(active.size(), 2u);
}

TEST_F(StabilityFilterTest, ResetClearsAllHands) {
    feed_run("fist", 5);
    feed("open_palm", 0.9f, HandSide::LEFT);
    filter_->reset();

    EXPECT_TRUE(filter_->active_hands().empty());
    EXPECT_EQ(filter_->status(HandSide::RIGHT).state, HoldState::IDLE);
    EXPECT_EQ(feed_run("fist", 5).size(), 1u);
}

TEST_F(StabilityFilterTest, MinStreakOfOneConfirmsImmediately) {
    StabilityConfig config;
    config.min_streak = 1;
    config.release_frames = 1;
    StabilityFilter filter(config);

    auto now = gest::core::Clock::now();
    EXPECT_TRUE(filter.update(HandSide::RIGHT, "a", 0.9f, 1, now).has_value());
    EXPECT_FALSE(filter.update(HandSide::RIGHT, "a", 0.9f, 2, now).has_value());
    // Release and immediate confirmation of the new label on the same frame
    auto event = filter.update(HandSide::RIGHT, "b", 0.9f, 3, now);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->label, "b");
}

TEST_F(StabilityFilterTest, RandomStreamsRespectDebounce) {
    std::mt19937 rng(1234);
    const std::vector<std::string> labels = {"", "a", "b"};
    std::uniform_int_distribution<int> pick(0, 2);
    std::uniform_int_distribution<int> run_length(1, 8);
    std::uniform_real_distribution<float> confidence(0.5f, 1.0f);

    for (int trial = 0; trial < 20; ++trial) {
        StabilityFilter filter(config_);
        std::vector<std::string> effective;   // label after the confidence threshold
        std::vector<size_t> event_frames;
        std::vector<std::string> event_labels;

        while (effective.size() < 400) {
            const std::string label = labels[pick(rng)];
            const int n = run_length(rng);
            for (int i = 0; i < n; ++i) {
                const float conf = confidence(rng);
                const uint64_t frame = effective.size();
                effective.push_back(!label.empty() && conf >= config_.confidence_threshold ? label : "");
                auto event = filter.update(HandSide::RIGHT, label, conf, frame, gest::core::Clock::now());
                if (event) {
                    event_frames.push_back(frame);
                    event_labels.push_back(event->label);
                }
            }
        }

        for (size_t e = 0; e < event_frames.size(); ++e) {
            const size_t frame = event_frames[e];
            const std::string& label = event_labels[e];

            // Confirmed only after min_streak contiguous frames of the label
            ASSERT_GE(frame + 1, static_cast<size_t>(config_.min_streak));
            for (size_t f = frame + 1 - config_.min_streak; f <= frame; ++f) {
                EXPECT_EQ(effective[f], label) << "trial " << trial << " event at " << frame;
            }

            // Same label twice in a row needs a release in between
            if (e > 0 && event_labels[e - 1] == label) {
                int run = 0;
                int longest = 0;
                for (size_t f = event_frames[e - 1] + 1; f < frame; ++f) {
                    run = effective[f] != label ? run + 1 : 0;
                    longest = std::max(longest, run);
                }
                EXPECT_GE(longest, config_.release_frames) << "trial " << trial << " event at " << frame;
            }
        }
    }
}
