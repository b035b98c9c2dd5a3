/**
 * @file test_support.hpp
 * @brief Synthetic hands, datasets and mocks shared by the unit tests
 */

#ifndef GEST_TESTS_TEST_SUPPORT_HPP
#define GEST_TESTS_TEST_SUPPORT_HPP

#include <gest/camera/CaptureDevice.hpp>
#include <gest/gesture/GestureTypes.hpp>
#include <gest/gesture/LandmarkSource.hpp>
#include <gest/training/Dataset.hpp>

#include <atomic>
#include <cmath>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace gest {
namespace test {

enum class Pose {
    OPEN_PALM,   ///< All fingers extended upward
    FIST         ///< All fingers curled toward the palm
};

/**
 * @brief 21 landmarks of an upright hand with the wrist at the origin
 *
 * Image convention: y grows downward, so extended fingers have negative y.
 * The middle MCP sits at (0, -0.1, 0).
 */
inline std::vector<cv::Point3f> canonical_hand(Pose pose) {
    std::vector<cv::Point3f> points(gesture::NUM_HAND_LANDMARKS);
    points[gesture::landmark::WRIST] = cv::Point3f(0.0f, 0.0f, 0.0f);

    for (int finger = 0; finger < 5; ++finger) {
        const float x = (finger - 2) * 0.04f;
        const int base = 1 + finger * 4;
        const cv::Point3f knuckle(x, -0.1f, 0.0f);
        points[base] = knuckle;
        for (int joint = 1; joint < 4; ++joint) {
            if (pose == Pose::OPEN_PALM) {
                points[base + joint] = knuckle + cv::Point3f(0.0f, -0.03f * joint, 0.0f);
            } else {
                // Curl: up, forward, then back down toward the palm
                static const cv::Point3f curl[3] = {
                    cv::Point3f(0.0f, -0.03f, -0.01f),
                    cv::Point3f(0.0f, -0.02f, -0.04f),
                    cv::Point3f(0.0f, 0.01f, -0.05f)
                };
                points[base + joint] = knuckle + curl[joint - 1];
            }
        }
    }
    return points;
}

/**
 * @brief Canonical hand scaled, rotated in the image plane and moved
 */
inline gesture::LandmarkSet make_hand(Pose pose,
                                      gesture::HandSide side = gesture::HandSide::RIGHT,
                                      cv::Point3f offset = cv::Point3f(0.5f, 0.7f, 0.0f),
                                      float scale = 1.0f,
                                      float rotation_rad = 0.0f) {
    gesture::LandmarkSet hand;
    hand.handedness = side;
    hand.confidence = 0.95f;

    const float c = std::cos(rotation_rad);
    const float s = std::sin(rotation_rad);
    for (const auto& p : canonical_hand(pose)) {
        const cv::Point3f rotated(p.x * c - p.y * s, p.x * s + p.y * c, p.z);
        hand.points.push_back(offset + rotated * scale);
    }
    return hand;
}

/**
 * @brief Jitter every coordinate by uniform noise in [-amplitude, amplitude]
 */
inline gesture::LandmarkSet jitter(gesture::LandmarkSet hand, std::mt19937& rng, float amplitude) {
    std::uniform_real_distribution<float> noise(-amplitude, amplitude);
    for (auto& p : hand.points) {
        p.x += noise(rng);
        p.y += noise(rng);
        p.z += noise(rng);
    }
    return hand;
}

/**
 * @brief Gaussian clusters, one per label, centered at (3 * i, ..., 3 * i)
 */
inline training::Dataset cluster_dataset(const std::vector<std::string>& labels, size_t per_label,
                                         size_t length, uint32_t seed = 7) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, 0.3f);

    training::Dataset dataset;
    for (size_t i = 0; i < labels.size(); ++i) {
        for (size_t n = 0; n < per_label; ++n) {
            training::Sample sample;
            sample.label = labels[i];
            sample.session_id = labels[i] + "-test";
            sample.timestamp_ms = static_cast<int64_t>(1000 + n);
            for (size_t f = 0; f < length; ++f) {
                sample.features.push_back(3.0f * static_cast<float>(i) + noise(rng));
            }
            dataset.add(std::move(sample));
        }
    }
    return dataset;
}

inline gesture::FeatureVector cluster_center(size_t label_index, size_t length) {
    return gesture::FeatureVector(length, 3.0f * static_cast<float>(label_index));
}

/**
 * @brief Scripted capture device shared with the test through DeviceScript
 */
struct DeviceScript {
    std::mutex mutex;
    std::set<std::string> available;      ///< Device ids that open successfully
    bool reads_fail = false;
    int max_opens = -1;                   ///< Successful opens allowed, -1 for unlimited
    int opens = 0;
    int releases = 0;
    std::vector<std::string> open_requests;
};

class ScriptedCaptureDevice : public camera::CaptureDevice {
public:
    explicit ScriptedCaptureDevice(std::shared_ptr<DeviceScript> script)
        : script_(std::move(script)) {}

    ~ScriptedCaptureDevice() override {
        if (open_) {
            release();
        }
    }

    bool open(const std::string& deviceId, const camera::CameraConfig& format) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        script_->open_requests.push_back(deviceId);
        if (script_->available.count(deviceId) == 0 ||
            (script_->max_opens >= 0 && script_->opens >= script_->max_opens)) {
            lastError_ = "no such device";
            return false;
        }
        script_->opens++;
        width_ = format.width;
        height_ = format.height;
        open_ = true;
        return true;
    }

    bool read(cv::Mat& image) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (!open_ || script_->reads_fail) {
            lastError_ = "read failed";
            return false;
        }
        image = cv::Mat(height_, width_, CV_8UC3, cv::Scalar(10, 20, 30));
        return true;
    }

    void release() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (open_) {
            script_->releases++;
        }
        open_ = false;
    }

    bool isOpen() const override { return open_; }

    std::string getLastError() const override { return lastError_; }

private:
    std::shared_ptr<DeviceScript> script_;
    bool open_ = false;
    int width_ = 0;
    int height_ = 0;
    std::string lastError_;
};

inline camera::CaptureDeviceFactory scripted_factory(const std::shared_ptr<DeviceScript>& script) {
    return [script]() { return std::unique_ptr<camera::CaptureDevice>(new ScriptedCaptureDevice(script)); };
}

/**
 * @brief Landmark source replaying a queue of per-frame detections
 *
 * Frames past the end of the queue report no hand.
 */
class ScriptedLandmarkSource : public gesture::LandmarkSource {
public:
    void push(std::vector<gesture::LandmarkSet> hands) {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(std::move(hands));
    }

    std::vector<gesture::LandmarkSet> detect(const camera::Frame&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_++;
        if (frames_.empty()) {
            return {};
        }
        auto hands = std::move(frames_.front());
        frames_.pop_front();
        return hands;
    }

    size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::vector<gesture::LandmarkSet>> frames_;
    size_t calls_ = 0;
};

} // namespace test
} // namespace gest

#endif // GEST_TESTS_TEST_SUPPORT_HPP
