/**
 * @file MediaPipeLandmarkSource.cpp
 * @brief MediaPipe Hands landmark source using pybind11
 */

#include "gest/gesture/MediaPipeLandmarkSource.hpp"
#include "gest/core/Logger.hpp"
#include "gest/core/exception.h"
#include <pybind11/embed.h>
#include <pybind11/numpy.h>
#include <opencv2/imgproc.hpp>
#include <mutex>

namespace py = pybind11;
using namespace pybind11::literals;

namespace gest {
namespace gesture {

class MediaPipeLandmarkSource::Impl {
public:
    /**
     * @brief Process-wide Python interpreter
     *
     * The GIL is released right after start-up so detect() may run on the
     * recognition worker thread; every Python call takes it back with
     * gil_scoped_acquire. Static destruction re-acquires before finalizing.
     */
    static void ensureInterpreter() {
        static py::scoped_interpreter guard{};
        static py::gil_scoped_release release{};
    }

    explicit Impl(const DetectionConfig& config)
        : config_(config)
    {
        LOG_INFO("MediaPipeLandmarkSource: Initializing...");

        ensureInterpreter();
        py::gil_scoped_acquire gil;

        try {
            py::module_ sys = py::module_::import("sys");
            LOG_DEBUG("MediaPipeLandmarkSource: Python " + sys.attr("version").cast<std::string>());

            py::module_ mp = py::module_::import("mediapipe");
            LOG_INFO("MediaPipeLandmarkSource: mediapipe " + mp.attr("__version__").cast<std::string>());

            py::object hands_cls = mp.attr("solutions").attr("hands").attr("Hands");
            hands_ = hands_cls(
                "static_image_mode"_a = false,
                "max_num_hands"_a = config.max_hands,
                "model_complexity"_a = config.model_complexity,
                "min_detection_confidence"_a = config.min_detection_confidence,
                "min_tracking_confidence"_a = config.min_tracking_confidence
            );
        } catch (const py::error_already_set& e) {
            hands_ = py::object();
            GEST_THROW(core::DetectorException, std::string("mediapipe initialization failed: ") + e.what());
        }

        LOG_INFO("MediaPipeLandmarkSource: Hands ready (max_hands=" +
                 std::to_string(config.max_hands) + ", complexity=" +
                 std::to_string(config.model_complexity) + ")");
    }

    ~Impl() {
        py::gil_scoped_acquire gil;
        try {
            if (hands_ && !hands_.is_none()) {
                hands_.attr("close")();
            }
        } catch (const py::error_already_set& e) {
            LOG_WARNING(std::string("MediaPipeLandmarkSource: close failed: ") + e.what());
        }
        hands_ = py::object();
    }

    std::vector<LandmarkSet> detect(const camera::Frame& frame) {
        std::vector<LandmarkSet> hands;
        if (frame.empty()) {
            setError("Empty input frame");
            return hands;
        }

        cv::Mat rgb;
        if (frame.channels() == 3) {
            cv::cvtColor(frame.image, rgb, cv::COLOR_BGR2RGB);
        } else if (frame.channels() == 1) {
            cv::cvtColor(frame.image, rgb, cv::COLOR_GRAY2RGB);
        } else if (frame.channels() == 4) {
            cv::cvtColor(frame.image, rgb, cv::COLOR_BGRA2RGB);
        } else {
            setError("Unsupported channel count " + std::to_string(frame.channels()));
            return hands;
        }

        py::gil_scoped_acquire gil;
        try {
            // No base object: pybind11 copies the pixels into numpy-owned memory
            py::array_t<uint8_t> image({rgb.rows, rgb.cols, 3}, rgb.data);

            py::object results = hands_.attr("process")(image);
            py::object multi_landmarks = results.attr("multi_hand_landmarks");
            py::object multi_handedness = results.attr("multi_handedness");
            if (multi_landmarks.is_none()) {
                return hands;
            }

            py::list landmark_list = multi_landmarks.cast<py::list>();
            py::list handedness_list = multi_handedness.is_none() ? py::list() : multi_handedness.cast<py::list>();

            for (size_t i = 0; i < py::len(landmark_list); ++i) {
                LandmarkSet set;
                for (auto lm : landmark_list[i].attr("landmark")) {
                    set.points.emplace_back(lm.attr("x").cast<float>(),
                                            lm.attr("y").cast<float>(),
                                            lm.attr("z").cast<float>());
                }

                if (i < py::len(handedness_list)) {
                    py::object classification = handedness_list[i].attr("classification")[py::int_(0)];
                    std::string label = classification.attr("label").cast<std::string>();
                    set.handedness = label == "Left" ? HandSide::LEFT
                                   : label == "Right" ? HandSide::RIGHT
                                   : HandSide::UNKNOWN;
                    set.confidence = classification.attr("score").cast<float>();
                }

                hands.push_back(std::move(set));
                if (static_cast<int>(hands.size()) >= config_.max_hands) {
                    break;
                }
            }
        } catch (const py::error_already_set& e) {
            setError(std::string("Python error in detect(): ") + e.what());
            LOG_ERROR("MediaPipeLandmarkSource: " + getLastError());
            hands.clear();
        } catch (const py::cast_error& e) {
            setError(std::string("Unexpected mediapipe result: ") + e.what());
            LOG_ERROR("MediaPipeLandmarkSource: " + getLastError());
            hands.clear();
        }

        return hands;
    }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(errorMutex_);
        return last_error_;
    }

private:
    void setError(const std::string& message) {
        std::lock_guard<std::mutex> lock(errorMutex_);
        last_error_ = message;
    }

    DetectionConfig config_;
    py::object hands_;              ///< mediapipe.solutions.hands.Hands instance
    mutable std::mutex errorMutex_;
    std::string last_error_;
};

// ============================================================================
// MediaPipeLandmarkSource Public API Implementation
// ============================================================================

MediaPipeLandmarkSource::MediaPipeLandmarkSource(const DetectionConfig& config)
    : pImpl(std::make_unique<Impl>(config))
{
}

MediaPipeLandmarkSource::~MediaPipeLandmarkSource() = default;

std::vector<LandmarkSet> MediaPipeLandmarkSource::detect(const camera::Frame& frame) {
    return pImpl->detect(frame);
}

std::string MediaPipeLandmarkSource::getLastError() const {
    return pImpl->getLastError();
}

} // namespace gesture
} // namespace gest
