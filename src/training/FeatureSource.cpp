#include "gest/training/FeatureSource.hpp"
#include "gest/core/Logger.hpp"

namespace gest {
namespace training {

CameraFeatureSource::CameraFeatureSource(camera::CameraManager& camera,
                                         gesture::LandmarkSource& landmarks,
                                         const gesture::FeatureProcessor& processor)
    : camera_(camera), landmarks_(landmarks), processor_(processor) {
}

FeatureCapture CameraFeatureSource::next() {
    FeatureCapture capture;

    auto frame = camera_.readFrame();
    if (!frame) {
        const camera::CameraError error = *frame.error;
        capture.reason = camera::camera_error_to_string(error) + ": " + frame.message;
        capture.status = error == camera::CameraError::TRANSIENT_READ_FAILURE
            ? FeatureCapture::Status::SKIPPED
            : FeatureCapture::Status::EXHAUSTED;
        return capture;
    }

    const auto hands = landmarks_.detect(frame.data);
    if (hands.empty()) {
        capture.reason = "no hand in frame " + std::to_string(frame.data.index);
        return capture;
    }

    auto features = processor_.extract(hands.front());
    if (!features) {
        capture.reason = gesture::feature_error_to_string(*features.error) + ": " + features.message;
        return capture;
    }

    capture.status = FeatureCapture::Status::OK;
    capture.features = std::move(features.data);
    return capture;
}

} // namespace training
} // namespace gest
