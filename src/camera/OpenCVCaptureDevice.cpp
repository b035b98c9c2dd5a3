#include "gest/camera/CaptureDevice.hpp"
#include "gest/core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace gest {
namespace camera {

namespace {

bool isDeviceIndex(const std::string& id) {
    return !id.empty() &&
           std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

void applyProperty(cv::VideoCapture& capture, int property, double value, const char* name) {
    if (!capture.set(property, value)) {
        LOG_DEBUG(std::string("OpenCVCaptureDevice: backend ignored ") + name + "=" +
                  std::to_string(value));
    }
}

} // namespace

OpenCVCaptureDevice::~OpenCVCaptureDevice() {
    release();
}

bool OpenCVCaptureDevice::open(const std::string& deviceId, const CameraConfig& format) {
    release();
    deviceId_ = deviceId;
    lastError_.clear();

    bool opened = false;
    try {
        if (isDeviceIndex(deviceId)) {
            opened = capture_.open(std::stoi(deviceId), cv::CAP_ANY);
        } else {
            opened = capture_.open(deviceId, cv::CAP_ANY);
        }
    } catch (const std::out_of_range&) {
        lastError_ = "Device index " + deviceId + " out of range";
        opened = false;
    } catch (const cv::Exception& e) {
        lastError_ = std::string("OpenCV error: ") + e.what();
        opened = false;
    }

    if (!opened || !capture_.isOpened()) {
        if (lastError_.empty()) {
            lastError_ = "Cannot open device " + deviceId;
        }
        release();
        return false;
    }

    applyProperty(capture_, cv::CAP_PROP_FRAME_WIDTH, format.width, "width");
    applyProperty(capture_, cv::CAP_PROP_FRAME_HEIGHT, format.height, "height");
    applyProperty(capture_, cv::CAP_PROP_FPS, format.fps, "fps");
    applyProperty(capture_, cv::CAP_PROP_READ_TIMEOUT_MSEC, format.read_timeout_ms, "read_timeout_ms");

    const int actualWidth = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
    const int actualHeight = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));
    const double actualFps = capture_.get(cv::CAP_PROP_FPS);

    if (format.strict_format &&
        (actualWidth != format.width || actualHeight != format.height)) {
        lastError_ = "Device " + deviceId + " delivers " + std::to_string(actualWidth) + "x" +
                     std::to_string(actualHeight) + ", requested " +
                     std::to_string(format.width) + "x" + std::to_string(format.height);
        release();
        return false;
    }

    LOG_INFO("OpenCVCaptureDevice: opened " + deviceId + " at " +
             std::to_string(actualWidth) + "x" + std::to_string(actualHeight) +
             " @ " + std::to_string(actualFps) + " fps (backend " + capture_.getBackendName() + ")");
    return true;
}

bool OpenCVCaptureDevice::read(cv::Mat& image) {
    if (!capture_.isOpened()) {
        lastError_ = "Device not open";
        return false;
    }

    try {
        if (!capture_.read(image) || image.empty()) {
            lastError_ = "No frame from " + deviceId_;
            return false;
        }
    } catch (const cv::Exception& e) {
        lastError_ = std::string("OpenCV read error: ") + e.what();
        return false;
    }
    return true;
}

void OpenCVCaptureDevice::release() {
    if (capture_.isOpened()) {
        capture_.release();
        LOG_DEBUG("OpenCVCaptureDevice: released " + deviceId_);
    }
}

bool OpenCVCaptureDevice::isOpen() const {
    return capture_.isOpened();
}

CaptureDeviceFactory OpenCVCaptureDevice::factory() {
    return []() { return std::make_unique<OpenCVCaptureDevice>(); };
}

} // namespace camera
} // namespace gest
