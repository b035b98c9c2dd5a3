#pragma once

#include <functional>
#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include "gest/camera/CameraTypes.hpp"

namespace gest {
namespace camera {

/**
 * Exclusive handle to one capture device
 *
 * Implementations release the OS handle in release() and in their destructor,
 * so a device dropped on any path never leaks the handle.
 */
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    /**
     * Open device and apply the requested format
     * @param deviceId Integer index ("0") or path/URL
     * @param format Requested resolution, fps and read timeout
     * @return true if the device is streaming with an acceptable format
     */
    virtual bool open(const std::string& deviceId, const CameraConfig& format) = 0;

    /**
     * Read next image, bounded by the configured read timeout
     * @return false on timeout, dropped frame or device error
     */
    virtual bool read(cv::Mat& image) = 0;

    virtual void release() = 0;

    virtual bool isOpen() const = 0;

    virtual std::string getLastError() const { return ""; }
};

using CaptureDeviceFactory = std::function<std::unique_ptr<CaptureDevice>()>;

/**
 * OpenCV VideoCapture backed device (V4L2, GStreamer, files, streams)
 */
class OpenCVCaptureDevice : public CaptureDevice {
public:
    OpenCVCaptureDevice() = default;
    ~OpenCVCaptureDevice() override;

    OpenCVCaptureDevice(const OpenCVCaptureDevice&) = delete;
    OpenCVCaptureDevice& operator=(const OpenCVCaptureDevice&) = delete;

    bool open(const std::string& deviceId, const CameraConfig& format) override;
    bool read(cv::Mat& image) override;
    void release() override;
    bool isOpen() const override;
    std::string getLastError() const override { return lastError_; }

    /**
     * Factory producing OpenCV devices for CameraManager
     */
    static CaptureDeviceFactory factory();

private:
    cv::VideoCapture capture_;
    std::string deviceId_;
    std::string lastError_;
};

} // namespace camera
} // namespace gest
