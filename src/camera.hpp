#pragma once

#include "settings.hpp"
#include <atomic>
#include <opencv2/opencv.hpp>

// Anything the tracking loop can pull frames from
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual bool captureFrame(cv::Mat& frame) = 0;
    virtual bool isAvailable() const = 0;
};

class Camera : public FrameSource {
public:
    explicit Camera(const CameraSettings& settings);
    ~Camera() override;

    // Open the first working device. Returns false if none could be opened.
    bool initialize();
    bool captureFrame(cv::Mat& frame) override;
    bool isAvailable() const override { return available; }
    void release();

private:
    bool openPipeline();
    bool openIndex(int index);
    bool readTestFrame();

    CameraSettings settings;
    cv::VideoCapture cap;
    bool isRaspberryPi = false;
    std::atomic<bool> available{false};
};
