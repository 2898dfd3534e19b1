#include "camera.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <chrono>

using namespace std;

Camera::Camera(const CameraSettings& settings) : settings(settings) {
    // Check if we're running on a Raspberry Pi
    if (filesystem::exists("/proc/device-tree/model")) {
        ifstream model("/proc/device-tree/model");
        string model_str;
        getline(model, model_str);
        isRaspberryPi = model_str.find("Raspberry Pi") != string::npos;
    }
}

Camera::~Camera() {
    release();
}

bool Camera::initialize() {
    available = false;
    if (!settings.enabled) {
        LOG_INFO("Camera disabled by configuration");
        return false;
    }

    if (isRaspberryPi) {
        available = openPipeline();
    } else {
        for (int index : settings.indices) {
            if (openIndex(index)) {
                available = true;
                break;
            }
        }
    }

    if (!available) {
        LOG_ERROR("No camera available, face tracking will idle");
    }
    return available;
}

bool Camera::openPipeline() {
    // Use GStreamer pipeline on Raspberry Pi because only libcamera works, no v4l2
    string pipeline = "libcamerasrc ! video/x-raw,width=" + to_string(settings.width) +
                      ",height=" + to_string(settings.height) +
                      ",framerate=" + to_string(settings.fps) + "/1,format=BGR ! appsink";
    LOG_INFO("Initializing Raspberry Pi camera with pipeline: " + pipeline);
    cap.open(pipeline, cv::CAP_GSTREAMER);
    if (!cap.isOpened()) {
        LOG_ERROR("Failed to open camera with GStreamer pipeline");
        return false;
    }
    if (!readTestFrame()) {
        cap.release();
        return false;
    }
    return true;
}

bool Camera::openIndex(int index) {
    LOG_INFOF("Trying camera %d", index);
    if (!cap.open(index)) {
        LOG_WARNF("Camera %d could not be opened", index);
        return false;
    }

    cap.set(cv::CAP_PROP_FRAME_WIDTH, settings.width);
    cap.set(cv::CAP_PROP_FRAME_HEIGHT, settings.height);
    cap.set(cv::CAP_PROP_FPS, settings.fps);
    cap.set(cv::CAP_PROP_BUFFERSIZE, 1);

    if (!readTestFrame()) {
        LOG_WARNF("Camera %d opened but can't read frames (may be in use)", index);
        cap.release();
        return false;
    }
    LOG_INFOF("Camera %d initialized successfully", index);
    return true;
}

bool Camera::readTestFrame() {
    cv::Mat test_frame;
    for (int attempt = 0; attempt < 3; attempt++) {
        if (cap.read(test_frame) && !test_frame.empty()) {
            LOG_INFOF("Resolution: %dx%d", test_frame.cols, test_frame.rows);
            return true;
        }
        this_thread::sleep_for(chrono::milliseconds(100));
    }
    return false;
}

bool Camera::captureFrame(cv::Mat& frame) {
    if (!available || !cap.isOpened()) {
        return false;
    }
    bool success = cap.read(frame) && !frame.empty();
    if (!success) {
        LOG_DEBUG("Failed to capture frame");
    }
    return success;
}

void Camera::release() {
    if (cap.isOpened()) {
        cap.release();
    }
    available = false;
}
