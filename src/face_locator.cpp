#include "face_locator.hpp"
#include "logger.hpp"
#include <filesystem>
#include <stdexcept>

using namespace std;

optional<int> largestFaceCenterX(const vector<cv::Rect>& faces) {
    if (faces.empty()) {
        return nullopt;
    }
    const cv::Rect* largest = &faces[0];
    for (const auto& face : faces) {
        if (face.area() > largest->area()) {
            largest = &face;
        }
    }
    return largest->x + largest->width / 2;
}

CascadeFaceLocator::CascadeFaceLocator(const string& path) {
    // Try different possible paths for the face cascade classifier
    vector<string> possible_paths;
    if (!path.empty()) {
        possible_paths.push_back(path);
    } else {
        possible_paths = {
            "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml",
            "/usr/local/share/opencv4/haarcascades/haarcascade_frontalface_default.xml",
            "/opt/homebrew/share/opencv4/haarcascades/haarcascade_frontalface_default.xml",
            "/usr/share/opencv/haarcascades/haarcascade_frontalface_default.xml"
        };
    }

    bool loaded = false;
    for (const auto& candidate : possible_paths) {
        if (filesystem::exists(candidate) && face_cascade.load(candidate)) {
            loaded = true;
            LOG_INFO("Loaded face cascade from: " + candidate);
            break;
        }
    }
    if (!loaded) {
        LOG_ERROR("Could not find or load face cascade classifier in any of the following paths:");
        for (const auto& candidate : possible_paths) {
            LOG_ERROR("  " + candidate);
        }
        throw runtime_error("Failed to load face cascade classifier");
    }
}

optional<int> CascadeFaceLocator::locate(const cv::Mat& frame) {
    return largestFaceCenterX(detectFaces(frame));
}

vector<cv::Rect> CascadeFaceLocator::detectFaces(const cv::Mat& frame) {
    vector<cv::Rect> faces;
    if (frame.empty()) {
        return faces;
    }

    cv::Mat frame_gray;
    if (frame.channels() == 1) {
        frame_gray = frame.clone();
    } else {
        cv::cvtColor(frame, frame_gray, cv::COLOR_BGR2GRAY);
    }

    // Equalize histogram to improve detection
    cv::equalizeHist(frame_gray, frame_gray);

    // Ignore regions smaller than 60x60 or larger than 300x300
    face_cascade.detectMultiScale(frame_gray, faces, 1.1, 5, 0, cv::Size(60, 60), cv::Size(300, 300));
    return faces;
}
