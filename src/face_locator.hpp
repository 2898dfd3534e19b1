#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

// Finds the horizontal center of the most prominent face in a frame
class FaceLocator {
public:
    virtual ~FaceLocator() = default;
    virtual std::optional<int> locate(const cv::Mat& frame) = 0;
};

// Center x of the region with the largest area, or nothing if there are none.
// The first of several equally large regions wins.
std::optional<int> largestFaceCenterX(const std::vector<cv::Rect>& faces);

class CascadeFaceLocator : public FaceLocator {
public:
    // Loads the given cascade, or the first one found in the standard
    // OpenCV install locations if path is empty. Throws on failure.
    explicit CascadeFaceLocator(const std::string& path = "");

    std::optional<int> locate(const cv::Mat& frame) override;
    std::vector<cv::Rect> detectFaces(const cv::Mat& frame);

private:
    cv::CascadeClassifier face_cascade;
};
