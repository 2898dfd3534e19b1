#include "face_locator.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

TEST(LargestFaceCenterX, NoFacesMeansNothing) {
    EXPECT_FALSE(largestFaceCenterX({}).has_value());
}

TEST(LargestFaceCenterX, SingleFaceCenter) {
    EXPECT_EQ(largestFaceCenterX({cv::Rect(100, 50, 81, 81)}), 140);
}

TEST(LargestFaceCenterX, PicksLargestArea) {
    std::vector<cv::Rect> faces = {
        cv::Rect(10, 10, 60, 60),
        cv::Rect(400, 20, 120, 100),   // 12000
        cv::Rect(200, 30, 100, 110)    // 11000
    };
    EXPECT_EQ(largestFaceCenterX(faces), 460);
}

TEST(LargestFaceCenterX, TieKeepsFirst) {
    std::vector<cv::Rect> faces = {
        cv::Rect(0, 0, 80, 80),
        cv::Rect(300, 0, 80, 80)
    };
    EXPECT_EQ(largestFaceCenterX(faces), 40);
}

TEST(CascadeFaceLocator, MissingCascadeThrows) {
    EXPECT_THROW(CascadeFaceLocator("/nonexistent/haarcascade.xml"), std::runtime_error);
}

TEST(CascadeFaceLocator, BlankFrameHasNoFace) {
    std::unique_ptr<CascadeFaceLocator> locator;
    try {
        locator = std::make_unique<CascadeFaceLocator>();
    } catch (const std::runtime_error&) {
        GTEST_SKIP() << "No Haar cascade installed";
    }
    cv::Mat frame = cv::Mat::zeros(480, 640, CV_8UC3);
    EXPECT_FALSE(locator->locate(frame).has_value());
    EXPECT_FALSE(locator->locate(cv::Mat()).has_value());
}
