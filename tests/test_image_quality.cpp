#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <stdexcept>
#include "image_quality.h"

TEST(ImageQualityAnalyzer, EmptyImageThrows) {
    EXPECT_THROW(ImageQualityAnalyzer().analyze(cv::Mat()), std::invalid_argument);
}

TEST(ImageQualityAnalyzer, FlatSmallImageIsPoor) {
    cv::Mat flat(100, 100, CV_8UC3, cv::Scalar(140, 140, 140));
    ImageQuality q = ImageQualityAnalyzer().analyze(flat);
    EXPECT_EQ(q.resolution, ResolutionClass::Low);
    EXPECT_EQ(q.sharpness, 0);
    EXPECT_EQ(q.contrast, 0);
    EXPECT_EQ(q.brightness, 100);
    // 30*0.2 + 100*0.15
    EXPECT_EQ(q.score, 21);
    EXPECT_NEAR(q.estimated_ocr_success, 11, 1);
    EXPECT_TRUE(q.needs_enhancement);
    EXPECT_EQ(q.recommendation, "이미지가 흐릿합니다. Super Resolution을 적용합니다.");
}

TEST(ImageQualityAnalyzer, SharpHighResolutionCheckerboard) {
    cv::Mat board(1500, 2000, CV_8UC1);
    for (int y = 0; y < board.rows; ++y)
        for (int x = 0; x < board.cols; ++x)
            board.at<uchar>(y, x) = ((x / 8 + y / 8) % 2) ? 255 : 0;

    ImageQuality q = ImageQualityAnalyzer().analyze(board);
    EXPECT_EQ(q.resolution, ResolutionClass::High);
    EXPECT_EQ(q.sharpness, 100);
    EXPECT_EQ(q.contrast, 100);
    EXPECT_EQ(q.brightness, 91);
    EXPECT_EQ(q.score, 99);
    EXPECT_EQ(q.estimated_ocr_success, 99);
    EXPECT_FALSE(q.needs_enhancement);
    EXPECT_EQ(q.recommendation, "이미지 품질이 양호합니다.");
}

TEST(ImageQualityAnalyzer, MediumResolutionClass) {
    cv::Mat img(800, 1000, CV_8UC3, cv::Scalar(200, 200, 200));
    EXPECT_EQ(ImageQualityAnalyzer().analyze(img).resolution, ResolutionClass::Medium);
    EXPECT_STREQ(to_string(ResolutionClass::Medium), "medium");
}
