#include "image_quality.h"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

const char *to_string(ResolutionClass r) {
    switch (r) {
        case ResolutionClass::Low:
            return "low";
        case ResolutionClass::Medium:
            return "medium";
        case ResolutionClass::High:
            return "high";
    }
    return "low";
}

ResolutionClass ImageQualityAnalyzer::classify_resolution(double pixels) {
    if (pixels < 500000)
        return ResolutionClass::Low;
    if (pixels < 2000000)
        return ResolutionClass::Medium;
    return ResolutionClass::High;
}

// 2~4MP 最适合识别，过大反而扣分
double ImageQualityAnalyzer::resolution_score(double pixels) {
    const double mp = pixels / 1e6;
    if (mp < 0.3)
        return 30;
    if (mp < 0.5)
        return 50;
    if (mp < 1.0)
        return 70;
    if (mp < 2.0)
        return 85;
    if (mp < 4.0)
        return 100;
    return 95;
}

// Laplacian 方差
double ImageQualityAnalyzer::sharpness_score(const cv::Mat &gray) {
    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F);
    cv::Scalar mean, stddev;
    cv::meanStdDev(lap, mean, stddev);
    const double variance = stddev[0] * stddev[0];
    return std::min(100.0, variance / 50.0 * 100.0);
}

void ImageQualityAnalyzer::recommend(double score, double sharpness, double contrast, ImageQuality &out) {
    if (score >= 70 && sharpness >= 60) {
        out.recommendation = "이미지 품질이 양호합니다.";
        out.needs_enhancement = false;
    } else if (sharpness < 40) {
        out.recommendation = "이미지가 흐릿합니다. Super Resolution을 적용합니다.";
        out.needs_enhancement = true;
    } else if (contrast < 40) {
        out.recommendation = "대비가 낮습니다. 이미지 향상을 권장합니다.";
        out.needs_enhancement = true;
    } else if (score < 50) {
        out.recommendation = "전체 품질이 낮습니다. Super Resolution을 적용합니다.";
        out.needs_enhancement = true;
    } else {
        out.recommendation = "이미지 향상으로 OCR 정확도를 높일 수 있습니다.";
        out.needs_enhancement = score < 60;
    }
}

ImageQuality ImageQualityAnalyzer::analyze(const cv::Mat &image) const {
    if (image.empty())
        throw std::invalid_argument("ImageQualityAnalyzer: empty image");

    cv::Mat gray;
    if (image.channels() == 4)
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    else if (image.channels() == 3)
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    else
        gray = image;

    const double pixels = static_cast<double>(image.cols) * static_cast<double>(image.rows);
    const double res_score = resolution_score(pixels);
    const double sharpness = sharpness_score(gray);

    cv::Scalar mean, stddev;
    cv::meanStdDev(gray, mean, stddev);
    const double contrast = std::min(100.0, stddev[0] / 64.0 * 100.0);
    const double brightness = std::max(0.0, 100.0 - std::abs(mean[0] - 140.0) / 1.4);

    // 清晰度权重最高
    const double score = res_score * 0.2 + sharpness * 0.4 + contrast * 0.25 + brightness * 0.15;
    const double success = std::min(100.0, score * 0.5 + sharpness * 0.3 + contrast * 0.2);

    ImageQuality q;
    q.score = static_cast<int>(std::lround(score));
    q.resolution = classify_resolution(pixels);
    q.sharpness = static_cast<int>(std::lround(sharpness));
    q.contrast = static_cast<int>(std::lround(contrast));
    q.brightness = static_cast<int>(std::lround(brightness));
    q.estimated_ocr_success = static_cast<int>(std::lround(success));
    recommend(score, sharpness, contrast, q);
    return q;
}
