#pragma once
#include <opencv2/core.hpp>
#include <string>

enum class ResolutionClass { Low, Medium, High };

const char *to_string(ResolutionClass r);

// 各项均为 0..100 的整数分
struct ImageQuality {
    int score{0};
    ResolutionClass resolution{ResolutionClass::Low};
    int sharpness{0};
    int contrast{0};
    int brightness{0};
    int estimated_ocr_success{0};
    std::string recommendation;
    bool needs_enhancement{false};
};

class ImageQualityAnalyzer {
public:
    // 接受 BGR / BGRA / 灰度图；空图抛 std::invalid_argument
    ImageQuality analyze(const cv::Mat &image) const;

private:
    static ResolutionClass classify_resolution(double pixels);
    static double resolution_score(double pixels);
    static double sharpness_score(const cv::Mat &gray);
    static void recommend(double score, double sharpness, double contrast, ImageQuality &out);
};
