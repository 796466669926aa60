#pragma once
#include <array>
#include <opencv2/core.hpp>
#include <vector>

// 一个连通域对应的旋转文本框。width 恒为长边，与四点的绕序无关
struct TextRegionBox {
    std::array<cv::Point2f, 4> quad;
    cv::Point2f center;
    cv::Size2f size; // (长边, 短边)
    float angle{0.f};

    float min_x() const;
    float max_x() const;
};

// DBNet 概率图 -> 旋转文本框（检测图坐标）
class BoxDecoder {
public:
    struct Params {
        int dilate_w = 6; // 只做水平膨胀，把同一行断开的字连起来
        int dilate_h = 1;
        double min_area = 100.0;
        float unclip_width = 1.5f;
        float unclip_height = 1.4f;
    };

    BoxDecoder() = default;
    explicit BoxDecoder(const Params &p) : p_(p) {}

    // prob: H×W CV_32F，取值 [0,1]；空图抛 std::invalid_argument
    std::vector<TextRegionBox> decode(const cv::Mat &prob, float threshold) const;

    // 检测图 -> 原图：sx = 原图宽 / 检测宽，sy = 原图高 / 检测高
    static void rescale(std::vector<TextRegionBox> &boxes, float sx, float sy);

    const Params &params() const { return p_; }

private:
    Params p_;
};
