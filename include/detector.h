//
// Created by Nanboom233 on 2025/12/12.
//
#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "box_decoder.h"
#include "document_type.h"
#include "onnx_session.h"

// DBNet 前向结果：prob 已裁掉 pad，尺寸 = 缩放后的有效内容
struct ProbabilityMap {
    cv::Mat prob;      // CV_32F, [0,1]
    float ratio_h{1.f}; // 缩放后 / 原图
    float ratio_w{1.f};
};

class Detector {
public:
    struct Params {
        int max_size = 1280; // 长边上限
        BoxDecoder::Params box;
    };

    Detector(const std::string &det_model, bool use_cuda = false, int intra_threads = 4, const Params &p = {});

    ProbabilityMap forward_prob(const cv::Mat &bgr) const;
    // 框已映射回原图坐标
    std::vector<TextRegionBox> detect(const cv::Mat &bgr, DocumentType type) const;

private:
    OnnxSession det_session_;
    Params params_;
    BoxDecoder decoder_;
    static cv::Mat resize_to_h32(const cv::Mat &bgr, int limit_side_len, int stride, float *out_ratio_h,
                                 float *out_ratio_w);
    static void normalize_rgb(cv::Mat &rgb);
};
