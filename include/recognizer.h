//
// Created by Nanboom233 on 2025/12/12.
//

#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "onnx_session.h"

// CRNN/SVTR 前向：行图 -> T×C logits。解码交给 SequenceDecoder
class Recognizer {
public:
    struct Params {
        int imgH = 48;
        int max_imgW = 2304; // 动态宽模型的最大输入宽
    };
    Recognizer(const std::string &rec_model, bool use_cuda = false, int intra_threads = 4, const Params &p = {});

    // 可多线程同时调用
    cv::Mat forward_logits(const cv::Mat &crop) const;

private:
    OnnxSession rec_;
    Params p_;
    int fixed_w_ = -1; // 模型输入宽固定时 > 0，右侧 pad 到此宽
    static void normalize_rec(cv::Mat &img);
};
