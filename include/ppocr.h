//
// Created by Nanboom233 on 2025/12/12.
//

#pragma once
#include <memory>
#include <opencv2/opencv.hpp>
#include <vector>

#include "config.h"
#include "detector.h"
#include "recognition_queue.h"
#include "recognizer.h"
#include "sequence_decoder.h"
#include "text_assembler.h"

// 一页图像的识别结果（未纠错）
struct PageText {
    std::vector<TextLine> lines;
    AssembledDocument text;
    size_t box_count{0};
};

// 检测 -> 分行 -> 逐框识别（线程池）-> 拼接
class PPOCR {
public:
    explicit PPOCR(const EngineConfig &cfg);

    PageText run(const cv::Mat &bgr, DocumentType type,
                 RecognitionQueue::ProgressCallback progress = nullptr) const;

    // 丢弃尚未开始的逐框识别任务，run() 抛 OcrCancelled
    void cancel() const { queue_->cancel(); }

private:
    Detector det_;
    Recognizer rec_;
    SequenceDecoder decoder_;
    LineAssembler lines_;
    TextAssembler assembler_;
    std::unique_ptr<RecognitionQueue> queue_;
    static cv::Mat crop_quad_upright(const cv::Mat &img, const std::array<cv::Point2f, 4> &q);
};
