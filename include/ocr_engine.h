//
// Created by Nanboom233 on 2025/12/3.
//
#pragma once
#include <memory>
#include <optional>
#include <string>
#include "config.h"
#include "document_type.h"
#include "field_extractor.h"
#include "image_quality.h"
#include "ppocr.h"
#include "text_corrector.h"

struct OcrDocument {
    DocumentType document_type{DocumentType::Unknown};
    std::string raw_text; // 纠错前
    CorrectionResult correction;
    std::optional<FieldRecord> fields; // 只有 사업자등록증 有解析器
    float ocr_confidence{0.f};
    std::optional<ImageQuality> quality;
    size_t box_count{0};
};

// 对外入口：图像或已识别文本 -> 纠错 -> 字段
class OcrEngine {
public:
    // config_path 为空时只能处理文本
    explicit OcrEngine(const std::string &config_path);
    explicit OcrEngine(const EngineConfig &cfg);

    // 读不到图片 / 未配置模型抛 std::runtime_error
    OcrDocument process_image(const std::string &image_path, DocumentType type,
                              RecognitionQueue::ProgressCallback progress = nullptr) const;
    OcrDocument process_mat(const cv::Mat &bgr, DocumentType type,
                            RecognitionQueue::ProgressCallback progress = nullptr) const;
    OcrDocument process_text(const std::string &text, DocumentType type) const;

    CorrectionResult correct_text(const std::string &text) const;
    FieldRecord parse_text(const std::string &text) const;

    void cancel() const;
    const EngineConfig &config() const { return cfg_; }

private:
    EngineConfig cfg_;
    std::unique_ptr<PPOCR> ocr_;
    TextCorrector corrector_;
    FuzzyFieldExtractor extractor_;
    ImageQualityAnalyzer quality_;

    void finish(OcrDocument &doc) const;
};
