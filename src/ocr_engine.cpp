#include "ocr_engine.h"
#include <iostream>
#include <stdexcept>

static EngineConfig load_or_default(const std::string &config_path) {
    return config_path.empty() ? EngineConfig{} : EngineConfig::load(config_path);
}

OcrEngine::OcrEngine(const std::string &config_path) : OcrEngine(load_or_default(config_path)) {}

OcrEngine::OcrEngine(const EngineConfig &cfg) : cfg_(cfg) {
    if (cfg_.has_models())
        ocr_ = std::make_unique<PPOCR>(cfg_);
}

// 纠错 + 按类型分派字段解析
void OcrEngine::finish(OcrDocument &doc) const {
    doc.correction = corrector_.correct(doc.raw_text);
    if (has_field_parser(doc.document_type))
        doc.fields = extractor_.extract(doc.correction.corrected);
}

OcrDocument OcrEngine::process_image(const std::string &image_path, DocumentType type,
                                     RecognitionQueue::ProgressCallback progress) const {
    cv::Mat bgr = cv::imread(image_path, cv::IMREAD_COLOR);
    if (bgr.empty())
        throw std::runtime_error("cannot read image: " + image_path);
    return process_mat(bgr, type, std::move(progress));
}

OcrDocument OcrEngine::process_mat(const cv::Mat &bgr, DocumentType type,
                                   RecognitionQueue::ProgressCallback progress) const {
    if (!ocr_)
        throw std::runtime_error("OcrEngine: no detection/recognition models configured");

    OcrDocument doc;
    doc.document_type = type;
    if (cfg_.analyze_quality)
        doc.quality = quality_.analyze(bgr);

    PageText page = ocr_->run(bgr, type, std::move(progress));
    doc.raw_text = page.text.full_text;
    doc.ocr_confidence = page.text.confidence;
    doc.box_count = page.box_count;
    finish(doc);

#ifndef NDEBUG
    std::cout << "[PIPE] type=" << to_string(type) << " corrections=" << doc.correction.corrections.size()
              << " fields=" << (doc.fields ? "yes" : "no") << "\n";
#endif
    return doc;
}

OcrDocument OcrEngine::process_text(const std::string &text, DocumentType type) const {
    OcrDocument doc;
    doc.document_type = type;
    doc.raw_text = text;
    doc.ocr_confidence = 1.f;
    finish(doc);
    return doc;
}

CorrectionResult OcrEngine::correct_text(const std::string &text) const {
    return corrector_.correct(text);
}

FieldRecord OcrEngine::parse_text(const std::string &text) const {
    return extractor_.extract(text);
}

void OcrEngine::cancel() const {
    if (ocr_)
        ocr_->cancel();
}
