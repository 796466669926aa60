#include "ppocr.h"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <iostream>

static Detector::Params detector_params(const EngineConfig &cfg) {
    Detector::Params p;
    p.max_size = cfg.det_max_side;
    p.box = cfg.box;
    return p;
}

static Recognizer::Params recognizer_params(const EngineConfig &cfg) {
    Recognizer::Params p;
    p.imgH = cfg.rec_img_h;
    p.max_imgW = cfg.rec_max_w;
    return p;
}

static inline std::array<cv::Point2f, 4> order_quad_TL_TR_BR_BL(const std::array<cv::Point2f, 4> &q) {
    auto sum = [](const cv::Point2f &p) { return p.x + p.y; };
    auto diff = [](const cv::Point2f &p) { return p.y - p.x; };
    int tl = 0, tr = 0, br = 0, bl = 0;
    float minSum = FLT_MAX, maxSum = -FLT_MAX, minDiff = FLT_MAX, maxDiff = -FLT_MAX;
    for (int i = 0; i < 4; ++i) {
        float s = sum(q[i]), d = diff(q[i]);
        if (s < minSum) {
            minSum = s;
            tl = i;
        }
        if (s > maxSum) {
            maxSum = s;
            br = i;
        }
        if (d < minDiff) {
            minDiff = d;
            tr = i;
        }
        if (d > maxDiff) {
            maxDiff = d;
            bl = i;
        }
    }
    return {q[tl], q[tr], q[br], q[bl]};
}

static inline float seg_len(const cv::Point2f &a, const cv::Point2f &b) {
    float dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

cv::Mat PPOCR::crop_quad_upright(const cv::Mat &img, const std::array<cv::Point2f, 4> &q_in) {
    auto qv = order_quad_TL_TR_BR_BL(q_in);
    const cv::Point2f &tl = qv[0];
    const cv::Point2f &tr = qv[1];
    const cv::Point2f &br = qv[2];
    const cv::Point2f &bl = qv[3];

    float w = std::max(seg_len(tl, tr), seg_len(bl, br));
    float h = std::max(seg_len(tl, bl), seg_len(tr, br));
    w = std::max(8.0f, w);
    h = std::max(8.0f, h);

    std::vector<cv::Point2f> src{tl, tr, br, bl};
    std::vector<cv::Point2f> dst{{0, 0}, {w - 1, 0}, {w - 1, h - 1}, {0, h - 1}};

    cv::Mat M = cv::getPerspectiveTransform(src, dst);
    cv::Mat line;
    cv::warpPerspective(img, line, M, cv::Size(static_cast<int>(w), static_cast<int>(h)), cv::INTER_CUBIC,
                        cv::BORDER_REPLICATE);

    // 行文本要求横向（宽 >= 高）；若竖排，转成横向
    if (line.rows > line.cols) {
        cv::transpose(line, line);
        cv::flip(line, line, 1);
    }
    return line;
}

PPOCR::PPOCR(const EngineConfig &cfg) :
    det_(cfg.det_model, cfg.use_cuda, cfg.intra_threads, detector_params(cfg)),
    rec_(cfg.rec_model, cfg.use_cuda, cfg.intra_threads, recognizer_params(cfg)),
    decoder_(SequenceDecoder::from_file(cfg.dict_path)), lines_(cfg.line),
    queue_(std::make_unique<RecognitionQueue>(static_cast<size_t>(std::max(1, cfg.rec_workers)))) {}

PageText PPOCR::run(const cv::Mat &bgr, DocumentType type, RecognitionQueue::ProgressCallback progress) const {
    PageText page;
    std::vector<TextRegionBox> boxes = det_.detect(bgr, type);
    page.box_count = boxes.size();
    page.lines = lines_.group(std::move(boxes));

    // 按阅读顺序提交，结果与框一一对应
    std::vector<RecognitionQueue::Task> tasks;
    tasks.reserve(page.box_count);
    for (const auto &line: page.lines) {
        for (const auto &box: line) {
            cv::Mat crop = crop_quad_upright(bgr, box.quad);
            tasks.emplace_back([this, crop]() { return decoder_.decode(rec_.forward_logits(crop)); });
        }
    }
    std::vector<DecodedSpan> spans = queue_->run_batch(std::move(tasks), std::move(progress));

    page.text = assembler_.assemble(page.lines, spans);
#ifndef NDEBUG
    std::cout << "[PIPE] boxes=" << page.box_count << " lines=" << page.lines.size()
              << " kept=" << page.text.kept_spans.size() << " conf=" << page.text.confidence << "\n";
#endif
    return page;
}
