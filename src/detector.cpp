#include "detector.h"
#include <algorithm>
#include <opencv2/dnn.hpp>
#include <stdexcept>

Detector::Detector(const std::string &det_model, bool use_cuda, int intra_threads, const Params &p) :
    det_session_(det_model, use_cuda, intra_threads), params_(p), decoder_(p.box) {}

// 归一化：在 RGB 空间做 (x/255 - mean) / std
void Detector::normalize_rgb(cv::Mat &rgb) {
    CV_Assert(rgb.type() == CV_32FC3);
    const cv::Scalar mean(0.485, 0.456, 0.406);
    const cv::Scalar stdv(0.229, 0.224, 0.225);
    cv::subtract(rgb, mean, rgb);
    cv::divide(rgb, stdv, rgb);
}

// 检测前处理：等比缩放（只缩不放）+ pad 到 stride 的倍数
cv::Mat Detector::resize_to_h32(const cv::Mat &bgr, int limit_side_len, int stride, float *out_ratio_h,
                                float *out_ratio_w) {
    const int h = bgr.rows, w = bgr.cols;
    float ratio = 1.f;
    if (limit_side_len > 0) {
        float r_h = limit_side_len / static_cast<float>(h);
        float r_w = limit_side_len / static_cast<float>(w);
        ratio = std::min(1.f, std::min(r_h, r_w)); // 长边>limit才缩小
    }
    int nh = std::max(1, static_cast<int>(std::round(h * ratio)));
    int nw = std::max(1, static_cast<int>(std::round(w * ratio)));

    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(nw, nh), 0, 0, cv::INTER_LINEAR);

    int ph = (nh + stride - 1) / stride * stride;
    int pw = (nw + stride - 1) / stride * stride;
    if (out_ratio_h)
        *out_ratio_h = static_cast<float>(nh) / static_cast<float>(h);
    if (out_ratio_w)
        *out_ratio_w = static_cast<float>(nw) / static_cast<float>(w);

    cv::Mat padded(ph, pw, bgr.type(), cv::Scalar(0, 0, 0));
    resized.copyTo(padded(cv::Rect(0, 0, nw, nh)));
    return padded;
}

ProbabilityMap Detector::forward_prob(const cv::Mat &bgr) const {
    if (bgr.empty())
        throw std::invalid_argument("Detector: empty image");

    ProbabilityMap pm;
    cv::Mat img = resize_to_h32(bgr, params_.max_size, 32, &pm.ratio_h, &pm.ratio_w);
    const int nh = std::max(1, static_cast<int>(std::round(bgr.rows * pm.ratio_h)));
    const int nw = std::max(1, static_cast<int>(std::round(bgr.cols * pm.ratio_w)));

    cv::Mat rgb;
    cv::cvtColor(img, rgb, img.channels() == 1 ? cv::COLOR_GRAY2RGB : cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32FC3, 1.0 / 255.0);
    normalize_rgb(rgb);

    // NCHW
    cv::Mat chw;
    cv::dnn::blobFromImage(rgb, chw, 1.0, cv::Size(), cv::Scalar(), false, false);
    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
    std::vector<int64_t> ishape{1, 3, static_cast<int64_t>(rgb.rows), static_cast<int64_t>(rgb.cols)};
    Ort::Value input = Ort::Value::CreateTensor<float>(mem, chw.ptr<float>(), chw.total(),
                                                       ishape.data(), ishape.size());

    const auto &in_names = det_session_.input_names();
    const auto &out_names = det_session_.output_names();
    std::vector<const char *> in{in_names[0].c_str()}, out{out_names[0].c_str()};
    auto outputs = det_session_.session().Run(Ort::RunOptions{nullptr}, in.data(), &input, 1, out.data(), 1);

    auto oshape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    if (oshape.size() < 2 || oshape.size() > 4)
        throw std::runtime_error("Detector: unexpected output rank " + std::to_string(oshape.size()));
    const int oh = static_cast<int>(oshape[oshape.size() - 2]);
    const int ow = static_cast<int>(oshape[oshape.size() - 1]);
    const float *ptr = outputs[0].GetTensorData<float>();

    cv::Mat prob = cv::Mat(oh, ow, CV_32F, const_cast<float *>(ptr)).clone();
    double mn, mx;
    cv::minMaxLoc(prob, &mn, &mx);
    if (mx > 1.5 || mn < -0.5) {
        // 输出是 logits 时补一层 sigmoid
        cv::Mat neg;
        cv::exp(-prob, neg);
        prob = 1.0f / (1.0f + neg);
    }

    // 下采样输出先还原到网络输入尺寸，再裁掉 pad
    if (prob.size() != img.size())
        cv::resize(prob, prob, img.size(), 0, 0, cv::INTER_LINEAR);
    pm.prob = prob(cv::Rect(0, 0, nw, nh)).clone();
    return pm;
}

std::vector<TextRegionBox> Detector::detect(const cv::Mat &bgr, DocumentType type) const {
    ProbabilityMap pm = forward_prob(bgr);
    std::vector<TextRegionBox> boxes = decoder_.decode(pm.prob, detection_threshold(type));
    BoxDecoder::rescale(boxes, static_cast<float>(bgr.cols) / static_cast<float>(pm.prob.cols),
                        static_cast<float>(bgr.rows) / static_cast<float>(pm.prob.rows));
    return boxes;
}
