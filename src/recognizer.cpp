#include "recognizer.h"
#include <algorithm>
#include <opencv2/dnn.hpp>
#include <stdexcept>

Recognizer::Recognizer(const std::string &rec_model, bool use_cuda, int intra_threads, const Params &p) :
    rec_(rec_model, use_cuda, intra_threads), p_(p) {
    // 从模型读取真实输入形状（NCHW），遇到动态维(<=0)则保留现有参数
    const auto &in_shapes = rec_.input_shapes();
    if (!in_shapes.empty() && in_shapes[0].size() >= 4) {
        int64_t H = in_shapes[0][2];
        int64_t W = in_shapes[0][3];
        if (H > 0)
            p_.imgH = static_cast<int>(H);
        if (W > 0)
            fixed_w_ = static_cast<int>(W);
    }
}

void Recognizer::normalize_rec(cv::Mat &img) {
    img.convertTo(img, CV_32F, 1.0 / 255.0);
    cv::subtract(img, cv::Scalar(0.5, 0.5, 0.5), img);
    cv::divide(img, cv::Scalar(0.5, 0.5, 0.5), img);
}

// NCT 布局转成 T×C
static cv::Mat transpose_to_TxC(const float *ptr, int C, int T) {
    cv::Mat logits(T, C, CV_32F);
    for (int t = 0; t < T; ++t) {
        const float *p_col = ptr + t;
        float *dst = logits.ptr<float>(t);
        for (int c = 0; c < C; ++c)
            dst[c] = p_col[c * T];
    }
    return logits;
}

cv::Mat Recognizer::forward_logits(const cv::Mat &crop) const {
    if (crop.empty())
        throw std::invalid_argument("Recognizer: empty crop");

    // 1) 缩放到目标高，宽按比例，限制上限
    float ratio = std::max(1e-6f, static_cast<float>(crop.cols) / static_cast<float>(crop.rows));
    int need_w = std::max(8, static_cast<int>(std::ceil(p_.imgH * ratio)));
    int in_w = fixed_w_ > 0 ? fixed_w_ : std::min(need_w, p_.max_imgW);
    int tar_w = std::min(need_w, in_w);

    cv::Mat img;
    cv::resize(crop, img, cv::Size(tar_w, p_.imgH), 0, 0, cv::INTER_CUBIC);
    if (img.channels() == 1)
        cv::cvtColor(img, img, cv::COLOR_GRAY2BGR);

    // 2) 归一化 + pad
    normalize_rec(img);
    if (tar_w < in_w)
        cv::copyMakeBorder(img, img, 0, 0, 0, in_w - tar_w, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));

    // 3) HWC->CHW, BGR->RGB
    cv::Mat chw;
    cv::dnn::blobFromImage(img, chw, 1.0, cv::Size(), cv::Scalar(), /*swapRB=*/true, false);

    // 4) ORT 前向
    std::vector<int64_t> ishape{1, 3, p_.imgH, in_w};
    auto mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
    auto input = Ort::Value::CreateTensor<float>(mem, chw.ptr<float>(), chw.total(),
                                                 ishape.data(), ishape.size());
    const auto &in_names = rec_.input_names();
    const auto &out_names = rec_.output_names();
    std::vector<const char *> in{in_names[0].c_str()};
    std::vector<const char *> out{out_names[0].c_str()};
    auto outputs = rec_.session().Run(Ort::RunOptions{nullptr}, in.data(), &input, 1, out.data(), 1);

    // 5) 统一 TxC
    auto shp = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    const float *ptr = outputs[0].GetTensorData<float>();
    if (shp.size() == 3) {
        if (shp[0] != 1)
            throw std::runtime_error("rec output N!=1 not supported");
        int A = static_cast<int>(shp[1]), B = static_cast<int>(shp[2]);
        if (A > B) // NCT
            return transpose_to_TxC(ptr, A, B);
        return cv::Mat(A, B, CV_32F, const_cast<float *>(ptr)).clone();
    }
    if (shp.size() == 4) {
        int n = static_cast<int>(shp[0]), a = static_cast<int>(shp[1]);
        int b = static_cast<int>(shp[2]), c = static_cast<int>(shp[3]);
        if (n != 1)
            throw std::runtime_error("rec output N!=1 not supported");
        if (a == 1)
            return cv::Mat(b, c, CV_32F, const_cast<float *>(ptr)).clone();
        return transpose_to_TxC(ptr, a, c);
    }
    throw std::runtime_error("Unexpected rec output rank: " + std::to_string(shp.size()));
}
