#include "onnx_session.h"
#include <iostream>
#ifdef _WIN32
#include "hangul_utils.h"
#endif

Ort::Env &OrtEnvHolder::Get() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "bizreg_ocr");
    return env; // 单例：程序全程只创建一次
}

OnnxSession::OnnxSession(const std::string &model_path, bool use_cuda, int intra_threads) {
    Ort::SessionOptions opt;
    opt.SetIntraOpNumThreads(intra_threads);
    opt.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    // GPU：CUDA 不可用时退回 CPU
    if (use_cuda) {
        try {
            OrtCUDAProviderOptions cuda_opts{};
            opt.AppendExecutionProvider_CUDA(cuda_opts);
        } catch (const Ort::Exception &e) {
            std::cerr << "[WARN] CUDA provider unavailable, using CPU: " << e.what() << "\n";
        }
    }

    // 创建会话（若未附加任何 EP，则为 CPU）
#ifdef _WIN32
    const std::wstring path = utf8_to_wide(model_path);
    session_ = Ort::Session(OrtEnvHolder::Get(), path.c_str(), opt);
#else
    session_ = Ort::Session(OrtEnvHolder::Get(), model_path.c_str(), opt);
#endif

    // 初始化输入输出的名称和形状信息
    size_t in_cnt = session_.GetInputCount();
    size_t out_cnt = session_.GetOutputCount();

    input_names_.resize(in_cnt);
    output_names_.resize(out_cnt);
    input_shapes_.resize(in_cnt);

    for (size_t i = 0; i < in_cnt; ++i) {
        auto nm = session_.GetInputNameAllocated(i, allocator_);
        input_names_[i] = nm.get();
        Ort::TypeInfo type_info = session_.GetInputTypeInfo(i);
        auto info = type_info.GetTensorTypeAndShapeInfo();
        auto shp = info.GetShape();
        for (auto &d: shp) {
            if (d == 0)
                d = -1;
        }
        input_shapes_[i] = std::move(shp);
    }
    for (size_t i = 0; i < out_cnt; ++i) {
        auto nm = session_.GetOutputNameAllocated(i, allocator_);
        output_names_[i] = nm.get();
    }

#ifndef NDEBUG
    std::cout << "[PIPE] loaded " << model_path << " inputs=" << in_cnt << " outputs=" << out_cnt
              << " cuda=" << (use_cuda ? "on" : "off") << "\n";
#endif
}
