#pragma once
#include <onnxruntime_cxx_api.h>
#include <string>
#include <vector>

class OrtEnvHolder {
public:
    static Ort::Env &Get();
};

// 模型文件不存在或加载失败时抛 Ort::Exception
class OnnxSession {
public:
    OnnxSession(const std::string &model_path, bool use_cuda = false, int intra_threads = 4);
    Ort::Session &session() const { return session_; }
    const std::vector<std::string> &input_names() const { return input_names_; }
    const std::vector<std::string> &output_names() const { return output_names_; }
    const std::vector<std::vector<int64_t>> &input_shapes() const { return input_shapes_; }

private:
    // Run() 本身线程安全，多个识别线程共用同一个会话
    mutable Ort::Session session_{nullptr};
    Ort::AllocatorWithDefaultOptions allocator_;
    std::vector<std::string> input_names_, output_names_;
    std::vector<std::vector<int64_t>> input_shapes_;
};
