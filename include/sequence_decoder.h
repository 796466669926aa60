#pragma once
#include <cstdint>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// 单个框的识别结果；confidence 为 0 或 1
struct DecodedSpan {
    std::string text;
    float confidence{0.f};
};

// CTC 贪心解码：类别 0 为 blank，类别 c 对应 symbols[c-1]
class SequenceDecoder {
public:
    explicit SequenceDecoder(std::vector<std::string> symbols);

    // 每行一个字符，去掉首尾空白，末尾追加空格；读不到文件抛 std::runtime_error
    static SequenceDecoder from_file(const std::string &path);

    // shape: (1,T,C) 或 (T,C)
    DecodedSpan decode(const float *data, const std::vector<int64_t> &shape) const;
    // T×C CV_32F
    DecodedSpan decode(const cv::Mat &logits_TxC) const;

    const std::vector<std::string> &symbols() const { return symbols_; }

private:
    std::vector<std::string> symbols_;
};
