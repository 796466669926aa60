#include "sequence_decoder.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

static std::string trim_ascii(const std::string &s) {
    const char *ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

SequenceDecoder::SequenceDecoder(std::vector<std::string> symbols) : symbols_(std::move(symbols)) {}

SequenceDecoder SequenceDecoder::from_file(const std::string &path) {
    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("cannot read symbol dictionary: " + path);

    std::vector<std::string> keys;
    std::string line;
    while (std::getline(ifs, line))
        keys.push_back(trim_ascii(line));
    if (keys.empty())
        std::cerr << "[WARN] symbol dictionary is empty: " << path << "\n";
    keys.emplace_back(" "); // 模型最后一类为空格
    return SequenceDecoder(std::move(keys));
}

DecodedSpan SequenceDecoder::decode(const float *data, const std::vector<int64_t> &shape) const {
    if (!data)
        throw std::invalid_argument("SequenceDecoder: null logits");
    if (shape.size() == 3 && shape[0] != 1)
        throw std::invalid_argument("SequenceDecoder: batch size must be 1");
    if (shape.size() != 2 && shape.size() != 3)
        throw std::invalid_argument("SequenceDecoder: unexpected logits rank " + std::to_string(shape.size()));

    const int T = static_cast<int>(shape[shape.size() - 2]);
    const int C = static_cast<int>(shape[shape.size() - 1]);
    if (T < 0 || C <= 0)
        throw std::invalid_argument("SequenceDecoder: bad logits shape");
    cv::Mat view(T, C, CV_32F, const_cast<float *>(data));
    return decode(view);
}

DecodedSpan SequenceDecoder::decode(const cv::Mat &logits_TxC) const {
    if (logits_TxC.dims != 2 || logits_TxC.type() != CV_32F)
        throw std::invalid_argument("SequenceDecoder: logits must be a T×C CV_32F matrix");

    const int T = logits_TxC.rows, C = logits_TxC.cols;
    DecodedSpan span;
    int prev_k = -1;
    bool appended = false;
    for (int t = 0; t < T; ++t) {
        const float *row = logits_TxC.ptr<float>(t);
        int k = static_cast<int>(std::max_element(row, row + C) - row); // argmax
        // blank 也要更新 prev_k：A,blank,A 输出 "AA"
        if (k != 0 && k != prev_k) {
            int dict_idx = k - 1;
            if (dict_idx < static_cast<int>(symbols_.size())) {
                span.text += symbols_[dict_idx];
                appended = true;
            }
        }
        prev_k = k;
    }
    span.confidence = appended ? 1.f : 0.f;
    return span;
}
