#pragma once
#include <string>
#include <vector>

enum class CorrectionMethod { Dictionary, Ngram, Confusion, Keyword, Merge, Prefix };

const char *to_string(CorrectionMethod m);

struct CorrectionDetail {
    int position{0}; // 码点下标
    std::string original;
    std::string corrected;
    CorrectionMethod method{CorrectionMethod::Dictionary};
    float confidence{0.f};
};

struct CorrectionResult {
    std::string original;
    std::string corrected;
    std::vector<CorrectionDetail> corrections;
    float confidence{1.f};
};

class TextCorrector {
public:
    struct Params {
        float low_freq_cut = 0.1f;         // n-gram 低于此频率才尝试纠正
        float bigram_margin = 0.3f;        // 候选必须比原 bigram 高出的频率
        float trigram_min_freq = 0.5f;     // 参与匹配的 trigram 最低频率
        float trigram_min_similarity = 0.6f;
        int keyword_max_distance = 2;
        float max_change_ratio = 0.3f;     // 超过则置信度封顶
        float over_change_confidence = 0.5f;
        float default_confidence = 0.8f;
        int max_rounds = 4;                // 全部阶段最多重复的轮数
    };

    TextCorrector() = default;
    explicit TextCorrector(const Params &p) : p_(p) {}

    // 纯函数：每次调用使用自己的日志，可并发调用
    CorrectionResult correct(const std::string &text) const;

private:
    Params p_;

    using Log = std::vector<CorrectionDetail>;
    std::wstring merge_fragmented_keywords(const std::wstring &text, Log &log) const;
    std::wstring remove_garbage_prefix(const std::wstring &text, Log &log) const;
    std::wstring correct_latin_confusion(const std::wstring &text, Log &log) const;
    std::wstring correct_by_dictionary(const std::wstring &text, Log &log) const;
    std::wstring correct_by_ngram(const std::wstring &text, Log &log) const;
    std::wstring correct_field_keywords(const std::wstring &text, Log &log) const;
    float calculate_confidence(const std::wstring &original, const std::wstring &corrected, const Log &log) const;
};
