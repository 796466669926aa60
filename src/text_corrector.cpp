#include "text_corrector.h"
#include <algorithm>
#include <regex>
#include "correction_dictionary.h"
#include "hangul_utils.h"

const char *to_string(CorrectionMethod m) {
    switch (m) {
        case CorrectionMethod::Dictionary:
            return "dictionary";
        case CorrectionMethod::Ngram:
            return "ngram";
        case CorrectionMethod::Confusion:
            return "confusion";
        case CorrectionMethod::Keyword:
            return "keyword";
        case CorrectionMethod::Merge:
            return "merge";
        case CorrectionMethod::Prefix:
            return "prefix";
    }
    return "unknown";
}

static CorrectionDetail make_detail(int position, const std::wstring &original, const std::wstring &corrected,
                                    CorrectionMethod method, float confidence) {
    CorrectionDetail d;
    d.position = position;
    d.original = wide_to_utf8(original);
    d.corrected = wide_to_utf8(corrected);
    d.method = method;
    d.confidence = confidence;
    return d;
}

// 全部替换；若有命中，按第一处命中记一条日志
static std::wstring replace_logged(const std::wstring &text, const std::wregex &re, const std::wstring &fmt,
                                   CorrectionMethod method, float confidence, std::vector<CorrectionDetail> &log) {
    std::wsmatch m;
    if (!std::regex_search(text, m, re))
        return text;
    log.push_back(make_detail(static_cast<int>(m.position(0)), m.str(0), trim(m.format(fmt)), method, confidence));
    return std::regex_replace(text, re, fmt);
}

CorrectionResult TextCorrector::correct(const std::string &text) const {
    Log log;
    const std::wstring original = utf8_to_wide(text);
    std::wstring corrected = original;

    // 后面的阶段可能制造出前面阶段能匹配的文本（범인 -> 법인 之后才能断行），重复直到不再变化
    for (int round = 0; round < p_.max_rounds; ++round) {
        const std::wstring before = corrected;
        corrected = merge_fragmented_keywords(corrected, log);
        corrected = remove_garbage_prefix(corrected, log);
        corrected = correct_latin_confusion(corrected, log);
        corrected = correct_by_dictionary(corrected, log);
        corrected = correct_by_ngram(corrected, log);
        corrected = correct_field_keywords(corrected, log);
        if (corrected == before)
            break;
    }

    CorrectionResult r;
    r.original = text;
    r.corrected = wide_to_utf8(corrected);
    r.confidence = calculate_confidence(original, corrected, log);
    r.corrections = std::move(log);
    return r;
}

// 标签被 OCR 拆到两行 / 两个框：대\n표자 -> 대표자
std::wstring TextCorrector::merge_fragmented_keywords(const std::wstring &text, Log &log) const {
    static const std::vector<std::pair<std::wregex, std::wstring>> patterns{
            {std::wregex(L"대\\s+표자"), L"대표자"},
            {std::wregex(L"법\\s+인명"), L"법인명"},
            {std::wregex(L"등\\s+록번호"), L"등록번호"},
            {std::wregex(L"소\\s+재지"), L"소재지"},
            {std::wregex(L"개\\s+업연월일"), L"개업연월일"},
            {std::wregex(L"사\\s+업장"), L"사업장"},
            {std::wregex(L"본\\s+점"), L"본점"},
    };
    std::wstring result = text;
    for (const auto &pr: patterns)
        result = replace_logged(result, pr.first, pr.second, CorrectionMethod::Merge, 0.9f, log);
    return result;
}

// 2015년12월01일법인등록번호 -> 2015년12월01일\n법인등록번호
// 일법인등록번호 -> 법인등록번호
std::wstring TextCorrector::remove_garbage_prefix(const std::wstring &text, Log &log) const {
    static const std::vector<std::pair<std::wregex, std::wstring>> patterns{
            {std::wregex(L"(\\d{1,2}일)([법본사개])"), L"$1\n$2"},
            {std::wregex(L"(^|\\s)일([법번]인등[록롤]번호)"), L"$1$2"},
            {std::wregex(L"([법번]인등)롤([번빈]호)"), L"$1록$2"},
            {std::wregex(L"등롤번호"), L"등록번호"},
            {std::wregex(L"(^|\\s)[일인]([법번]인명)"), L"$1$2"},
    };
    std::wstring result = text;
    for (const auto &pr: patterns)
        result = replace_logged(result, pr.first, pr.second, CorrectionMethod::Prefix, 0.88f, log);
    return result;
}

// HOA -> 충청남도；只替换独立的拉丁 token
std::wstring TextCorrector::correct_latin_confusion(const std::wstring &text, Log &log) const {
    std::wstring result = text;
    for (const auto &pr: correction_dict::latin_confusion()) {
        std::wregex re(L"(^|[^A-Za-z])" + pr.first + L"(?![A-Za-z])");
        std::wsmatch m;
        if (!std::regex_search(result, m, re))
            continue;
        int pos = static_cast<int>(m.position(0) + m.length(1));
        result = std::regex_replace(result, re, L"$1" + pr.second);
        log.push_back(make_detail(pos, pr.first, pr.second, CorrectionMethod::Confusion, 0.9f));
    }
    return result;
}

std::wstring TextCorrector::correct_by_dictionary(const std::wstring &text, Log &log) const {
    std::wstring result = text;
    for (const auto &pr: correction_dict::word_corrections()) {
        const std::wstring &wrong = pr.first;
        const std::wstring &right = pr.second;
        size_t pos = result.find(wrong);
        if (pos == std::wstring::npos)
            continue;
        log.push_back(make_detail(static_cast<int>(pos), wrong, right, CorrectionMethod::Dictionary, 0.95f));
        while (pos != std::wstring::npos) {
            result.replace(pos, wrong.size(), right);
            pos = result.find(wrong, pos + right.size());
        }
    }
    return result;
}

static std::vector<wchar_t> with_confusions(wchar_t c) {
    std::vector<wchar_t> out{c};
    const auto &table = correction_dict::char_confusion();
    auto it = table.find(c);
    if (it != table.end())
        out.insert(out.end(), it->second.begin(), it->second.end());
    return out;
}

static float trigram_similarity(const std::wstring &a, const std::wstring &b) {
    if (a.size() != 3 || b.size() != 3)
        return 0.f;
    float score = 0.f;
    for (int i = 0; i < 3; ++i) {
        if (a[i] == b[i])
            score += 1.f;
        else if (is_hangul(a[i]) && is_hangul(b[i]))
            score += jamo_similarity(a[i], b[i]);
    }
    return score / 3.f;
}

std::wstring TextCorrector::correct_by_ngram(const std::wstring &text, Log &log) const {
    const auto &bigrams = correction_dict::bigram_freq();
    const auto &trigrams = correction_dict::trigram_freq();
    std::wstring result = text;

    // bigram
    auto fix_bigram = [&](size_t i) {
        const std::wstring bigram = result.substr(i, 2);
        auto it = bigrams.find(bigram);
        if (it == bigrams.end() || it->second >= p_.low_freq_cut)
            return false;

        double best = 0.0;
        std::wstring best_bigram;
        for (wchar_t c1: with_confusions(bigram[0])) {
            for (wchar_t c2: with_confusions(bigram[1])) {
                std::wstring cand{c1, c2};
                auto ct = bigrams.find(cand);
                if (ct != bigrams.end() && ct->second > best) {
                    best = ct->second;
                    best_bigram = cand;
                }
            }
        }
        if (best_bigram.empty() || best <= it->second + p_.bigram_margin)
            return false;
        result.replace(i, 2, best_bigram);
        log.push_back(make_detail(static_cast<int>(i), bigram, best_bigram, CorrectionMethod::Ngram,
                                  static_cast<float>(best)));
        return true;
    };
    for (size_t i = 0; i + 1 < result.size(); ++i) {
        // 替换改了第 i 个字，左边那一对要重新看（롤빈호：빈호 改成 번호 后出现 롤번）
        if (fix_bigram(i) && i > 0)
            fix_bigram(i - 1);
    }

    // trigram
    for (size_t i = 0; i + 2 < result.size(); ++i) {
        const std::wstring trigram = result.substr(i, 3);
        auto it = trigrams.find(trigram);
        if (it == trigrams.end() || it->second >= p_.low_freq_cut)
            continue;

        double best = 0.0;
        const std::wstring *best_match = nullptr;
        for (const auto &kv: trigrams) {
            if (kv.second < p_.trigram_min_freq)
                continue;
            float sim = trigram_similarity(trigram, kv.first);
            if (sim > p_.trigram_min_similarity && sim * kv.second > best) {
                best = sim * kv.second;
                best_match = &kv.first;
            }
        }
        if (best_match) {
            result.replace(i, 3, *best_match);
            log.push_back(make_detail(static_cast<int>(i), trigram, *best_match, CorrectionMethod::Ngram,
                                      static_cast<float>(best)));
        }
    }
    return result;
}

// 每个字符展开成 [本字+易混字]
static std::wstring fuzzy_pattern(const std::wstring &keyword) {
    const auto &table = correction_dict::char_confusion();
    std::wstring pattern;
    for (wchar_t c: keyword) {
        auto it = table.find(c);
        if (it == table.end() || it->second.empty()) {
            pattern.push_back(c);
            continue;
        }
        pattern.push_back(L'[');
        pattern.push_back(c);
        pattern.append(it->second.begin(), it->second.end());
        pattern.push_back(L']');
    }
    return pattern;
}

std::wstring TextCorrector::correct_field_keywords(const std::wstring &text, Log &log) const {
    std::wstring result = text;
    for (const auto &keyword: correction_dict::field_keywords()) {
        const std::wregex re(fuzzy_pattern(keyword));
        std::wstring rebuilt;
        rebuilt.reserve(result.size());
        size_t last = 0;
        bool changed = false;
        for (auto it = std::wsregex_iterator(result.begin(), result.end(), re); it != std::wsregex_iterator();
             ++it) {
            const std::wstring match = it->str(0);
            const size_t pos = static_cast<size_t>(it->position(0));
            rebuilt.append(result, last, pos - last);
            if (match != keyword && levenshtein(match, keyword) <= p_.keyword_max_distance) {
                rebuilt += keyword;
                log.push_back(make_detail(static_cast<int>(pos), match, keyword, CorrectionMethod::Keyword, 0.85f));
                changed = true;
            } else {
                rebuilt += match;
            }
            last = pos + match.size();
        }
        if (changed) {
            rebuilt.append(result, last, std::wstring::npos);
            result = std::move(rebuilt);
        }
    }
    return result;
}

float TextCorrector::calculate_confidence(const std::wstring &original, const std::wstring &corrected,
                                          const Log &log) const {
    if (original == corrected)
        return 1.f;

    const int distance = levenshtein(original, corrected);
    const size_t max_len = std::max(original.size(), corrected.size());
    const float change_ratio = static_cast<float>(distance) / static_cast<float>(max_len);

    if (change_ratio > p_.max_change_ratio)
        return p_.over_change_confidence;

    if (!log.empty()) {
        float sum = 0.f;
        for (const auto &d: log)
            sum += d.confidence;
        return (sum / static_cast<float>(log.size())) * (1.f - change_ratio * 0.5f);
    }
    return p_.default_confidence;
}
