#include "field_extractor.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <set>
#include "correction_dictionary.h"

// 标签同义词（含常见 OCR 错形）
static const std::vector<std::wstring> kRegistrationKeys{L"등록번호", L"등륵번호", L"등록번오", L"등번호"};
static const std::vector<std::wstring> kCorporateNameKeys{L"법인명", L"단체명", L"상호", L"법인명(단체명)"};
static const std::vector<std::wstring> kRepresentativeKeys{L"대표자", L"성명", L"대표"};
static const std::vector<std::wstring> kDateKeys{L"개업연월일", L"개업일", L"개업년월일"};
static const std::vector<std::wstring> kCorpRegistrationKeys{L"법인등록번호", L"법인등록"};
static const std::vector<std::wstring> kAddressKeys{L"소재지", L"사업장소재지", L"본점소재지", L"주소"};
static const std::vector<std::wstring> kAddressMatchKeys{L"소재지", L"사업장", L"주소"};

// 结构预处理用的规范关键字
static const std::vector<std::wstring> kCanonicalFieldKeywords{
        L"사업장소재지", L"본점소재지", L"법인등록번호", L"개업연월일", L"등록번호", L"대표자", L"법인명", L"단체명",
};

static const std::vector<std::wstring> &all_synonyms() {
    static const std::vector<std::wstring> all = [] {
        std::vector<std::wstring> v;
        for (const auto *group: {&kRegistrationKeys, &kCorporateNameKeys, &kRepresentativeKeys, &kDateKeys,
                                 &kCorpRegistrationKeys, &kAddressKeys})
            v.insert(v.end(), group->begin(), group->end());
        return v;
    }();
    return all;
}

// 长度为 len 的标签允许的编辑距离，上限 (len-1)/divisor：默认两字标签只做精确匹配。divisor <= 0 不设上限
static int effective_distance(size_t len, int threshold, int divisor) {
    if (divisor <= 0)
        return std::max(0, threshold);
    int cap = len > 0 ? static_cast<int>(len - 1) / divisor : 0;
    return std::max(0, std::min(threshold, cap));
}

FuzzyFieldExtractor::ParseContext::ParseContext() :
    regions(correction_dict::region_gazetteer().begin(), correction_dict::region_gazetteer().end()) {}

const std::wstring *FuzzyFieldExtractor::closest_match(const std::wstring &word,
                                                       const std::vector<std::wstring> &candidates, int threshold,
                                                       ParseContext &ctx) const {
    for (const auto &c: candidates) {
        if (word == c)
            return &c;
    }
    const std::wstring *best = nullptr;
    int best_dist = threshold + 1;
    for (const auto &c: candidates) {
        int allowed = effective_distance(c.size(), threshold, p_.label_length_divisor);
        if (allowed == 0)
            continue;
        if (std::abs(static_cast<int>(word.size()) - static_cast<int>(c.size())) > allowed)
            continue;
        int d = ctx.distances.distance(word, c, allowed);
        if (d <= allowed && d < best_dist) {
            best_dist = d;
            best = &c;
        }
    }
    return best;
}

// 只在同一行政后缀（시/도/군/구）的地名之间做模糊匹配，避免把道路名改成区名
const std::wstring *FuzzyFieldExtractor::closest_region(const std::wstring &word, ParseContext &ctx) const {
    const auto &gazetteer = correction_dict::region_gazetteer();
    auto hit = ctx.regions.find(word);
    if (hit != ctx.regions.end())
        return &*hit;

    const std::wstring *best = nullptr;
    int best_dist = p_.region_max_distance + 1;
    for (const auto &region: gazetteer) {
        if (region.back() != word.back())
            continue;
        int allowed = effective_distance(region.size(), p_.region_max_distance, p_.label_length_divisor);
        if (allowed == 0)
            continue;
        if (std::abs(static_cast<int>(word.size()) - static_cast<int>(region.size())) > allowed)
            continue;
        int d = ctx.distances.distance(word, region, allowed);
        if (d <= allowed && d < best_dist) {
            best_dist = d;
            best = &region;
        }
    }
    return best;
}

bool FuzzyFieldExtractor::contains_region(const std::wstring &s) const {
    for (const auto &region: correction_dict::region_gazetteer()) {
        if (contains(s, region))
            return true;
    }
    return false;
}

bool FuzzyFieldExtractor::fuzzy_match_field_keyword(const std::wstring &candidate, int max_distance,
                                                    ParseContext &ctx, size_t &offset) const {
    const std::wstring norm = strip_whitespace(candidate);
    // 允许 0~2 个字的垃圾前缀："일법인등록번호"
    for (size_t prefix = 0; prefix <= 2 && prefix < norm.size(); ++prefix) {
        const std::wstring c = norm.substr(prefix);
        if (c.size() < 2)
            break;
        for (const auto &kw: kCanonicalFieldKeywords) {
            size_t pos = c.find(kw);
            if (pos != std::wstring::npos) {
                offset = prefix + pos;
                return true;
            }
            int allowed = effective_distance(kw.size(), max_distance, p_.label_length_divisor);
            if (allowed == 0)
                continue;
            int len_diff = std::abs(static_cast<int>(c.size()) - static_cast<int>(kw.size()));
            if (len_diff <= allowed && ctx.distances.distance(c, kw, allowed) <= allowed) {
                offset = prefix;
                return true;
            }
            // 前缀带 OCR 错字："법인들록번호" ~ "법인등록번호"
            if (c.size() >= kw.size() && ctx.distances.distance(c.substr(0, kw.size()), kw, allowed) <= allowed) {
                offset = prefix;
                return true;
            }
        }
    }
    return false;
}

// 多个字段被 OCR 识别到同一行时，在可识别的 "标签:" 前断行
std::wstring FuzzyFieldExtractor::preprocess(const std::wstring &text, ParseContext &ctx) const {
    static const std::wregex date_suffix(L"(\\d{1,2}일)([가-힣])");
    static const std::wregex split_number_label(L"등록번\\s+호\\s*:");
    static const std::wregex key_value(L"([가-힣]{2,8})\\s*:");
    static const std::wregex garbage_prefix(L"([일법번])([가-힣]{2,7}):");

    std::wstring result = std::regex_replace(text, date_suffix, L"$1 $2");
    result = std::regex_replace(result, split_number_label, L"등록번호:");

    auto at_line_start = [&result](size_t idx) {
        return idx == 0 || result[idx - 1] == L'\n' || result[idx - 1] == L'\r';
    };

    std::set<size_t> boundaries;
    for (auto it = std::wsregex_iterator(result.begin(), result.end(), key_value); it != std::wsregex_iterator();
         ++it) {
        size_t offset = 0;
        if (!fuzzy_match_field_keyword((*it)[1].str(), p_.permissive_threshold, ctx, offset))
            continue;
        size_t idx = static_cast<size_t>(it->position(1)) + offset;
        if (!at_line_start(idx))
            boundaries.insert(idx);
    }
    for (auto it = std::wsregex_iterator(result.begin(), result.end(), garbage_prefix);
         it != std::wsregex_iterator(); ++it) {
        size_t offset = 0;
        if (!fuzzy_match_field_keyword((*it)[2].str(), p_.permissive_threshold, ctx, offset))
            continue;
        size_t idx = static_cast<size_t>(it->position(0));
        size_t end = idx + static_cast<size_t>(it->length(0));
        if (at_line_start(idx))
            continue;
        auto existing = boundaries.lower_bound(idx);
        if (existing != boundaries.end() && *existing < end)
            continue;
        boundaries.insert(idx);
    }

    // 从后往前插入，下标不失效
    for (auto it = boundaries.rbegin(); it != boundaries.rend(); ++it)
        result.insert(*it, 1, L'\n');
    return result;
}

std::wstring FuzzyFieldExtractor::normalize_line(const std::wstring &line, ParseContext &ctx) const {
    static const std::wregex company_mark(L"\\([Ff]\\)");
    std::wstring clean = std::regex_replace(line, company_mark, L"(주)");
    clean.erase(std::remove_if(clean.begin(), clean.end(), [](wchar_t c) { return c == L'[' || c == L']'; }),
                clean.end());
    clean = trim(clean);

    std::vector<std::wstring> words = split_whitespace(clean);
    for (auto &word: words) {
        if (ctx.regions.count(word))
            continue;

        bool replaced = false;
        for (const auto &pr: correction_dict::latin_confusion()) {
            if (word == pr.first) {
                word = pr.second;
                replaced = true;
                break;
            }
        }
        if (replaced)
            continue;

        if (word.size() >= 2 && word.size() <= 6 && std::any_of(word.begin(), word.end(), is_hangul)) {
            if (const std::wstring *region = closest_region(word, ctx))
                word = *region;
        }
    }
    return join(words, L" ");
}

FuzzyFieldExtractor::LineView FuzzyFieldExtractor::make_view(const std::wstring &line) const {
    static const std::wregex wide_gap(L"\\s{2,}");
    LineView v;
    v.line = line;
    size_t colon = line.find(L':');
    if (colon != std::wstring::npos) {
        v.clean_key = keep_key_chars(line.substr(0, colon));
        v.value = trim(line.substr(colon + 1));
        std::wsregex_token_iterator parts(v.value.cbegin(), v.value.cend(), wide_gap, -1);
        if (parts != std::wsregex_token_iterator())
            v.first_value = trim(parts->str());
    } else {
        v.clean_key = keep_key_chars(line);
    }
    return v;
}

bool FuzzyFieldExtractor::key_matches(const std::wstring &clean_key, const std::vector<std::wstring> &synonyms,
                                      int threshold, ParseContext &ctx) const {
    for (const auto &s: synonyms) {
        if (contains(clean_key, s))
            return true;
    }
    if (threshold <= 0)
        return false;

    for (const auto &s: synonyms) {
        const std::wstring key = keep_key_chars(s);
        int allowed = effective_distance(key.size(), threshold, p_.label_length_divisor);
        if (allowed == 0)
            continue;
        // 标签应在行首附近，最多容忍两个垃圾字
        for (size_t start = 0; start <= 2 && start < clean_key.size(); ++start) {
            for (int w = static_cast<int>(key.size()) - allowed; w <= static_cast<int>(key.size()) + allowed; ++w) {
                if (w < 2 || start + static_cast<size_t>(w) > clean_key.size())
                    continue;
                // 比标签短的窗口只在键尾取："법인" 不能当作 "법인명"
                if (w < static_cast<int>(key.size()) && start + static_cast<size_t>(w) != clean_key.size())
                    continue;
                if (ctx.distances.distance(clean_key.substr(start, static_cast<size_t>(w)), key, allowed) <= allowed)
                    return true;
            }
        }
    }
    return false;
}

std::wstring FuzzyFieldExtractor::truncate_at_next_key(const std::wstring &value, ParseContext &ctx) const {
    if (value.empty())
        return value;

    const auto &synonyms = all_synonyms();
    size_t cut = std::wstring::npos;
    for (const auto &s: synonyms) {
        size_t idx = value.find(s);
        if (idx != std::wstring::npos && idx > 1 && idx < cut)
            cut = idx;
    }
    if (cut != std::wstring::npos)
        return trim(value.substr(0, cut));

    const std::vector<std::wstring> words = split_whitespace(value);
    for (size_t i = 1; i < words.size(); ++i) {
        if (words[i].size() < 2)
            continue;
        if (closest_match(words[i], synonyms, p_.truncate_max_distance, ctx)) {
            std::vector<std::wstring> head(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(i));
            return trim(join(head, L" "));
        }
    }
    return value;
}

std::string FuzzyFieldExtractor::truncate_at_next_key(const std::string &value) const {
    ParseContext ctx;
    return wide_to_utf8(truncate_at_next_key(utf8_to_wide(value), ctx));
}

// 行内出现的第一个地名之前的部分
static std::wstring cut_at_region(const std::wstring &s) {
    size_t cut = std::wstring::npos;
    for (const auto &region: correction_dict::region_gazetteer()) {
        size_t idx = s.find(region);
        if (idx != std::wstring::npos && idx < cut)
            cut = idx;
    }
    return cut == std::wstring::npos ? s : trim(s.substr(0, cut));
}

bool FuzzyFieldExtractor::match_line(const LineView &v, int threshold, FieldRecord &rec, ParseContext &ctx) const {
    static const std::wregex corp_registration_key(L"^.?[법범번]인[등들둥][록녹륙롤]");
    static const std::wregex strict_registration(L"(^|\\D)\\d{3}-\\d{2}-\\d{5}(?!\\d)");
    static const std::wregex registration_value(L"(^|\\D)(\\d{3}[-\\s]?\\d{2}[-\\s]?\\d{5})(?!\\d)");
    static const std::wregex name_labels(L"법인명|\\(단체명\\)|단체명|상호|:");
    static const std::wregex name_parens(L"\\(법인명\\)|\\(단체명\\)");
    static const std::wregex non_word(L"[^가-힣A-Za-z0-9\\s]");
    static const std::wregex representative_labels(L"대표자|내표자|대표이사|성명");
    static const std::wregex date_value(L"\\d{4}\\s?년\\s?\\d{2}\\s?월\\s?\\d{2}\\s?일");
    static const std::wregex address_labels(L"본점소재지|사업장소재지|소재지|사업장|본점|주소|:");

    const std::wstring &key = v.clean_key;
    bool produced = false;

    // 1. 등록번호
    if (rec.registration_number.empty() && !std::regex_search(key, corp_registration_key)) {
        if (key_matches(key, kRegistrationKeys, threshold, ctx) || std::regex_search(v.line, strict_registration)) {
            std::wsmatch m;
            if (std::regex_search(v.line, m, registration_value)) {
                rec.registration_number = wide_to_utf8(m[2].str());
                produced = true;
            }
        }
    }

    // 2. 법인명：법인사업자 / 사업자 表头和 법인등록번호 行显式排除
    if (rec.corporate_name.empty() && !starts_with(key, L"법인사업") && !starts_with(key, L"사업자") &&
        !std::regex_search(key, corp_registration_key) && key_matches(key, kCorporateNameKeys, threshold, ctx)) {
        std::wstring raw = v.first_value;
        if (raw.empty())
            raw = trim(std::regex_replace(v.line, name_labels, L""));
        raw = std::regex_replace(raw, name_parens, L"");
        std::wstring value = trim(truncate_at_next_key(raw, ctx));
        if (!value.empty()) {
            rec.corporate_name = wide_to_utf8(value);
            produced = true;
        }
    }

    // 3. 대표자：地址可能被拼到同一行
    if (rec.representative.empty() && key_matches(key, kRepresentativeKeys, threshold, ctx)) {
        std::wstring value = v.first_value.empty() ? std::wstring() : cut_at_region(v.first_value);
        if (!value.empty()) {
            value = truncate_at_next_key(value, ctx);
        } else {
            std::wstring temp = trim(std::regex_replace(v.line, non_word, L" "));
            temp = trim(std::regex_replace(temp, representative_labels, L""));
            value = truncate_at_next_key(cut_at_region(temp), ctx);
        }
        value = trim(value);
        if (!value.empty()) {
            rec.representative = wide_to_utf8(value);
            produced = true;
        }
    }

    // 4. 개업연월일
    if (rec.establishment_date.empty() && key_matches(key, kDateKeys, threshold, ctx)) {
        std::wsmatch m;
        std::wstring value;
        if (std::regex_search(v.line, m, date_value))
            value = m.str(0);
        else if (!v.first_value.empty())
            value = trim(truncate_at_next_key(v.first_value, ctx));
        if (!value.empty()) {
            rec.establishment_date = wide_to_utf8(value);
            produced = true;
        }
    }

    // 5. 소재지：区分 본점 / 사업장
    if (key_matches(key, kAddressMatchKeys, threshold, ctx)) {
        const bool is_head = contains(key, L"본점") || contains(key, L"본정") ||
                             (key.size() >= 4 && ctx.distances.distance(key.substr(0, 4), L"본점소재", 1) <= 1);
        const bool is_business = contains(key, L"사업장");

        std::wstring value = v.value;
        if (value.empty() && contains_region(v.line))
            value = trim(std::regex_replace(v.line, address_labels, L""));

        if (!value.empty()) {
            if (is_head && rec.head_address.empty()) {
                rec.head_address = wide_to_utf8(value);
                produced = true;
            } else if (rec.business_address.empty() && (!is_head || is_business)) {
                rec.business_address = wide_to_utf8(value);
                produced = true;
            }
        }
    }
    return produced;
}

void FuzzyFieldExtractor::match_corporate_registration_number(const std::vector<LineView> &views,
                                                              FieldRecord &rec) const {
    static const std::wregex label(L"법인[등들둥][록녹륙롤][번빈]호");
    static const std::vector<std::wregex> patterns{
            std::wregex(L":\\s*(\\d{6})[-\\s]?(\\d{7})"),
            std::wregex(L"(\\d{6})[-\\s]?(\\d{7})"),
            std::wregex(L"(\\d{6})\\D?(\\d{7})"),
            std::wregex(L"(\\d{13})"),
    };

    for (const auto &v: views) {
        if (!std::regex_search(strip_whitespace(v.line), label))
            continue;
        for (const auto &re: patterns) {
            std::wsmatch m;
            if (!std::regex_search(v.line, m, re))
                continue;
            if (m.size() > 2 && m[2].matched) {
                rec.corporate_registration_number = wide_to_utf8(m[1].str() + L"-" + m[2].str());
            } else if (m[1].length() == 13) {
                const std::wstring digits = m[1].str();
                rec.corporate_registration_number = wide_to_utf8(digits.substr(0, 6) + L"-" + digits.substr(6));
            }
            break;
        }
        if (!rec.corporate_registration_number.empty())
            return;
    }
}

FieldRecord FuzzyFieldExtractor::extract(const std::string &text) const {
    ParseContext ctx;

    std::wstring wtext = utf8_to_wide(text);
    std::replace(wtext.begin(), wtext.end(), L'\xFF1A', L':'); // 全角冒号
    wtext = preprocess(wtext, ctx);

    std::vector<LineView> views;
    for (const auto &raw: split_lines(wtext)) {
        std::wstring line = normalize_line(raw, ctx);
        if (!line.empty())
            views.push_back(make_view(line));
    }

    FieldRecord rec;
    std::vector<bool> consumed(views.size(), false);
    for (int threshold: {p_.strict_threshold, p_.permissive_threshold}) {
        for (size_t i = 0; i < views.size(); ++i) {
            if (consumed[i])
                continue;
            if (match_line(views[i], threshold, rec, ctx))
                consumed[i] = true;
        }
    }

    match_corporate_registration_number(views, rec);

    if (rec.business_address.empty() && rec.head_address.empty()) {
        static const std::wregex fallback_labels(L"본점소재지|사업장소재지|소재지|:");
        for (const auto &v: views) {
            if (contains_region(v.line)) {
                rec.business_address = wide_to_utf8(trim(std::regex_replace(v.line, fallback_labels, L"")));
                break;
            }
        }
    }

#ifndef NDEBUG
    std::cout << "[PIPE] parsed lines=" << views.size() << " memo=" << ctx.distances.size() << "\n";
#endif
    return rec;
}
