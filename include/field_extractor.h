#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include "hangul_utils.h"

// 사업자등록증 字段；未识别的保持空串
struct FieldRecord {
    std::string registration_number;           // 등록번호
    std::string corporate_name;                // 법인명(단체명)
    std::string representative;                // 대표자
    std::string establishment_date;            // 개업연월일
    std::string corporate_registration_number; // 법인등록번호
    std::string business_address;              // 사업장소재지
    std::string head_address;                  // 본점소재지
};

class FuzzyFieldExtractor {
public:
    struct Params {
        int strict_threshold = 1;     // 第一遍
        int permissive_threshold = 2; // 第二遍
        int region_max_distance = 2;
        int truncate_max_distance = 1;
        int label_length_divisor = 2; // 标签长度 L 最多容忍 (L-1)/divisor 处错误，<= 0 不限
    };

    FuzzyFieldExtractor() = default;
    explicit FuzzyFieldExtractor(const Params &p) : p_(p) {}

    FieldRecord extract(const std::string &text) const;

    // 值里混进了下一个字段的标签时截断："홍길동 대표자" -> "홍길동"
    std::string truncate_at_next_key(const std::string &value) const;

private:
    Params p_;

    // 单次解析的状态：编辑距离缓存 + 地名集合
    struct ParseContext {
        EditDistanceCache distances;
        std::unordered_set<std::wstring> regions;
        ParseContext();
    };

    struct LineView {
        std::wstring line;      // 规范化后的整行
        std::wstring clean_key; // 键部分，仅保留 韩文/字母/数字
        std::wstring value;     // 冒号之后
        std::wstring first_value; // 冒号之后，遇到两个以上空白截断
    };

    std::wstring preprocess(const std::wstring &text, ParseContext &ctx) const;
    std::wstring normalize_line(const std::wstring &line, ParseContext &ctx) const;
    LineView make_view(const std::wstring &line) const;

    // 返回匹配到的规范关键字，offset 为关键字在 candidate 中的起点
    bool fuzzy_match_field_keyword(const std::wstring &candidate, int max_distance, ParseContext &ctx,
                                   size_t &offset) const;
    const std::wstring *closest_match(const std::wstring &word, const std::vector<std::wstring> &candidates,
                                      int threshold, ParseContext &ctx) const;
    const std::wstring *closest_region(const std::wstring &word, ParseContext &ctx) const;
    bool key_matches(const std::wstring &clean_key, const std::vector<std::wstring> &synonyms, int threshold,
                     ParseContext &ctx) const;
    bool contains_region(const std::wstring &s) const;
    std::wstring truncate_at_next_key(const std::wstring &value, ParseContext &ctx) const;

    // 一行一遍；返回该行是否产出了字段值
    bool match_line(const LineView &v, int threshold, FieldRecord &rec, ParseContext &ctx) const;
    void match_corporate_registration_number(const std::vector<LineView> &views, FieldRecord &rec) const;
};
