#pragma once
#include <string>
#include <unordered_map>
#include <vector>

// UTF-8 <-> 宽字符。文本阶段全部在 std::wstring 上做（std::wregex 需要按码点匹配）
std::wstring utf8_to_wide(const std::string &s);
std::string wide_to_utf8(const std::wstring &ws);

struct HangulJamo {
    int cho{-1};  // 初声 0..18
    int jung{-1}; // 中声 0..20
    int jong{0};  // 终声 0..27 (0 = 无)
};

inline bool is_hangul(wchar_t c) { return c >= 0xAC00 && c <= 0xD7A3; }
inline bool is_jamo(wchar_t c) { return c >= 0x3131 && c <= 0x3163; }
inline bool is_latin(wchar_t c) { return (c >= L'a' && c <= L'z') || (c >= L'A' && c <= L'Z'); }
inline bool is_ascii_digit(wchar_t c) { return c >= L'0' && c <= L'9'; }

bool decompose_hangul(wchar_t c, HangulJamo &out);
wchar_t compose_hangul(int cho, int jung, int jong = 0);

// 0.4 初声 + 0.4 中声 + 0.2 终声，非韩文返回 0
float jamo_similarity(wchar_t a, wchar_t b);

std::wstring trim(const std::wstring &s);
std::vector<std::wstring> split_whitespace(const std::wstring &s);
std::vector<std::wstring> split_lines(const std::wstring &s);
std::wstring join(const std::vector<std::wstring> &parts, const std::wstring &sep);
// 只保留 韩文音节 / 拉丁字母 / 数字
std::wstring keep_key_chars(const std::wstring &s);
std::wstring strip_whitespace(const std::wstring &s);
bool contains(const std::wstring &haystack, const std::wstring &needle);
bool starts_with(const std::wstring &s, const std::wstring &prefix);

int levenshtein(const std::wstring &a, const std::wstring &b);
// 超过 max_threshold 时提前返回（返回值 > max_threshold 但不一定是精确距离）
int levenshtein_bounded(const std::wstring &a, const std::wstring &b, int max_threshold);

// 单次解析内的编辑距离缓存，随调用创建和销毁
class EditDistanceCache {
public:
    int distance(const std::wstring &a, const std::wstring &b, int max_threshold = 3);
    size_t size() const { return memo_.size(); }
    void clear() { memo_.clear(); }

private:
    std::unordered_map<std::wstring, int> memo_;
};
