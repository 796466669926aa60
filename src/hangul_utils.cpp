#include "hangul_utils.h"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cwchar>

static constexpr wchar_t kHangulBase = 0xAC00;

std::wstring utf8_to_wide(const std::string &s) {
    std::wstring out;
    out.reserve(s.size());
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        uint32_t cp = 0;
        int extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            // 非法起始字节，替换成 U+FFFD
            out.push_back(static_cast<wchar_t>(0xFFFD));
            ++i;
            continue;
        }
        bool ok = true;
        for (int k = 1; k <= extra; ++k) {
            if (i + k >= n) {
                ok = false;
                break;
            }
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok) {
            out.push_back(static_cast<wchar_t>(0xFFFD));
            ++i;
            continue;
        }
        i += extra + 1;
#if WCHAR_MAX <= 0xFFFF
        // Windows: wchar_t 为 UTF-16
        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<wchar_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<wchar_t>(0xDC00 + (cp & 0x3FF)));
            continue;
        }
#endif
        out.push_back(static_cast<wchar_t>(cp));
    }
    return out;
}

static void append_utf8(std::string &out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string wide_to_utf8(const std::wstring &ws) {
    std::string out;
    out.reserve(ws.size() * 3);
    for (size_t i = 0; i < ws.size(); ++i) {
        uint32_t cp = static_cast<uint32_t>(ws[i]);
#if WCHAR_MAX <= 0xFFFF
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < ws.size()) {
            uint32_t lo = static_cast<uint32_t>(ws[i + 1]);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                ++i;
            }
        }
#endif
        append_utf8(out, cp);
    }
    return out;
}

bool decompose_hangul(wchar_t c, HangulJamo &out) {
    if (!is_hangul(c))
        return false;
    int code = static_cast<int>(c - kHangulBase);
    out.cho = code / 588;
    out.jung = (code % 588) / 28;
    out.jong = code % 28;
    return true;
}

wchar_t compose_hangul(int cho, int jung, int jong) {
    if (cho < 0 || cho > 18 || jung < 0 || jung > 20 || jong < 0 || jong > 27)
        return 0;
    return static_cast<wchar_t>(kHangulBase + cho * 588 + jung * 28 + jong);
}

float jamo_similarity(wchar_t a, wchar_t b) {
    HangulJamo ja, jb;
    if (!decompose_hangul(a, ja) || !decompose_hangul(b, jb))
        return 0.f;
    float score = 0.f;
    if (ja.cho == jb.cho)
        score += 0.4f;
    if (ja.jung == jb.jung)
        score += 0.4f;
    if (ja.jong == jb.jong)
        score += 0.2f;
    return score;
}

static inline bool is_space(wchar_t c) {
    return c == L' ' || c == L'\t' || c == L'\n' || c == L'\r' || c == L'\f' || c == L'\v' || c == 0x3000 ||
           c == 0x00A0;
}

std::wstring trim(const std::wstring &s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b]))
        ++b;
    while (e > b && is_space(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

std::vector<std::wstring> split_whitespace(const std::wstring &s) {
    std::vector<std::wstring> out;
    std::wstring cur;
    for (wchar_t c: s) {
        if (is_space(c)) {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        out.push_back(cur);
    return out;
}

std::vector<std::wstring> split_lines(const std::wstring &s) {
    std::vector<std::wstring> out;
    std::wstring cur;
    for (size_t i = 0; i < s.size(); ++i) {
        wchar_t c = s[i];
        if (c == L'\r' || c == L'\n') {
            out.push_back(cur);
            cur.clear();
            if (c == L'\r' && i + 1 < s.size() && s[i + 1] == L'\n')
                ++i;
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

std::wstring join(const std::vector<std::wstring> &parts, const std::wstring &sep) {
    std::wstring out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i)
            out += sep;
        out += parts[i];
    }
    return out;
}

std::wstring keep_key_chars(const std::wstring &s) {
    std::wstring out;
    out.reserve(s.size());
    for (wchar_t c: s) {
        if (is_hangul(c) || is_latin(c) || is_ascii_digit(c))
            out.push_back(c);
    }
    return out;
}

std::wstring strip_whitespace(const std::wstring &s) {
    std::wstring out;
    out.reserve(s.size());
    for (wchar_t c: s) {
        if (!is_space(c))
            out.push_back(c);
    }
    return out;
}

bool contains(const std::wstring &haystack, const std::wstring &needle) {
    return haystack.find(needle) != std::wstring::npos;
}

bool starts_with(const std::wstring &s, const std::wstring &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

int levenshtein(const std::wstring &a, const std::wstring &b) {
    if (a == b)
        return 0;
    if (a.empty())
        return static_cast<int>(b.size());
    if (b.empty())
        return static_cast<int>(a.size());

    const std::wstring &shorter = a.size() < b.size() ? a : b;
    const std::wstring &longer = a.size() < b.size() ? b : a;
    const size_t m = shorter.size();
    std::vector<int> prev(m + 1), curr(m + 1);
    for (size_t j = 0; j <= m; ++j)
        prev[j] = static_cast<int>(j);
    for (size_t i = 1; i <= longer.size(); ++i) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= m; ++j) {
            if (longer[i - 1] == shorter[j - 1])
                curr[j] = prev[j - 1];
            else
                curr[j] = 1 + std::min({prev[j - 1], prev[j], curr[j - 1]});
        }
        std::swap(prev, curr);
    }
    return prev[m];
}

int levenshtein_bounded(const std::wstring &a, const std::wstring &b, int max_threshold) {
    if (a == b)
        return 0;
    const int len_diff = std::abs(static_cast<int>(a.size()) - static_cast<int>(b.size()));
    if (len_diff > max_threshold)
        return len_diff;
    if (a.empty())
        return static_cast<int>(b.size());
    if (b.empty())
        return static_cast<int>(a.size());

    const std::wstring &shorter = a.size() < b.size() ? a : b;
    const std::wstring &longer = a.size() < b.size() ? b : a;
    const size_t m = shorter.size();
    std::vector<int> prev(m + 1), curr(m + 1);
    for (size_t j = 0; j <= m; ++j)
        prev[j] = static_cast<int>(j);
    for (size_t i = 1; i <= longer.size(); ++i) {
        curr[0] = static_cast<int>(i);
        int row_min = curr[0];
        for (size_t j = 1; j <= m; ++j) {
            if (longer[i - 1] == shorter[j - 1])
                curr[j] = prev[j - 1];
            else
                curr[j] = 1 + std::min({prev[j - 1], prev[j], curr[j - 1]});
            row_min = std::min(row_min, curr[j]);
        }
        // 整行都超过阈值，后面只会更大
        if (row_min > max_threshold)
            return row_min;
        std::swap(prev, curr);
    }
    return prev[m];
}

int EditDistanceCache::distance(const std::wstring &a, const std::wstring &b, int max_threshold) {
    if (a == b)
        return 0;
    std::wstring key = a < b ? a + L'\x1F' + b : b + L'\x1F' + a;
    key.push_back(L'\x1F');
    key.push_back(static_cast<wchar_t>(L'0' + std::min(max_threshold, 9)));
    auto it = memo_.find(key);
    if (it != memo_.end())
        return it->second;
    int d = levenshtein_bounded(a, b, max_threshold);
    memo_.emplace(std::move(key), d);
    return d;
}
