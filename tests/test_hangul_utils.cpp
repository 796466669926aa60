#include <gtest/gtest.h>
#include "hangul_utils.h"

TEST(HangulUtils, Utf8RoundTrip) {
    const std::string s = "사업자등록증 (법인) 123-45-67890";
    std::wstring w = utf8_to_wide(s);
    EXPECT_EQ(w.size(), 24u);
    EXPECT_EQ(wide_to_utf8(w), s);
}

TEST(HangulUtils, InvalidUtf8BecomesReplacementChar) {
    std::string bad = "A";
    bad.push_back(static_cast<char>(0xEC)); // 截断的三字节序列
    std::wstring w = utf8_to_wide(bad);
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[1], static_cast<wchar_t>(0xFFFD));
}

TEST(HangulUtils, DecomposeAndCompose) {
    HangulJamo j;
    ASSERT_TRUE(decompose_hangul(L'한', j));
    EXPECT_EQ(j.cho, 18);
    EXPECT_EQ(j.jung, 0);
    EXPECT_EQ(j.jong, 4);
    EXPECT_EQ(compose_hangul(j.cho, j.jung, j.jong), L'한');
    EXPECT_FALSE(decompose_hangul(L'A', j));
}

TEST(HangulUtils, JamoSimilarity) {
    EXPECT_FLOAT_EQ(jamo_similarity(L'가', L'가'), 1.f);
    EXPECT_FLOAT_EQ(jamo_similarity(L'가', L'각'), 0.8f);
    EXPECT_FLOAT_EQ(jamo_similarity(L'명', L'멍'), 0.6f);
    EXPECT_FLOAT_EQ(jamo_similarity(L'가', L'A'), 0.f);
}

TEST(HangulUtils, LevenshteinProperties) {
    const std::wstring a = L"등록번호", b = L"등륵번오", c = L"대표자";
    EXPECT_EQ(levenshtein(a, a), 0);
    EXPECT_EQ(levenshtein(L"", c), 3);
    EXPECT_EQ(levenshtein(c, L""), 3);
    EXPECT_EQ(levenshtein(a, b), levenshtein(b, a));
    EXPECT_EQ(levenshtein(a, b), 2);
    EXPECT_EQ(levenshtein(L"소재지", L"본점소재지"), 2);
}

TEST(HangulUtils, BoundedDistanceStopsEarly) {
    EXPECT_EQ(levenshtein_bounded(L"등록번호", L"등록번오", 1), 1);
    EXPECT_GT(levenshtein_bounded(L"등록번호", L"사업장소재지", 1), 1);
    EXPECT_GT(levenshtein_bounded(L"가나다라", L"마바사아", 2), 2);
}

TEST(HangulUtils, EditDistanceCacheIsSymmetric) {
    EditDistanceCache cache;
    EXPECT_EQ(cache.distance(L"대표자", L"대표지", 2), 1);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.distance(L"대표지", L"대표자", 2), 1);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.distance(L"대표자", L"대표자"), 0);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(HangulUtils, StringHelpers) {
    EXPECT_EQ(trim(L"  소재지 \n"), L"소재지");
    EXPECT_EQ(keep_key_chars(L"법인명(단체명) "), L"법인명단체명");
    EXPECT_EQ(strip_whitespace(L"본 정 소"), L"본정소");
    auto words = split_whitespace(L" 서울특별시  강남구\t테헤란로 ");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[2], L"테헤란로");
    auto lines = split_lines(L"a\r\nb\nc");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], L"b");
    EXPECT_EQ(join(words, L"|"), L"서울특별시|강남구|테헤란로");
    EXPECT_TRUE(starts_with(L"법인등록번호", L"법인등록"));
    EXPECT_FALSE(starts_with(L"법인", L"법인등록"));
}
