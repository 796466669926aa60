#include <gtest/gtest.h>
#include "field_extractor.h"

TEST(FuzzyFieldExtractor, FullCertificate) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("사업자등록증\n"
                                      "(법인사업자)\n"
                                      "등록번호 : 123-45-67890\n"
                                      "법인명(단체명) : 주식회사 한빛소프트\n"
                                      "대표자 : 홍길동\n"
                                      "개업연월일 : 2015년 03월 02일\n"
                                      "법인등록번호 : 110111-1234567\n"
                                      "사업장소재지 : 서울특별시 강남구 테헤란로 123\n"
                                      "본점소재지 : 서울특별시 서초구 서초대로 456\n");
    EXPECT_EQ(r.registration_number, "123-45-67890");
    EXPECT_EQ(r.corporate_name, "주식회사 한빛소프트");
    EXPECT_EQ(r.representative, "홍길동");
    EXPECT_EQ(r.establishment_date, "2015년 03월 02일");
    EXPECT_EQ(r.corporate_registration_number, "110111-1234567");
    EXPECT_EQ(r.business_address, "서울특별시 강남구 테헤란로 123");
    EXPECT_EQ(r.head_address, "서울특별시 서초구 서초대로 456");
}

TEST(FuzzyFieldExtractor, SpacedOutHeadOfficeLabel) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("본 정 소 재 지 : 서울특별시 서초구 서초대로 456");
    EXPECT_NE(r.head_address.find("서초구"), std::string::npos);
    EXPECT_TRUE(r.business_address.empty());
}

TEST(FuzzyFieldExtractor, RegistrationNumber) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.extract("등록번호 : 111-22-33333").registration_number, "111-22-33333");
    // 无标签但格式严格
    EXPECT_EQ(extractor.extract("123-45-67890").registration_number, "123-45-67890");
}

TEST(FuzzyFieldExtractor, CorporateNumberIsNotRegistrationNumber) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("법인등록번호 : 110111-1234567");
    EXPECT_TRUE(r.registration_number.empty());
    EXPECT_TRUE(r.corporate_name.empty());
    EXPECT_EQ(r.corporate_registration_number, "110111-1234567");
}

TEST(FuzzyFieldExtractor, CorporateNumberWithTypoAndNoDash) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.extract("법인들록번호 : 1101111234567").corporate_registration_number, "110111-1234567");
}

TEST(FuzzyFieldExtractor, TruncateAtNextKey) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.truncate_at_next_key("홍길동 대표자"), "홍길동");
    EXPECT_EQ(extractor.truncate_at_next_key("주식회사 한빛소프트"), "주식회사 한빛소프트");
    EXPECT_EQ(extractor.truncate_at_next_key(""), "");
}

TEST(FuzzyFieldExtractor, CorporateNameStopsAtNextLabel) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.extract("법인명(단체명) : 주식회사 한빛 대표자 홍길동").corporate_name, "주식회사 한빛");
}

TEST(FuzzyFieldExtractor, SplitsFieldsMergedOnOneLine) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("대표자 : 홍길동 개업연월일 : 2015년 03월 02일");
    EXPECT_EQ(r.representative, "홍길동");
    EXPECT_EQ(r.establishment_date, "2015년 03월 02일");
}

TEST(FuzzyFieldExtractor, DateSuffixGluedToNextLabel) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("개업연월일 : 2015년 03월 02일법인등록번호 : 110111-1234567");
    EXPECT_EQ(r.establishment_date, "2015년 03월 02일");
    EXPECT_EQ(r.corporate_registration_number, "110111-1234567");
}

TEST(FuzzyFieldExtractor, TypoLabelsMatchFuzzily) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("등륵번호 : 123-45-67890\n대표지 : 김철수");
    EXPECT_EQ(r.registration_number, "123-45-67890");
    EXPECT_EQ(r.representative, "김철수");
}

TEST(FuzzyFieldExtractor, RegionWordsAreCorrected) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.extract("사업장소재지 : 서울특벌시 강남구").business_address, "서울특별시 강남구");
    EXPECT_EQ(extractor.extract("사업장소재지 : HOA 천안시 AST").business_address, "충청남도 천안시 서북구");
}

TEST(FuzzyFieldExtractor, RoadNamesAreNotTurnedIntoDistricts) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.extract("사업장소재지 : 서울특별시 서초구 서초대로 456").business_address,
              "서울특별시 서초구 서초대로 456");
}

TEST(FuzzyFieldExtractor, AddressFallbackUsesFirstRegionLine) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("주식회사 한빛\n서울특별시 강남구 테헤란로 123");
    EXPECT_EQ(r.business_address, "서울특별시 강남구 테헤란로 123");
    EXPECT_TRUE(r.head_address.empty());
}

TEST(FuzzyFieldExtractor, FullWidthColon) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.extract("대표자\xEF\xBC\x9A 홍길동").representative, "홍길동");
}

TEST(FuzzyFieldExtractor, EmptyInputGivesEmptyRecord) {
    FuzzyFieldExtractor extractor;
    FieldRecord r = extractor.extract("");
    EXPECT_TRUE(r.registration_number.empty());
    EXPECT_TRUE(r.corporate_name.empty());
    EXPECT_TRUE(r.business_address.empty());
}

// 两处错字的五字标签：第一遍（阈值 1）匹配不上，第二遍（阈值 2）补上
TEST(FuzzyFieldExtractor, PermissivePassFillsWhatStrictPassMisses) {
    FuzzyFieldExtractor extractor;
    EXPECT_EQ(extractor.extract("게엽연월일 : 2015년 03월 02일").establishment_date, "2015년 03월 02일");

    FuzzyFieldExtractor::Params strict_only;
    strict_only.permissive_threshold = 1;
    FuzzyFieldExtractor strict(strict_only);
    EXPECT_TRUE(strict.extract("게엽연월일 : 2015년 03월 02일").establishment_date.empty());
}

TEST(FuzzyFieldExtractor, LabelLengthCapIsTunable) {
    FuzzyFieldExtractor capped;
    EXPECT_TRUE(capped.extract("데포자 : 김철수").representative.empty());

    FuzzyFieldExtractor::Params p;
    p.label_length_divisor = 0;
    FuzzyFieldExtractor uncapped(p);
    EXPECT_EQ(uncapped.extract("데포자 : 김철수").representative, "김철수");
}
