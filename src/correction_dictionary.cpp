#include "correction_dictionary.h"
#include <algorithm>

namespace correction_dict {

const std::unordered_map<wchar_t, std::vector<wchar_t>> &char_confusion() {
    static const std::unordered_map<wchar_t, std::vector<wchar_t>> table{
            // 등록번호
            {L'등', {L'들', L'둥'}},
            {L'들', {L'등'}},
            {L'둥', {L'등'}},
            {L'록', {L'롤', L'녹', L'륙'}},
            {L'롤', {L'록'}},
            {L'녹', {L'록'}},
            {L'륙', {L'록'}},
            {L'번', {L'빈', L'벤'}},
            {L'빈', {L'번'}},
            {L'벤', {L'번'}},
            {L'호', {L'흐', L'효', L'오'}},
            {L'흐', {L'호'}},
            {L'효', {L'호'}},
            // 법인명 / 단체명
            {L'법', {L'범', L'벋', L'번'}},
            {L'범', {L'법'}},
            {L'벋', {L'법'}},
            {L'인', {L'민', L'언'}},
            {L'민', {L'인'}},
            {L'명', {L'멍', L'영'}},
            {L'멍', {L'명'}},
            {L'단', {L'딘'}},
            {L'딘', {L'단'}},
            {L'체', {L'채'}},
            {L'채', {L'체', L'재'}},
            // 대표자
            {L'대', {L'데', L'태', L'내'}},
            {L'데', {L'대'}},
            {L'내', {L'대'}},
            {L'표', {L'포', L'푸'}},
            {L'포', {L'표'}},
            {L'자', {L'지', L'저', L'쟈'}},
            {L'쟈', {L'자'}},
            // 소재지
            {L'소', {L'조', L'쇼'}},
            {L'조', {L'소'}},
            {L'쇼', {L'소'}},
            {L'재', {L'제', L'채'}},
            {L'제', {L'재'}},
            {L'지', {L'자', L'치'}},
            {L'치', {L'지'}},
            // 본점 / 사업장
            {L'본', {L'분', L'볼'}},
            {L'분', {L'본'}},
            {L'볼', {L'본'}},
            {L'점', {L'정', L'접'}},
            {L'정', {L'점'}},
            {L'접', {L'점'}},
            {L'사', {L'서', L'시'}},
            {L'업', {L'엽', L'얻'}},
            {L'엽', {L'업'}},
            {L'얻', {L'업'}},
            {L'장', {L'쟝'}},
            {L'쟝', {L'장'}},
            // 개업연월일
            {L'개', {L'게', L'캐'}},
            {L'게', {L'개'}},
            {L'캐', {L'개'}},
            {L'연', {L'년', L'언'}},
            {L'년', {L'연'}},
            {L'월', {L'윌', L'웕'}},
            {L'윌', {L'월'}},
            {L'웕', {L'월'}},
            {L'일', {L'밀'}},
            {L'밀', {L'일'}},
            // 地名
            {L'별', {L'벌'}},
            {L'벌', {L'별'}},
            {L'도', {L'두'}},
            {L'두', {L'도'}},
            {L'회', {L'화'}},
            {L'화', {L'회'}},
    };
    return table;
}

const std::vector<std::pair<std::wstring, std::wstring>> &latin_confusion() {
    static const std::vector<std::pair<std::wstring, std::wstring>> table{
            {L"HOA", L"충청남도"},
            {L"HQA", L"충청남도"},
            {L"AST", L"서북구"},
            {L"AOE", L"사업장"},
    };
    return table;
}

const std::vector<std::pair<std::wstring, std::wstring>> &word_corrections() {
    static const std::vector<std::pair<std::wstring, std::wstring>> table = [] {
        std::vector<std::pair<std::wstring, std::wstring>> t{
                {L"등륵번호", L"등록번호"},
                {L"등록번오", L"등록번호"},
                {L"법인등롤번호", L"법인등록번호"},
                {L"사엽장", L"사업장"},
                {L"개엽연월일", L"개업연월일"},
                {L"소재치", L"소재지"},
                {L"본정소재지", L"본점소재지"},
                {L"법인멍", L"법인명"},
                {L"단채명", L"단체명"},
                {L"대표쟈", L"대표자"},
                {L"서울특벌시", L"서울특별시"},
                {L"충청남두", L"충청남도"},
                {L"충청북두", L"충청북도"},
                {L"경기두", L"경기도"},
                {L"주식회샤", L"주식회사"},
                {L"주식화사", L"주식회사"},
        };
        // 长的先替换，避免部分重叠
        std::stable_sort(t.begin(), t.end(),
                         [](const auto &a, const auto &b) { return a.first.size() > b.first.size(); });
        return t;
    }();
    return table;
}

const std::unordered_map<std::wstring, double> &bigram_freq() {
    static const std::unordered_map<std::wstring, double> table{
            // 高频
            {L"등록", 0.95}, {L"록번", 0.90}, {L"번호", 0.95}, {L"법인", 0.95}, {L"인등", 0.80},
            {L"인명", 0.80}, {L"대표", 0.95}, {L"표자", 0.90}, {L"소재", 0.90}, {L"재지", 0.90},
            {L"사업", 0.95}, {L"업장", 0.90}, {L"장소", 0.60}, {L"본점", 0.90}, {L"점소", 0.70},
            {L"개업", 0.90}, {L"업연", 0.70}, {L"연월", 0.90}, {L"월일", 0.90}, {L"단체", 0.80},
            {L"체명", 0.80}, {L"특별", 0.90}, {L"별시", 0.85}, {L"광역", 0.90}, {L"역시", 0.80},
            {L"남도", 0.70}, {L"북도", 0.70}, {L"주식", 0.90}, {L"식회", 0.90}, {L"회사", 0.95},
            // 低频（常见 OCR 错误）
            {L"둥록", 0.02}, {L"들록", 0.03}, {L"등롤", 0.02}, {L"등녹", 0.02}, {L"롤번", 0.02},
            {L"록빈", 0.02}, {L"빈호", 0.02}, {L"번흐", 0.02}, {L"범인", 0.04}, {L"법민", 0.03},
            {L"데표", 0.03}, {L"대포", 0.04}, {L"내표", 0.03}, {L"조재", 0.03}, {L"사엽", 0.02},
            {L"엽장", 0.02}, {L"본정", 0.04}, {L"정소", 0.03}, {L"게업", 0.02}, {L"연윌", 0.01},
            {L"윌일", 0.01}, {L"단채", 0.03}, {L"채명", 0.02}, {L"특벌", 0.02}, {L"벌시", 0.02},
            {L"회샤", 0.02}, {L"식화", 0.03},
    };
    return table;
}

const std::unordered_map<std::wstring, double> &trigram_freq() {
    static const std::unordered_map<std::wstring, double> table{
            {L"등록번", 0.90}, {L"록번호", 0.90}, {L"법인명", 0.80}, {L"대표자", 0.90}, {L"소재지", 0.90},
            {L"사업장", 0.90}, {L"본점소", 0.70}, {L"점소재", 0.70}, {L"개업연", 0.80}, {L"업연월", 0.70},
            {L"연월일", 0.90}, {L"법인등", 0.80}, {L"인등록", 0.80}, {L"특별시", 0.90}, {L"광역시", 0.90},
            {L"주식회", 0.90}, {L"식회사", 0.90}, {L"단체명", 0.80},
            {L"대표지", 0.03}, {L"소재치", 0.02}, {L"사업쟝", 0.02}, {L"법인멍", 0.02}, {L"단체멍", 0.02},
            {L"연월밀", 0.02}, {L"록번흐", 0.02},
    };
    return table;
}

const std::vector<std::wstring> &field_keywords() {
    static const std::vector<std::wstring> table{
            L"법인등록번호", L"사업장소재지", L"본점소재지", L"개업연월일", L"등록번호",
            L"법인명", L"단체명", L"대표자", L"소재지",
    };
    return table;
}

const std::vector<std::wstring> &region_gazetteer() {
    static const std::vector<std::wstring> table{
            // 광역자치단체
            L"서울특별시", L"부산광역시", L"대구광역시", L"인천광역시", L"광주광역시", L"대전광역시",
            L"울산광역시", L"세종특별자치시", L"경기도", L"강원도", L"강원특별자치도", L"충청북도",
            L"충청남도", L"전라북도", L"전북특별자치도", L"전라남도", L"경상북도", L"경상남도",
            L"제주특별자치도",
            // 충청남도
            L"천안시", L"서북구", L"동남구", L"아산시", L"공주시", L"보령시", L"서산시", L"논산시",
            L"계룡시", L"당진시", L"금산군", L"부여군", L"서천군", L"청양군", L"홍성군", L"예산군",
            L"태안군",
            // 경기도
            L"수원시", L"성남시", L"고양시", L"용인시", L"부천시", L"안산시", L"안양시", L"남양주시",
            L"화성시", L"평택시", L"의정부시", L"시흥시", L"파주시", L"김포시", L"광명시", L"하남시",
            // 서울특별시 자치구
            L"종로구", L"중구", L"용산구", L"성동구", L"광진구", L"동대문구", L"중랑구", L"성북구",
            L"강북구", L"도봉구", L"노원구", L"은평구", L"서대문구", L"마포구", L"양천구", L"강서구",
            L"구로구", L"금천구", L"영등포구", L"동작구", L"관악구", L"서초구", L"강남구", L"송파구",
            L"강동구",
    };
    return table;
}

const std::vector<std::wstring> &field_start_labels() {
    static const std::vector<std::wstring> table{
            L"법인등록번호", L"법인들록번호", L"번인등록번호", L"본점소재지", L"본정소재지",
            L"본정소재", L"사업장소재지", L"사업장소재", L"사업장", L"개업연월일",
            L"개업연", L"등록번호", L"대표자", L"법인명", L"단체명",
    };
    return table;
}

} // namespace correction_dict
