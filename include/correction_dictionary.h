#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// 사업자등록증 OCR 用的固定词表（只读，进程内单例）
namespace correction_dict {

// 字符 -> 易混淆字符
const std::unordered_map<wchar_t, std::vector<wchar_t>> &char_confusion();

// OCR 把韩文地名幻觉成拉丁字母 (HOA -> 충청남도)
const std::vector<std::pair<std::wstring, std::wstring>> &latin_confusion();

// 整词 错 -> 对，已按错词长度降序
const std::vector<std::pair<std::wstring, std::wstring>> &word_corrections();

const std::unordered_map<std::wstring, double> &bigram_freq();
const std::unordered_map<std::wstring, double> &trigram_freq();

// 校正器规范化的字段关键字，长的在前
const std::vector<std::wstring> &field_keywords();

// 行政区划
const std::vector<std::wstring> &region_gazetteer();

// TextAssembler 判断“字段起始”的标签
const std::vector<std::wstring> &field_start_labels();

} // namespace correction_dict
