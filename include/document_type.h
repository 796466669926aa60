#pragma once
#include <string>

enum class DocumentType { BusinessRegistration, IdCard, DriverLicense, Unknown };

// "BUSINESS_REGISTRATION" / "ID_CARD" / "DRIVER_LICENSE"，不区分大小写；其余一律 Unknown
DocumentType parse_document_type(const std::string &name);
const char *to_string(DocumentType t);

// DBNet 二值化阈值
float detection_threshold(DocumentType t);

// 该类型是否有字段解析器（目前只有 사업자등록증）
bool has_field_parser(DocumentType t);
