#include "document_type.h"
#include <algorithm>
#include <cctype>

DocumentType parse_document_type(const std::string &name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "BUSINESS_REGISTRATION")
        return DocumentType::BusinessRegistration;
    if (upper == "ID_CARD")
        return DocumentType::IdCard;
    if (upper == "DRIVER_LICENSE")
        return DocumentType::DriverLicense;
    return DocumentType::Unknown;
}

const char *to_string(DocumentType t) {
    switch (t) {
        case DocumentType::BusinessRegistration:
            return "BUSINESS_REGISTRATION";
        case DocumentType::IdCard:
            return "ID_CARD";
        case DocumentType::DriverLicense:
            return "DRIVER_LICENSE";
        case DocumentType::Unknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

float detection_threshold(DocumentType t) {
    switch (t) {
        case DocumentType::BusinessRegistration:
            return 0.35f; // 表格线多，阈值略高
        case DocumentType::IdCard:
        case DocumentType::DriverLicense:
            return 0.33f;
        case DocumentType::Unknown:
            return 0.30f;
    }
    return 0.30f;
}

bool has_field_parser(DocumentType t) {
    switch (t) {
        case DocumentType::BusinessRegistration:
            return true;
        case DocumentType::IdCard:
        case DocumentType::DriverLicense:
        case DocumentType::Unknown:
            return false;
    }
    return false;
}
