#include <gtest/gtest.h>
#include "document_type.h"

TEST(DocumentType, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_document_type("BUSINESS_REGISTRATION"), DocumentType::BusinessRegistration);
    EXPECT_EQ(parse_document_type("business_registration"), DocumentType::BusinessRegistration);
    EXPECT_EQ(parse_document_type("Id_Card"), DocumentType::IdCard);
    EXPECT_EQ(parse_document_type("driver_license"), DocumentType::DriverLicense);
}

TEST(DocumentType, UnknownNamesFallBack) {
    EXPECT_EQ(parse_document_type(""), DocumentType::Unknown);
    EXPECT_EQ(parse_document_type("passport"), DocumentType::Unknown);
    EXPECT_EQ(parse_document_type("UNKNOWN"), DocumentType::Unknown);
}

TEST(DocumentType, DetectionThresholds) {
    EXPECT_FLOAT_EQ(detection_threshold(DocumentType::BusinessRegistration), 0.35f);
    EXPECT_FLOAT_EQ(detection_threshold(DocumentType::IdCard), 0.33f);
    EXPECT_FLOAT_EQ(detection_threshold(DocumentType::DriverLicense), 0.33f);
    EXPECT_FLOAT_EQ(detection_threshold(DocumentType::Unknown), 0.30f);
}

TEST(DocumentType, OnlyBusinessRegistrationHasParser) {
    EXPECT_TRUE(has_field_parser(DocumentType::BusinessRegistration));
    EXPECT_FALSE(has_field_parser(DocumentType::IdCard));
    EXPECT_FALSE(has_field_parser(DocumentType::DriverLicense));
    EXPECT_FALSE(has_field_parser(DocumentType::Unknown));
}

TEST(DocumentType, NamesRoundTrip) {
    for (auto t: {DocumentType::BusinessRegistration, DocumentType::IdCard, DocumentType::DriverLicense,
                  DocumentType::Unknown})
        EXPECT_EQ(parse_document_type(to_string(t)), t);
}
