//
// Created by Nanboom233 on 2025/12/3.
//
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "ocr_engine.h"

namespace py = pybind11;

PYBIND11_MODULE(bizreg_ocr, m) {
    m.doc() = "Business registration certificate OCR core";

    py::enum_<DocumentType>(m, "DocumentType")
            .value("BUSINESS_REGISTRATION", DocumentType::BusinessRegistration)
            .value("ID_CARD", DocumentType::IdCard)
            .value("DRIVER_LICENSE", DocumentType::DriverLicense)
            .value("UNKNOWN", DocumentType::Unknown);

    py::register_exception<OcrCancelled>(m, "OcrCancelled");

    py::class_<FieldRecord>(m, "FieldRecord")
            .def_readonly("registration_number", &FieldRecord::registration_number)
            .def_readonly("corporate_name", &FieldRecord::corporate_name)
            .def_readonly("representative", &FieldRecord::representative)
            .def_readonly("establishment_date", &FieldRecord::establishment_date)
            .def_readonly("corporate_registration_number", &FieldRecord::corporate_registration_number)
            .def_readonly("business_address", &FieldRecord::business_address)
            .def_readonly("head_address", &FieldRecord::head_address)
            .def("to_dict", [](const FieldRecord &r) {
                py::dict d;
                d["registration_number"] = r.registration_number;
                d["corporate_name"] = r.corporate_name;
                d["representative"] = r.representative;
                d["establishment_date"] = r.establishment_date;
                d["corporate_registration_number"] = r.corporate_registration_number;
                d["business_address"] = r.business_address;
                d["head_address"] = r.head_address;
                return d;
            });

    py::class_<CorrectionDetail>(m, "CorrectionDetail")
            .def_readonly("position", &CorrectionDetail::position)
            .def_readonly("original", &CorrectionDetail::original)
            .def_readonly("corrected", &CorrectionDetail::corrected)
            .def_property_readonly("method", [](const CorrectionDetail &d) { return std::string(to_string(d.method)); })
            .def_readonly("confidence", &CorrectionDetail::confidence);

    py::class_<CorrectionResult>(m, "CorrectionResult")
            .def_readonly("original", &CorrectionResult::original)
            .def_readonly("corrected", &CorrectionResult::corrected)
            .def_readonly("corrections", &CorrectionResult::corrections)
            .def_readonly("confidence", &CorrectionResult::confidence);

    py::class_<ImageQuality>(m, "ImageQuality")
            .def_readonly("score", &ImageQuality::score)
            .def_property_readonly("resolution", [](const ImageQuality &q) { return std::string(to_string(q.resolution)); })
            .def_readonly("sharpness", &ImageQuality::sharpness)
            .def_readonly("contrast", &ImageQuality::contrast)
            .def_readonly("brightness", &ImageQuality::brightness)
            .def_readonly("estimated_ocr_success", &ImageQuality::estimated_ocr_success)
            .def_readonly("recommendation", &ImageQuality::recommendation)
            .def_readonly("needs_enhancement", &ImageQuality::needs_enhancement);

    py::class_<OcrDocument>(m, "OcrDocument")
            .def_readonly("document_type", &OcrDocument::document_type)
            .def_readonly("raw_text", &OcrDocument::raw_text)
            .def_readonly("correction", &OcrDocument::correction)
            .def_readonly("fields", &OcrDocument::fields)
            .def_readonly("ocr_confidence", &OcrDocument::ocr_confidence)
            .def_readonly("quality", &OcrDocument::quality)
            .def_readonly("box_count", &OcrDocument::box_count);

    py::class_<OcrEngine>(m, "OcrEngine")
            .def(py::init<const std::string &>(), py::arg("config_path") = std::string())
            .def(
                    "process_image",
                    [](const OcrEngine &e, const std::string &path, const std::string &doc_type) {
                        py::gil_scoped_release release;
                        return e.process_image(path, parse_document_type(doc_type));
                    },
                    py::arg("path"), py::arg("doc_type") = "BUSINESS_REGISTRATION")
            .def(
                    "process_text",
                    [](const OcrEngine &e, const std::string &text, const std::string &doc_type) {
                        return e.process_text(text, parse_document_type(doc_type));
                    },
                    py::arg("text"), py::arg("doc_type") = "BUSINESS_REGISTRATION")
            .def("correct_text", &OcrEngine::correct_text, py::arg("text"))
            .def("parse_text", &OcrEngine::parse_text, py::arg("text"))
            .def("cancel", &OcrEngine::cancel);
}
