#include <iostream>
#include "ocr_engine.h"

#ifdef _WIN32
#include <Windows.h>
#endif

// 用法: bizreg_ocr_demo <config.yml> <image> [BUSINESS_REGISTRATION|ID_CARD|DRIVER_LICENSE|UNKNOWN]
int main(int argc, char **argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.yml> <image> [doc_type]\n";
        return -1;
    }
    const DocumentType type = argc > 3 ? parse_document_type(argv[3]) : DocumentType::BusinessRegistration;

#ifdef _WIN32
    SetConsoleOutputCP(65001);
    SetConsoleCP(65001);
#endif

    try {
        OcrEngine engine(argv[1]);
        OcrDocument doc = engine.process_image(argv[2], type, [](size_t done, size_t total) {
            std::cout << "\rrecognized " << done << "/" << total << std::flush;
        });
        std::cout << "\n";

        std::cout << "---- raw (" << doc.box_count << " boxes, conf=" << doc.ocr_confidence << ")\n"
                  << doc.raw_text;
        std::cout << "---- corrected (conf=" << doc.correction.confidence << ")\n" << doc.correction.corrected;
        for (const auto &c: doc.correction.corrections)
            std::cout << "  [" << to_string(c.method) << "] @" << c.position << " " << c.original << " -> "
                      << c.corrected << "\n";

        if (doc.quality) {
            const ImageQuality &q = *doc.quality;
            std::cout << "---- quality score=" << q.score << " (" << to_string(q.resolution) << ")"
                      << " sharp=" << q.sharpness << " contrast=" << q.contrast << " bright=" << q.brightness
                      << " est=" << q.estimated_ocr_success << "%\n  " << q.recommendation << "\n";
        }

        if (doc.fields) {
            const FieldRecord &f = *doc.fields;
            std::cout << "---- fields\n"
                      << "  등록번호      : " << f.registration_number << "\n"
                      << "  법인명        : " << f.corporate_name << "\n"
                      << "  대표자        : " << f.representative << "\n"
                      << "  개업연월일    : " << f.establishment_date << "\n"
                      << "  법인등록번호  : " << f.corporate_registration_number << "\n"
                      << "  사업장소재지  : " << f.business_address << "\n"
                      << "  본점소재지    : " << f.head_address << "\n";
        } else {
            std::cout << "---- no field parser for " << to_string(type) << "\n";
        }
    } catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << "\n";
        return -1;
    }
    return 0;
}
