#include "text_assembler.h"
#include <stdexcept>
#include "correction_dictionary.h"
#include "hangul_utils.h"

bool TextAssembler::looks_like_field_label(const std::string &text) {
    const std::wstring wtext = utf8_to_wide(text);
    const std::wstring stripped = strip_whitespace(wtext);
    for (const auto &label: correction_dict::field_start_labels()) {
        if (contains(wtext, label) || starts_with(stripped, label.substr(0, 2)))
            return true;
    }
    return false;
}

AssembledDocument TextAssembler::assemble(const std::vector<TextLine> &lines,
                                          const std::vector<DecodedSpan> &spans) const {
    size_t total = 0;
    for (const auto &line: lines)
        total += line.size();
    if (total != spans.size())
        throw std::invalid_argument("TextAssembler: " + std::to_string(spans.size()) + " spans for " +
                                    std::to_string(total) + " boxes");

    AssembledDocument doc;
    float conf_sum = 0.f;
    size_t idx = 0;
    for (const auto &line: lines) {
        std::string text;
        bool started = false;
        float last_max_x = 0.f, last_h = 0.f;

        for (const auto &box: line) {
            const DecodedSpan &span = spans[idx++];
            if (span.confidence <= p_.min_confidence)
                continue;

            if (started) {
                const float gap = box.min_x() - last_max_x;
                if (gap > p_.label_break * last_h && looks_like_field_label(span.text))
                    text += '\n';
                else if (gap > p_.line_break * last_h)
                    text += '\n';
                else if (gap > p_.space * last_h)
                    text += ' ';
            }
            text += span.text;
            started = true;
            last_max_x = box.max_x();
            last_h = box.size.height;

            doc.kept_spans.push_back(span);
            conf_sum += span.confidence;
        }

        if (started)
            doc.full_text += text + "\n";
    }

    if (!doc.kept_spans.empty())
        doc.confidence = conf_sum / static_cast<float>(doc.kept_spans.size());
    return doc;
}
