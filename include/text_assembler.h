#pragma once
#include <string>
#include <vector>
#include "line_assembler.h"
#include "sequence_decoder.h"

struct AssembledDocument {
    std::string full_text;
    float confidence{0.f}; // 保留片段的平均置信度
    std::vector<DecodedSpan> kept_spans;
};

// 按框间距决定 换行 / 空格 / 直接拼接
class TextAssembler {
public:
    struct Params {
        float min_confidence = 0.5f;  // 只保留 > 此值的片段
        float label_break = 0.2f;     // 字段标签前的换行间距（× 行高）
        float line_break = 0.4f;
        float space = 0.15f;
    };

    TextAssembler() = default;
    explicit TextAssembler(const Params &p) : p_(p) {}

    // spans 与 lines 中的框按阅读顺序一一对应；数量不符抛 std::invalid_argument
    AssembledDocument assemble(const std::vector<TextLine> &lines, const std::vector<DecodedSpan> &spans) const;

private:
    Params p_;
    static bool looks_like_field_label(const std::string &text);
};
