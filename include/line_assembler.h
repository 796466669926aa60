#pragma once
#include <vector>
#include "box_decoder.h"

// 同一行的框，已按水平位置排序
using TextLine = std::vector<TextRegionBox>;

class LineAssembler {
public:
    struct Params {
        float row_tolerance = 0.15f; // |Δcy| < row_tolerance * min(h1, h2) 视为同一行
    };

    LineAssembler() = default;
    explicit LineAssembler(const Params &p) : p_(p) {}

    // 行从上到下，行内从左到右
    std::vector<TextLine> group(std::vector<TextRegionBox> boxes) const;

private:
    Params p_;
};
