#include "line_assembler.h"
#include <algorithm>
#include <cmath>

std::vector<TextLine> LineAssembler::group(std::vector<TextRegionBox> boxes) const {
    std::stable_sort(boxes.begin(), boxes.end(),
                     [](const TextRegionBox &a, const TextRegionBox &b) { return a.center.y < b.center.y; });

    std::vector<TextLine> lines;
    TextLine current;
    auto flush = [&]() {
        if (current.empty())
            return;
        std::stable_sort(current.begin(), current.end(),
                         [](const TextRegionBox &a, const TextRegionBox &b) { return a.center.x < b.center.x; });
        lines.push_back(std::move(current));
        current.clear();
    };

    for (auto &box: boxes) {
        if (!current.empty()) {
            const TextRegionBox &first = current.front();
            float tol = p_.row_tolerance * std::min(box.size.height, first.size.height);
            if (std::abs(box.center.y - first.center.y) >= tol)
                flush();
        }
        current.push_back(box);
    }
    flush();
    return lines;
}
