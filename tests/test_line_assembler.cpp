#include <gtest/gtest.h>
#include "line_assembler.h"

static TextRegionBox box_at(float cx, float cy, float w = 40.f, float h = 20.f) {
    TextRegionBox b;
    b.quad = {cv::Point2f(cx - w / 2, cy - h / 2), cv::Point2f(cx + w / 2, cy - h / 2),
              cv::Point2f(cx + w / 2, cy + h / 2), cv::Point2f(cx - w / 2, cy + h / 2)};
    b.center = cv::Point2f(cx, cy);
    b.size = cv::Size2f(w, h);
    return b;
}

TEST(LineAssembler, GroupsByVerticalCenter) {
    LineAssembler assembler;
    auto lines = assembler.group({box_at(200, 50), box_at(100, 12), box_at(10, 10)});
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[0].size(), 2u);
    ASSERT_EQ(lines[1].size(), 1u);
    // 行内按 x 排序
    EXPECT_FLOAT_EQ(lines[0][0].center.x, 10.f);
    EXPECT_FLOAT_EQ(lines[0][1].center.x, 100.f);
    EXPECT_FLOAT_EQ(lines[1][0].center.y, 50.f);
}

TEST(LineAssembler, ToleranceUsesSmallerHeight) {
    LineAssembler assembler;
    // 0.15 * min(20, 100) = 3
    auto lines = assembler.group({box_at(0, 10, 40, 20), box_at(100, 14, 40, 100)});
    EXPECT_EQ(lines.size(), 2u);
}

TEST(LineAssembler, ComparesAgainstFirstBoxOfLine) {
    LineAssembler assembler;
    // 10 -> 12 -> 14：14 与行首相差 4 >= 3，另起一行
    auto lines = assembler.group({box_at(0, 10), box_at(50, 12), box_at(100, 14)});
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].size(), 2u);
}

TEST(LineAssembler, CustomTolerance) {
    LineAssembler::Params p;
    p.row_tolerance = 0.5f;
    auto lines = LineAssembler(p).group({box_at(0, 10), box_at(50, 12), box_at(100, 14)});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].size(), 3u);
}

TEST(LineAssembler, EmptyInput) {
    EXPECT_TRUE(LineAssembler().group({}).empty());
}
