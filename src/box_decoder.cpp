#include "box_decoder.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

float TextRegionBox::min_x() const {
    return std::min({quad[0].x, quad[1].x, quad[2].x, quad[3].x});
}

float TextRegionBox::max_x() const {
    return std::max({quad[0].x, quad[1].x, quad[2].x, quad[3].x});
}

static inline float seg_len(const cv::Point2f &a, const cv::Point2f &b) {
    float dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// 由四点重新推导 center / size / angle，保证 width 为长边
static void derive_geometry(TextRegionBox &box) {
    const auto &q = box.quad;
    box.center = (q[0] + q[1] + q[2] + q[3]) * 0.25f;
    float e01 = seg_len(q[0], q[1]);
    float e12 = seg_len(q[1], q[2]);
    const cv::Point2f &a = e01 >= e12 ? q[0] : q[1];
    const cv::Point2f &b = e01 >= e12 ? q[1] : q[2];
    box.size = cv::Size2f(std::max(e01, e12), std::min(e01, e12));
    box.angle = static_cast<float>(std::atan2(b.y - a.y, b.x - a.x) * 180.0 / CV_PI);
}

std::vector<TextRegionBox> BoxDecoder::decode(const cv::Mat &prob, float threshold) const {
    if (prob.empty())
        throw std::invalid_argument("BoxDecoder: empty probability map");

    cv::Mat prob32 = prob;
    if (prob.type() != CV_32F)
        prob.convertTo(prob32, CV_32F);

    // 1) 二值化 + 水平膨胀
    cv::Mat bin;
    cv::threshold(prob32, bin, threshold, 255, cv::THRESH_BINARY);
    bin.convertTo(bin, CV_8U);
    {
        cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(p_.dilate_w, p_.dilate_h));
        cv::dilate(bin, bin, k, cv::Point(-1, -1), 1);
    }

    // 2) 轮廓
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bin, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

    std::vector<TextRegionBox> boxes;
    boxes.reserve(contours.size());
    int dropped_small = 0;

    for (const auto &c: contours) {
        if (cv::contourArea(c) < p_.min_area) {
            ++dropped_small;
            continue;
        }

        cv::RotatedRect rr = cv::minAreaRect(c);
        float w = rr.size.width, h = rr.size.height, angle = rr.angle;
        if (w < h) {
            std::swap(w, h);
            angle += 90.f;
        }

        // 外扩：中心与角度不变，宽高按各自比例放大
        cv::RotatedRect grown(rr.center, cv::Size2f(w * p_.unclip_width, h * p_.unclip_height), angle);
        cv::Point2f pts[4];
        grown.points(pts);

        TextRegionBox box;
        std::copy(pts, pts + 4, box.quad.begin());
        box.center = grown.center;
        box.size = grown.size;
        box.angle = angle;
        boxes.push_back(box);
    }

#ifndef NDEBUG
    std::cout << "[DET] contours=" << contours.size() << " dropped_small=" << dropped_small
              << " boxes=" << boxes.size() << "\n";
#endif
    return boxes;
}

void BoxDecoder::rescale(std::vector<TextRegionBox> &boxes, float sx, float sy) {
    for (auto &box: boxes) {
        for (auto &p: box.quad) {
            p.x *= sx;
            p.y *= sy;
        }
        derive_geometry(box);
    }
}
