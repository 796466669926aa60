#pragma once
#include <string>
#include "box_decoder.h"
#include "line_assembler.h"

// 引擎配置；所有键可选，缺省即各模块 Params 的默认值
struct EngineConfig {
    std::string det_model;
    std::string rec_model;
    std::string dict_path;
    bool use_cuda{false};
    int intra_threads{4};
    int rec_workers{2};
    int det_max_side{1280};
    int rec_img_h{48};
    int rec_max_w{2304};
    bool analyze_quality{true};
    BoxDecoder::Params box;
    LineAssembler::Params line;

    // 模型都配置了才能跑图像流程
    bool has_models() const { return !det_model.empty() && !rec_model.empty() && !dict_path.empty(); }

    // YAML / JSON（cv::FileStorage）；相对路径以配置文件所在目录为基准
    // 文件打不开抛 std::runtime_error
    static EngineConfig load(const std::string &path);
};
