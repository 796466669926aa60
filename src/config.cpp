#include "config.h"
#include <iostream>
#include <opencv2/core/persistence.hpp>
#include <stdexcept>

static void read_string(const cv::FileNode &n, std::string &out) {
    if (!n.empty() && n.isString())
        out = static_cast<std::string>(n);
}

static void read_int(const cv::FileNode &n, int &out) {
    if (!n.empty() && (n.isInt() || n.isReal()))
        out = static_cast<int>(static_cast<double>(n));
}

static void read_float(const cv::FileNode &n, float &out) {
    if (!n.empty() && (n.isInt() || n.isReal()))
        out = static_cast<float>(static_cast<double>(n));
}

static void read_double(const cv::FileNode &n, double &out) {
    if (!n.empty() && (n.isInt() || n.isReal()))
        out = static_cast<double>(n);
}

// FileStorage 没有 bool 类型：接受 0/1 和 "true"/"false"
static void read_bool(const cv::FileNode &n, bool &out) {
    if (n.empty())
        return;
    if (n.isInt()) {
        out = static_cast<int>(n) != 0;
    } else if (n.isString()) {
        const std::string s = static_cast<std::string>(n);
        out = (s == "true" || s == "True" || s == "1" || s == "on");
    }
}

static bool is_absolute(const std::string &p) {
    if (p.empty())
        return false;
    if (p[0] == '/' || p[0] == '\\')
        return true;
    return p.size() > 1 && p[1] == ':'; // C:\...
}

static std::string resolve(const std::string &base_dir, const std::string &p) {
    if (p.empty() || base_dir.empty() || is_absolute(p))
        return p;
    return base_dir + "/" + p;
}

EngineConfig EngineConfig::load(const std::string &path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception &e) {
        throw std::runtime_error("cannot parse config " + path + ": " + e.what());
    }
    if (!fs.isOpened())
        throw std::runtime_error("cannot open config: " + path);

    EngineConfig cfg;
    read_string(fs["det_model"], cfg.det_model);
    read_string(fs["rec_model"], cfg.rec_model);
    read_string(fs["dict_path"], cfg.dict_path);
    read_bool(fs["use_cuda"], cfg.use_cuda);
    read_int(fs["intra_threads"], cfg.intra_threads);
    read_int(fs["rec_workers"], cfg.rec_workers);
    read_int(fs["det_max_side"], cfg.det_max_side);
    read_int(fs["rec_img_h"], cfg.rec_img_h);
    read_int(fs["rec_max_w"], cfg.rec_max_w);
    read_double(fs["min_component_area"], cfg.box.min_area);
    read_float(fs["unclip_width"], cfg.box.unclip_width);
    read_float(fs["unclip_height"], cfg.box.unclip_height);
    read_float(fs["row_tolerance"], cfg.line.row_tolerance);
    read_bool(fs["analyze_quality"], cfg.analyze_quality);

    const size_t slash = path.find_last_of("/\\");
    const std::string base_dir = slash == std::string::npos ? std::string() : path.substr(0, slash);
    cfg.det_model = resolve(base_dir, cfg.det_model);
    cfg.rec_model = resolve(base_dir, cfg.rec_model);
    cfg.dict_path = resolve(base_dir, cfg.dict_path);

    if (!cfg.has_models())
        std::cerr << "[WARN] " << path << ": det_model/rec_model/dict_path not set, image input disabled\n";
#ifndef NDEBUG
    std::cout << "[CFG] " << path << " det=" << cfg.det_model << " rec=" << cfg.rec_model
              << " workers=" << cfg.rec_workers << " cuda=" << cfg.use_cuda << "\n";
#endif
    return cfg;
}
