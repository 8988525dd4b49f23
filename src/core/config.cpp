#include "core/config.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <opencv2/core.hpp>

namespace mtm {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

// FileStorage keeps unquoted true/false as strings.
void readBoolOrDefault(const cv::FileNode& node, const char* key, bool& out) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    if (child.isString()) {
        bool b = out;
        if (toBool(static_cast<std::string>(child), b)) {
            out = b;
        }
        return;
    }
    out = static_cast<int>(child) != 0;
}

void applyKey(AppConfig& out, const std::string& section, const std::string& key, const std::string& value) {
    if (section == "match") {
        if (key == "score_threshold") out.match.score_threshold = std::stod(value);
        else if (key == "max_overlap") out.match.max_overlap = std::stod(value);
        else if (key == "overlap_mode") out.match.overlap_mode = value;
        else if (key == "max_objects") out.match.max_objects = std::stoi(value);
        else if (key == "single_match") {
            bool b = out.match.single_match;
            if (toBool(value, b)) out.match.single_match = b;
        } else if (key == "method") out.match.method = value;
        else if (key == "downscaling_factor") out.match.downscaling_factor = std::stoi(value);
        else if (key == "parallel_templates") {
            bool b = out.match.parallel_templates;
            if (toBool(value, b)) out.match.parallel_templates = b;
        } else if (key == "search_box_x") out.match.search_box_x = std::stoi(value);
        else if (key == "search_box_y") out.match.search_box_y = std::stoi(value);
        else if (key == "search_box_width") out.match.search_box_width = std::stoi(value);
        else if (key == "search_box_height") out.match.search_box_height = std::stoi(value);
    } else if (section == "output") {
        if (key == "draw_scores") {
            bool b = out.output.draw_scores;
            if (toBool(value, b)) out.output.draw_scores = b;
        } else if (key == "draw_legend") {
            bool b = out.output.draw_legend;
            if (toBool(value, b)) out.output.draw_legend = b;
        } else if (key == "thickness") out.output.thickness = std::stoi(value);
        else if (key == "annotated_path") out.output.annotated_path = value;
    }
}

}  // namespace

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t == "%YAML:1.0" || t == "---") {
            continue;
        }

        // section header, e.g. "match:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            applyKey(out, section, key, value);
        } catch (const std::exception&) {
            error = "invalid value for " + section + "." + key + ": " + value;
            return false;
        }
    }

    return validateConfig(out, error);
}


bool parseOverlapMode(const std::string& name, OverlapMode& out) {
    if (name == "smaller") {
        out = OverlapMode::Smaller;
        return true;
    }
    if (name == "union") {
        out = OverlapMode::Union;
        return true;
    }
    return false;
}

bool parseCorrelationMethod(const std::string& name, CorrelationMethod& out) {
    if (name == "ccoeff_normed") {
        out = CorrelationMethod::CCoeffNormed;
        return true;
    }
    if (name == "ccorr_normed") {
        out = CorrelationMethod::CCorrNormed;
        return true;
    }
    if (name == "sqdiff_normed") {
        out = CorrelationMethod::SqDiffNormed;
        return true;
    }
    return false;
}

bool validateConfig(const AppConfig& cfg, std::string& error) {
    const MatchConfig& m = cfg.match;
    if (!std::isfinite(m.score_threshold) || m.score_threshold < -1.0 || m.score_threshold > 1.0) {
        error = "match.score_threshold must be in [-1,1]";
        return false;
    }
    if (!std::isfinite(m.max_overlap) || m.max_overlap < 0.0 || m.max_overlap > 1.0) {
        error = "match.max_overlap must be in [0,1]";
        return false;
    }
    OverlapMode mode{};
    if (!parseOverlapMode(m.overlap_mode, mode)) {
        error = "match.overlap_mode must be 'smaller' or 'union'";
        return false;
    }
    if (m.max_objects < -1) {
        error = "match.max_objects must be >= 0, or -1 for unbounded";
        return false;
    }
    CorrelationMethod method{};
    if (!parseCorrelationMethod(m.method, method)) {
        error = "match.method must be 'ccoeff_normed', 'ccorr_normed' or 'sqdiff_normed'";
        return false;
    }
    if (m.downscaling_factor < 1) {
        error = "match.downscaling_factor must be >= 1";
        return false;
    }
    if (m.search_box_x < 0 || m.search_box_y < 0 || m.search_box_width < 0 || m.search_box_height < 0) {
        error = "match.search_box_* must be >= 0";
        return false;
    }
    if ((m.search_box_width == 0) != (m.search_box_height == 0)) {
        error = "match.search_box_width and search_box_height must both be set or both be 0";
        return false;
    }
    if (cfg.output.thickness <= 0) {
        error = "output.thickness must be > 0";
        return false;
    }
    error.clear();
    return true;
}

MatchOptions toMatchOptions(const MatchConfig& cfg) {
    MatchOptions out;
    out.score_threshold = cfg.score_threshold;
    out.max_overlap = cfg.max_overlap;
    (void)parseOverlapMode(cfg.overlap_mode, out.overlap_mode);
    if (cfg.max_objects >= 0) {
        out.max_objects = cfg.max_objects;
    }
    out.single_match = cfg.single_match;
    (void)parseCorrelationMethod(cfg.method, out.method);
    out.downscaling_factor = cfg.downscaling_factor;
    out.parallel_templates = cfg.parallel_templates;
    if (cfg.search_box_width > 0 && cfg.search_box_height > 0) {
        out.search_box = cv::Rect(cfg.search_box_x, cfg.search_box_y, cfg.search_box_width, cfg.search_box_height);
    }
    return out;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode match = fs["match"];
            const cv::FileNode output = fs["output"];

            readOrDefault(match, "score_threshold", out.match.score_threshold);
            readOrDefault(match, "max_overlap", out.match.max_overlap);
            readOrDefault(match, "overlap_mode", out.match.overlap_mode);
            readOrDefault(match, "max_objects", out.match.max_objects);
            readBoolOrDefault(match, "single_match", out.match.single_match);
            readOrDefault(match, "method", out.match.method);
            readOrDefault(match, "downscaling_factor", out.match.downscaling_factor);
            readBoolOrDefault(match, "parallel_templates", out.match.parallel_templates);
            readOrDefault(match, "search_box_x", out.match.search_box_x);
            readOrDefault(match, "search_box_y", out.match.search_box_y);
            readOrDefault(match, "search_box_width", out.match.search_box_width);
            readOrDefault(match, "search_box_height", out.match.search_box_height);

            readBoolOrDefault(output, "draw_scores", out.output.draw_scores);
            readBoolOrDefault(output, "draw_legend", out.output.draw_legend);
            readOrDefault(output, "thickness", out.output.thickness);
            readOrDefault(output, "annotated_path", out.output.annotated_path);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace mtm
