#pragma once

#include <string>

#include "core/types.hpp"

namespace mtm {

struct MatchConfig {
    double score_threshold{0.5};
    double max_overlap{0.25};
    std::string overlap_mode{"smaller"};  // smaller | union
    int max_objects{-1};                  // -1 = unbounded
    bool single_match{false};
    std::string method{"ccoeff_normed"};  // ccoeff_normed | ccorr_normed | sqdiff_normed
    int downscaling_factor{1};
    bool parallel_templates{false};
    int search_box_x{0};
    int search_box_y{0};
    int search_box_width{0};  // 0 = search the whole image
    int search_box_height{0};
};

struct OutputConfig {
    bool draw_scores{true};
    bool draw_legend{true};
    int thickness{2};
    std::string annotated_path;  // empty = do not write
};

struct AppConfig {
    MatchConfig match;
    OutputConfig output;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
// Line-based reader for the same section/key layout. loadConfig falls back to
// it when cv::FileStorage cannot parse the file.
bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

bool parseOverlapMode(const std::string& name, OverlapMode& out);
bool parseCorrelationMethod(const std::string& name, CorrelationMethod& out);

// Assumes a validated config.
MatchOptions toMatchOptions(const MatchConfig& cfg);

}  // namespace mtm
