#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/status.hpp"
#include "core/types.hpp"

namespace mtm {

// Checked before any correlation runs. `check_nms` also covers
// max_overlap / max_objects, which only matchTemplates uses.
bool validateMatchOptions(const cv::Mat& image, const MatchOptions& options, bool check_nms, MatchError& error);

bool makeTemplateSpecs(
    const std::vector<cv::Mat>& templates,
    const std::vector<std::string>& labels,
    std::vector<TemplateSpec>& out,
    MatchError& error);

// Raw candidates of every template, concatenated in template order.
// Results are not suppressed and may overlap; use matchTemplates for that.
bool findMatches(
    const cv::Mat& image,
    const std::vector<TemplateSpec>& templates,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error);

bool findMatches(
    const cv::Mat& image,
    const std::vector<cv::Mat>& templates,
    const std::vector<std::string>& labels,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error);

// findMatches followed by non-maximum suppression. Never returns a hit that
// findMatches would not have produced with the same options.
bool matchTemplates(
    const cv::Mat& image,
    const std::vector<TemplateSpec>& templates,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error);

bool matchTemplates(
    const cv::Mat& image,
    const std::vector<cv::Mat>& templates,
    const std::vector<std::string>& labels,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error);

}  // namespace mtm
