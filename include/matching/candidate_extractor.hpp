#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/status.hpp"
#include "core/types.hpp"

namespace mtm {

bool checkTemplateFits(
    const cv::Mat& image,
    const TemplateSpec& spec,
    int template_index,
    const std::optional<cv::Rect>& search_box,
    MatchError& error);

// Candidates for a single template. No suppression happens here, so the
// output may contain overlapping detections.
bool extractCandidates(
    const cv::Mat& image,
    const TemplateSpec& spec,
    int template_index,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error);

}  // namespace mtm
