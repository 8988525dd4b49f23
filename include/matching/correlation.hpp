#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace mtm {

struct PeakResult {
    cv::Point position{0, 0};
    double score{0.0};
};

int toOpenCvMethod(CorrelationMethod method);

// Score map of `templ` slid over `image`, CV_32FC1 of size
// (image - templ + 1). Always higher-is-better: distance methods are negated.
bool correlate(
    const cv::Mat& image,
    const cv::Mat& templ,
    const cv::Mat& mask,
    CorrelationMethod method,
    cv::Mat& out_map,
    std::string& error);

PeakResult bestPosition(const cv::Mat& score_map);

// Local maxima (3x3 neighbourhood, borders included) scoring >= threshold,
// one position per 8-connected plateau, sorted by score descending then raster order.
std::vector<PeakResult> positionsAboveThreshold(const cv::Mat& score_map, double threshold);

}  // namespace mtm
