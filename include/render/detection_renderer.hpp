#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace mtm {

struct RenderStyle {
    int thickness{2};
    bool show_score{false};
    bool show_legend{false};
};

class DetectionRenderer {
public:
    // Colour shared by every detection of the same template index.
    static cv::Scalar colorForTemplate(int template_index);

    // Returns a BGR copy of `image` (grayscale is expanded) with outlines drawn.
    static cv::Mat drawDetections(const cv::Mat& image, const std::vector<Detection>& detections, const RenderStyle& style);

    // Draws a label/colour panel. Returns false when no detection has a label.
    static bool renderLegend(cv::Mat& bgr_frame, const std::vector<Detection>& detections);
};

}  // namespace mtm
