#include "render/detection_renderer.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>

#include <opencv2/imgproc.hpp>

namespace mtm {

namespace {

// matplotlib Set3, BGR
const cv::Scalar kPalette[] = {
    {199, 211, 141}, {179, 255, 255}, {218, 186, 190}, {114, 128, 251},
    {211, 177, 128}, {98, 180, 253},  {105, 222, 179}, {229, 205, 252},
    {217, 217, 217}, {189, 128, 188}, {197, 235, 204}, {111, 237, 255},
};
constexpr int kPaletteSize = static_cast<int>(sizeof(kPalette) / sizeof(kPalette[0]));

cv::Mat toBgr(const cv::Mat& image) {
    cv::Mat out;
    if (image.empty()) {
        return out;
    }
    cv::Mat src8u = image;
    if (image.depth() != CV_8U) {
        cv::normalize(image, src8u, 0, 255, cv::NORM_MINMAX, CV_8U);
    }
    if (src8u.channels() == 1) {
        cv::cvtColor(src8u, out, cv::COLOR_GRAY2BGR);
    } else if (src8u.channels() == 4) {
        cv::cvtColor(src8u, out, cv::COLOR_BGRA2BGR);
    } else {
        out = src8u.clone();
    }
    return out;
}

}  // namespace

cv::Scalar DetectionRenderer::colorForTemplate(int template_index) {
    const int idx = ((template_index % kPaletteSize) + kPaletteSize) % kPaletteSize;
    return kPalette[idx];
}

cv::Mat DetectionRenderer::drawDetections(
    const cv::Mat& image,
    const std::vector<Detection>& detections,
    const RenderStyle& style) {
    cv::Mat canvas = toBgr(image);
    if (canvas.empty()) {
        return canvas;
    }

    for (const auto& d : detections) {
        const auto& verts = d.region().vertices();
        if (verts.size() < 2) {
            continue;
        }
        std::vector<cv::Point> outline;
        outline.reserve(verts.size());
        for (const auto& p : verts) {
            outline.emplace_back(cvRound(p.x), cvRound(p.y));
        }
        const cv::Scalar color = colorForTemplate(d.templateIndex());
        cv::polylines(canvas, outline, true, color, std::max(1, style.thickness), cv::LINE_AA);

        if (style.show_score) {
            const cv::Rect2d box = d.region().boundingRect();
            std::ostringstream text;
            text << std::fixed << std::setprecision(2) << d.score();
            const double font_scale = std::max(0.3, box.height / 80.0);
            cv::putText(canvas, text.str(),
                        cv::Point(cvRound(box.x + box.width / 3.0), cvRound(box.y + box.height / 3.0)),
                        cv::FONT_HERSHEY_SIMPLEX, font_scale, color, 1, cv::LINE_AA);
        }
    }

    if (style.show_legend) {
        (void)renderLegend(canvas, detections);
    }
    return canvas;
}

bool DetectionRenderer::renderLegend(cv::Mat& bgr_frame, const std::vector<Detection>& detections) {
    if (bgr_frame.empty()) {
        return false;
    }

    std::map<std::string, cv::Scalar> label_colors;
    for (const auto& d : detections) {
        if (!d.label().empty()) {
            label_colors[d.label()] = colorForTemplate(d.templateIndex());
        }
    }
    if (label_colors.empty()) {
        return false;
    }

    const cv::Scalar bg(20, 20, 20);
    const cv::Scalar fg(220, 220, 220);
    const int row_h = 20;
    const int panel_h = 8 + row_h * static_cast<int>(label_colors.size());
    cv::rectangle(bgr_frame, cv::Rect(8, 8, 180, panel_h), bg, cv::FILLED);

    int y = 8 + row_h - 5;
    for (const auto& entry : label_colors) {
        cv::line(bgr_frame, cv::Point(16, y - 5), cv::Point(40, y - 5), entry.second, 4);
        cv::putText(bgr_frame, entry.first, cv::Point(48, y), cv::FONT_HERSHEY_SIMPLEX, 0.45, fg, 1, cv::LINE_AA);
        y += row_h;
    }
    return true;
}

}  // namespace mtm
