#include "matching/candidate_extractor.hpp"

#include <algorithm>
#include <string>

#include <opencv2/imgproc.hpp>

#include "matching/correlation.hpp"

namespace mtm {

namespace {

cv::Size downscaledSize(const cv::Size& s, int factor) {
    return cv::Size(std::max(1, s.width / factor), std::max(1, s.height / factor));
}

Region placeRegion(const TemplateSpec& spec, const cv::Rect2d& box) {
    if (!spec.placement) {
        return Region::fromRect(box);
    }
    const RotatedPlacement& p = *spec.placement;
    const cv::Point2f center(
        static_cast<float>(box.x + box.width * 0.5),
        static_cast<float>(box.y + box.height * 0.5));
    cv::Size2f size = p.object_size;
    if (size.width <= 0.0F || size.height <= 0.0F) {
        size = cv::Size2f(static_cast<float>(box.width), static_cast<float>(box.height));
    }
    // RotatedRect angles run clockwise in image coordinates.
    return Region::fromRotatedRect(cv::RotatedRect(center, size, static_cast<float>(-p.angle_deg)));
}

}  // namespace

bool checkTemplateFits(
    const cv::Mat& image,
    const TemplateSpec& spec,
    int template_index,
    const std::optional<cv::Rect>& search_box,
    MatchError& error) {
    const std::string where = "template " + std::to_string(template_index);
    if (spec.image.empty()) {
        return fail(error, MatchStatus::ShapeMismatch, where + " is empty");
    }
    if (spec.image.depth() != image.depth() || spec.image.channels() != image.channels()) {
        return fail(error, MatchStatus::ShapeMismatch,
                    where + " bit depth/channels differ from the image");
    }
    const cv::Size area = search_box ? search_box->size() : image.size();
    if (spec.image.cols > area.width || spec.image.rows > area.height) {
        return fail(error, MatchStatus::ShapeMismatch,
                    where + " is larger than the " + std::string(search_box ? "search box" : "image"));
    }
    if (!spec.mask.empty()) {
        if (spec.mask.size() != spec.image.size() ||
            (spec.mask.depth() != CV_8U && spec.mask.depth() != CV_32F)) {
            return fail(error, MatchStatus::ShapeMismatch, where + " mask must match template size and be 8U or 32F");
        }
    }
    return true;
}

bool extractCandidates(
    const cv::Mat& image,
    const TemplateSpec& spec,
    int template_index,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error) {
    out.clear();
    if (!checkTemplateFits(image, spec, template_index, options.search_box, error)) {
        return false;
    }

    const int factor = std::max(1, options.downscaling_factor);
    const cv::Point offset = options.search_box ? options.search_box->tl() : cv::Point(0, 0);
    const cv::Mat search = options.search_box ? image(*options.search_box) : image;

    cv::Mat search_for_match = search;
    cv::Mat template_for_match = spec.image;
    cv::Mat mask_for_match = spec.mask;
    if (factor > 1) {
        cv::resize(search, search_for_match, downscaledSize(search.size(), factor), 0, 0, cv::INTER_AREA);
        cv::resize(spec.image, template_for_match, downscaledSize(spec.image.size(), factor), 0, 0, cv::INTER_AREA);
        if (!spec.mask.empty()) {
            cv::resize(spec.mask, mask_for_match, template_for_match.size(), 0, 0, cv::INTER_NEAREST);
        }
    }

    cv::Mat score_map;
    std::string corr_error;
    if (!correlate(search_for_match, template_for_match, mask_for_match, options.method, score_map, corr_error)) {
        return fail(error, MatchStatus::ShapeMismatch,
                    "template " + std::to_string(template_index) + ": " + corr_error);
    }

    std::vector<PeakResult> peaks;
    if (options.single_match) {
        peaks.push_back(bestPosition(score_map));
    } else {
        peaks = positionsAboveThreshold(score_map, spec.score_threshold.value_or(options.score_threshold));
    }

    // size of the template actually correlated, mapped back to full resolution
    const double width = static_cast<double>(template_for_match.cols * factor);
    const double height = static_cast<double>(template_for_match.rows * factor);

    out.reserve(peaks.size());
    for (const auto& peak : peaks) {
        const cv::Rect2d box(
            static_cast<double>(peak.position.x * factor + offset.x),
            static_cast<double>(peak.position.y * factor + offset.y),
            width,
            height);
        out.emplace_back(placeRegion(spec, box), peak.score, template_index, spec.label);
    }
    return true;
}

}  // namespace mtm
