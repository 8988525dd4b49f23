#include "matching/matcher.hpp"

#include <cmath>
#include <cstddef>
#include <string>

#include <opencv2/core/utility.hpp>

#include "matching/candidate_extractor.hpp"
#include "matching/nms.hpp"

namespace mtm {

namespace {

bool validThreshold(double t) {
    return std::isfinite(t) && t >= -1.0 && t <= 1.0;
}

bool runExtraction(
    const cv::Mat& image,
    const std::vector<TemplateSpec>& templates,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error) {
    const int n = static_cast<int>(templates.size());
    std::vector<std::vector<Detection>> per_template(templates.size());
    std::vector<MatchError> errors(templates.size());

    if (options.parallel_templates && n > 1) {
        cv::parallel_for_(cv::Range(0, n), [&](const cv::Range& range) {
            for (int i = range.start; i < range.end; ++i) {
                // failures are collected in errors[i] and reported in template order
                (void)extractCandidates(image, templates[i], i, options, per_template[i], errors[i]);
            }
        });
    } else {
        for (int i = 0; i < n; ++i) {
            if (!extractCandidates(image, templates[i], i, options, per_template[i], errors[i])) {
                break;
            }
        }
    }

    for (std::size_t i = 0; i < templates.size(); ++i) {
        if (!errors[i].ok()) {
            error = errors[i];
            return false;
        }
    }

    std::size_t total = 0;
    for (const auto& v : per_template) {
        total += v.size();
    }
    out.reserve(total);
    for (auto& v : per_template) {
        out.insert(out.end(), v.begin(), v.end());
    }
    return true;
}

}  // namespace

bool validateMatchOptions(const cv::Mat& image, const MatchOptions& options, bool check_nms, MatchError& error) {
    if (image.empty()) {
        return fail(error, MatchStatus::EmptyImage, "search image is empty");
    }
    if (!validThreshold(options.score_threshold)) {
        return fail(error, MatchStatus::InvalidThreshold, "score_threshold must be finite and in [-1,1]");
    }
    if (options.downscaling_factor < 1) {
        return fail(error, MatchStatus::InvalidDownscaling, "downscaling_factor must be >= 1");
    }
    if (options.search_box) {
        const cv::Rect& box = *options.search_box;
        const cv::Rect bounds(0, 0, image.cols, image.rows);
        if (box.width <= 0 || box.height <= 0 || (box & bounds) != box) {
            return fail(error, MatchStatus::InvalidSearchBox, "search_box must be non-empty and inside the image");
        }
    }
    if (check_nms) {
        NmsParams nms;
        nms.max_overlap = options.max_overlap;
        nms.max_objects = options.max_objects;
        if (!validateNmsParams(nms, error)) {
            return false;
        }
    }
    return true;
}

bool makeTemplateSpecs(
    const std::vector<cv::Mat>& templates,
    const std::vector<std::string>& labels,
    std::vector<TemplateSpec>& out,
    MatchError& error) {
    out.clear();
    if (!labels.empty() && labels.size() != templates.size()) {
        return fail(error, MatchStatus::LabelCountMismatch,
                    "got " + std::to_string(labels.size()) + " labels for " +
                        std::to_string(templates.size()) + " templates");
    }
    out.reserve(templates.size());
    for (std::size_t i = 0; i < templates.size(); ++i) {
        TemplateSpec spec;
        spec.image = templates[i];
        if (!labels.empty()) {
            spec.label = labels[i];
        }
        out.push_back(spec);
    }
    return true;
}

bool findMatches(
    const cv::Mat& image,
    const std::vector<TemplateSpec>& templates,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error) {
    out.clear();
    clearError(error);
    if (!validateMatchOptions(image, options, false, error)) {
        return false;
    }
    for (std::size_t i = 0; i < templates.size(); ++i) {
        const auto& override_threshold = templates[i].score_threshold;
        if (override_threshold && !validThreshold(*override_threshold)) {
            return fail(error, MatchStatus::InvalidThreshold,
                        "template " + std::to_string(i) + " score_threshold must be finite and in [-1,1]");
        }
        if (!checkTemplateFits(image, templates[i], static_cast<int>(i), options.search_box, error)) {
            return false;
        }
    }
    if (templates.empty()) {
        return true;
    }
    return runExtraction(image, templates, options, out, error);
}

bool findMatches(
    const cv::Mat& image,
    const std::vector<cv::Mat>& templates,
    const std::vector<std::string>& labels,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error) {
    out.clear();
    clearError(error);
    std::vector<TemplateSpec> specs;
    if (!makeTemplateSpecs(templates, labels, specs, error)) {
        return false;
    }
    return findMatches(image, specs, options, out, error);
}

bool matchTemplates(
    const cv::Mat& image,
    const std::vector<TemplateSpec>& templates,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error) {
    out.clear();
    clearError(error);
    if (!validateMatchOptions(image, options, true, error)) {
        return false;
    }

    std::vector<Detection> pool;
    if (!findMatches(image, templates, options, pool, error)) {
        return false;
    }

    NmsParams nms;
    nms.max_overlap = options.max_overlap;
    nms.max_objects = options.max_objects;
    nms.mode = options.overlap_mode;
    return suppress(pool, nms, out, error);
}

bool matchTemplates(
    const cv::Mat& image,
    const std::vector<cv::Mat>& templates,
    const std::vector<std::string>& labels,
    const MatchOptions& options,
    std::vector<Detection>& out,
    MatchError& error) {
    out.clear();
    clearError(error);
    std::vector<TemplateSpec> specs;
    if (!makeTemplateSpecs(templates, labels, specs, error)) {
        return false;
    }
    return matchTemplates(image, specs, options, out, error);
}

}  // namespace mtm
