#include "matching/candidate_extractor.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

#include <opencv2/core.hpp>

namespace {

cv::Mat makeNoise(int w, int h, std::uint64_t seed) {
    cv::Mat img(h, w, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(img, cv::RNG::UNIFORM, 0, 256);
    return img;
}

bool atRect(const mtm::Detection& d, const cv::Rect& r) {
    const cv::Rect2d b = d.region().boundingRect();
    return std::abs(b.x - r.x) < 1e-6 && std::abs(b.y - r.y) < 1e-6 &&
           std::abs(b.width - r.width) < 1e-6 && std::abs(b.height - r.height) < 1e-6;
}

bool hasRect(const std::vector<mtm::Detection>& ds, const cv::Rect& r) {
    for (const auto& d : ds) {
        if (atRect(d, r)) {
            return true;
        }
    }
    return false;
}

}  // namespace

int main() {
    cv::Mat image = makeNoise(200, 160, 1);
    const cv::Mat object = makeNoise(24, 24, 2);
    const cv::Rect first(30, 40, 24, 24);
    const cv::Rect second(140, 100, 24, 24);
    object.copyTo(image(first));
    object.copyTo(image(second));

    mtm::TemplateSpec spec;
    spec.image = object;
    spec.label = "blob";

    mtm::MatchOptions options;
    options.score_threshold = 0.6;
    std::vector<mtm::Detection> out;
    mtm::MatchError error;

    if (!mtm::extractCandidates(image, spec, 3, options, out, error)) {
        std::cerr << "extraction failed: " << error.message << "\n";
        return 1;
    }
    if (out.size() != 2U) {
        std::cerr << "expected 2 candidates, got " << out.size() << "\n";
        return 1;
    }
    if (!hasRect(out, first) || !hasRect(out, second)) {
        std::cerr << "candidate positions mismatch\n";
        return 1;
    }
    for (const auto& d : out) {
        if (d.score() < 0.99 || d.templateIndex() != 3 || d.label() != "blob") {
            std::cerr << "candidate metadata mismatch\n";
            return 1;
        }
    }

    // per-template threshold override above any achievable score
    mtm::TemplateSpec strict = spec;
    strict.score_threshold = 1.01;
    if (!mtm::extractCandidates(image, strict, 0, options, out, error) || !out.empty()) {
        std::cerr << "threshold override should filter every candidate\n";
        return 1;
    }

    // single match ignores the threshold and returns the global best
    mtm::MatchOptions single = options;
    single.single_match = true;
    single.score_threshold = 1.0;
    if (!mtm::extractCandidates(image, strict, 0, single, out, error) || out.size() != 1U) {
        std::cerr << "single match should return exactly one candidate\n";
        return 1;
    }
    if (!hasRect(out, first) && !hasRect(out, second)) {
        std::cerr << "single match should land on an object\n";
        return 1;
    }

    // search box restricts the search and results come back in image coordinates
    mtm::MatchOptions boxed = options;
    boxed.search_box = cv::Rect(120, 80, 70, 70);
    if (!mtm::extractCandidates(image, spec, 0, boxed, out, error) || out.size() != 1U || !atRect(out[0], second)) {
        std::cerr << "search box extraction mismatch\n";
        return 1;
    }

    // downscaled search maps positions back to full resolution
    mtm::MatchOptions coarse = options;
    coarse.downscaling_factor = 2;
    if (!mtm::extractCandidates(image, spec, 0, coarse, out, error) || out.size() != 2U ||
        !hasRect(out, first) || !hasRect(out, second)) {
        std::cerr << "downscaled extraction mismatch\n";
        return 1;
    }

    // distance metric is negated, so a perfect match scores 0 and still ranks first
    mtm::MatchOptions sqdiff = options;
    sqdiff.method = mtm::CorrelationMethod::SqDiffNormed;
    sqdiff.score_threshold = -0.05;
    if (!mtm::extractCandidates(image, spec, 0, sqdiff, out, error) || out.size() != 2U) {
        std::cerr << "sqdiff extraction mismatch\n";
        return 1;
    }
    if (out[0].score() > 1e-6 || out[0].score() < -0.05) {
        std::cerr << "sqdiff score should be negated distance\n";
        return 1;
    }

    // rotated placement turns the hit into a rotated box around the match centre
    mtm::TemplateSpec tilted = spec;
    tilted.placement = mtm::RotatedPlacement{30.0, cv::Size2f(16.0F, 10.0F)};
    if (!mtm::extractCandidates(image, tilted, 0, options, out, error) || out.size() != 2U) {
        std::cerr << "rotated placement extraction failed\n";
        return 1;
    }
    for (const auto& d : out) {
        const cv::Rect2d tb = d.region().boundingRect();
        const double cx = tb.x + tb.width * 0.5;
        const double cy = tb.y + tb.height * 0.5;
        const bool on_first = std::abs(cx - (first.x + 12.0)) < 0.5 && std::abs(cy - (first.y + 12.0)) < 0.5;
        const bool on_second = std::abs(cx - (second.x + 12.0)) < 0.5 && std::abs(cy - (second.y + 12.0)) < 0.5;
        if (d.region().isAxisAligned() || std::abs(d.region().area() - 160.0) > 0.5 || (!on_first && !on_second)) {
            std::cerr << "rotated placement region mismatch\n";
            return 1;
        }
    }

    // masked matching still finds the object
    mtm::TemplateSpec masked = spec;
    masked.mask = cv::Mat(24, 24, CV_8UC1, cv::Scalar(0));
    cv::rectangle(masked.mask, cv::Rect(4, 4, 16, 16), cv::Scalar(255), cv::FILLED);
    mtm::MatchOptions ccorr = options;
    ccorr.method = mtm::CorrelationMethod::CCorrNormed;
    ccorr.single_match = true;
    if (!mtm::extractCandidates(image, masked, 0, ccorr, out, error) || out.size() != 1U ||
        (!hasRect(out, first) && !hasRect(out, second))) {
        std::cerr << "masked extraction mismatch\n";
        return 1;
    }

    // shape errors
    mtm::TemplateSpec too_big;
    too_big.image = makeNoise(220, 20, 4);
    if (mtm::extractCandidates(image, too_big, 0, options, out, error) ||
        error.status != mtm::MatchStatus::ShapeMismatch || !out.empty()) {
        std::cerr << "template wider than image should be a shape mismatch\n";
        return 1;
    }
    mtm::TemplateSpec color;
    color.image = cv::Mat(10, 10, CV_8UC3, cv::Scalar(1, 2, 3));
    if (mtm::extractCandidates(image, color, 0, options, out, error) ||
        error.status != mtm::MatchStatus::ShapeMismatch) {
        std::cerr << "channel mismatch should be a shape mismatch\n";
        return 1;
    }
    mtm::TemplateSpec deep;
    object.convertTo(deep.image, CV_32F);
    if (mtm::extractCandidates(image, deep, 0, options, out, error) ||
        error.status != mtm::MatchStatus::ShapeMismatch) {
        std::cerr << "bit depth mismatch should be a shape mismatch\n";
        return 1;
    }
    mtm::MatchOptions tiny_box = options;
    tiny_box.search_box = cv::Rect(0, 0, 20, 20);
    if (mtm::extractCandidates(image, spec, 0, tiny_box, out, error) ||
        error.status != mtm::MatchStatus::ShapeMismatch) {
        std::cerr << "template larger than search box should be a shape mismatch\n";
        return 1;
    }

    return 0;
}
