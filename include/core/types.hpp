#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "geometry/region.hpp"

namespace mtm {

enum class CorrelationMethod {
    CCoeffNormed,
    CCorrNormed,
    SqDiffNormed,  // distance; negated on extraction so higher stays better
};

// Rotation already applied to a template image. `angle_deg` follows the
// cv::getRotationMatrix2D convention (positive = counter-clockwise) and
// `object_size` is the unrotated object size in pixels.
struct RotatedPlacement {
    double angle_deg{0.0};
    cv::Size2f object_size{0.0F, 0.0F};
};

struct TemplateSpec {
    cv::Mat image;
    std::string label;
    cv::Mat mask;  // optional, same size as image
    std::optional<RotatedPlacement> placement;
    std::optional<double> score_threshold;  // overrides MatchOptions::score_threshold
};

struct MatchOptions {
    double score_threshold{0.5};
    double max_overlap{0.25};
    OverlapMode overlap_mode{OverlapMode::Smaller};
    std::optional<int> max_objects;  // nullopt = unbounded
    bool single_match{false};
    CorrelationMethod method{CorrelationMethod::CCoeffNormed};
    int downscaling_factor{1};
    std::optional<cv::Rect> search_box;
    bool parallel_templates{false};
};

class Detection {
public:
    Detection() = default;
    Detection(Region region, double score, int template_index = 0, std::string label = {});

    const Region& region() const { return region_; }
    double score() const { return score_; }
    int templateIndex() const { return template_index_; }
    const std::string& label() const { return label_; }

    double overlapRatio(const Detection& other, OverlapMode mode = OverlapMode::Smaller) const;
    double intersectionOverUnion(const Detection& other) const;

private:
    Region region_;
    double score_{0.0};
    int template_index_{0};
    std::string label_;
};

std::ostream& operator<<(std::ostream& os, const Detection& d);

}  // namespace mtm
