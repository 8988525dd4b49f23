#pragma once

#include <vector>

#include <opencv2/core.hpp>

namespace mtm {

// Normalisation used when turning an intersection area into an overlap ratio.
enum class OverlapMode {
    Smaller,  // intersection / min(area_a, area_b)
    Union,    // intersection / union (IoU)
};

// Convex polygon in image coordinates. Axis-aligned rectangles are tagged so
// that rectangle/rectangle queries stay exact.
class Region {
public:
    Region() = default;

    static Region fromRect(const cv::Rect2d& rect);
    static Region fromRotatedRect(const cv::RotatedRect& box);
    static Region fromPolygon(const std::vector<cv::Point2f>& points);

    const std::vector<cv::Point2f>& vertices() const { return vertices_; }
    bool isAxisAligned() const { return axis_aligned_; }
    bool empty() const { return vertices_.size() < 3; }

    double area() const;
    cv::Rect2d boundingRect() const;

    Region translated(double dx, double dy) const;
    Region scaled(double factor) const;

private:
    std::vector<cv::Point2f> vertices_;
    cv::Rect2d rect_;
    bool axis_aligned_{false};
};

double intersectionArea(const Region& a, const Region& b);
double unionArea(const Region& a, const Region& b);
double overlapRatio(const Region& a, const Region& b, OverlapMode mode = OverlapMode::Smaller);
bool contains(const Region& outer, const Region& inner);
bool overlaps(const Region& a, const Region& b);

}  // namespace mtm
