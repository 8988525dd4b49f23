#include "geometry/region.hpp"

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace mtm {

namespace {

std::vector<cv::Point2f> rectCorners(const cv::Rect2d& r) {
    const float x0 = static_cast<float>(r.x);
    const float y0 = static_cast<float>(r.y);
    const float x1 = static_cast<float>(r.x + r.width);
    const float y1 = static_cast<float>(r.y + r.height);
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

}  // namespace

Region Region::fromRect(const cv::Rect2d& rect) {
    Region out;
    out.rect_ = cv::Rect2d(rect.x, rect.y, std::max(0.0, rect.width), std::max(0.0, rect.height));
    out.vertices_ = rectCorners(out.rect_);
    out.axis_aligned_ = true;
    return out;
}

Region Region::fromRotatedRect(const cv::RotatedRect& box) {
    cv::Point2f pts[4];
    box.points(pts);
    return fromPolygon(std::vector<cv::Point2f>(pts, pts + 4));
}

Region Region::fromPolygon(const std::vector<cv::Point2f>& points) {
    Region out;
    if (points.size() < 3) {
        out.vertices_ = points;
    } else {
        cv::convexHull(points, out.vertices_, false, true);
    }
    out.rect_ = out.boundingRect();
    return out;
}

double Region::area() const {
    if (axis_aligned_) {
        return rect_.area();
    }
    if (vertices_.size() < 3) {
        return 0.0;
    }
    return cv::contourArea(vertices_);
}

cv::Rect2d Region::boundingRect() const {
    if (axis_aligned_) {
        return rect_;
    }
    if (vertices_.empty()) {
        return {};
    }
    float x0 = vertices_.front().x;
    float y0 = vertices_.front().y;
    float x1 = x0;
    float y1 = y0;
    for (const auto& p : vertices_) {
        x0 = std::min(x0, p.x);
        y0 = std::min(y0, p.y);
        x1 = std::max(x1, p.x);
        y1 = std::max(y1, p.y);
    }
    return cv::Rect2d(x0, y0, x1 - x0, y1 - y0);
}

Region Region::translated(double dx, double dy) const {
    if (axis_aligned_) {
        return fromRect(cv::Rect2d(rect_.x + dx, rect_.y + dy, rect_.width, rect_.height));
    }
    Region out = *this;
    const cv::Point2f d(static_cast<float>(dx), static_cast<float>(dy));
    for (auto& p : out.vertices_) {
        p += d;
    }
    out.rect_ = out.boundingRect();
    return out;
}

Region Region::scaled(double factor) const {
    if (axis_aligned_) {
        return fromRect(cv::Rect2d(rect_.x * factor, rect_.y * factor, rect_.width * factor, rect_.height * factor));
    }
    Region out = *this;
    for (auto& p : out.vertices_) {
        p *= static_cast<float>(factor);
    }
    out.rect_ = out.boundingRect();
    return out;
}

double intersectionArea(const Region& a, const Region& b) {
    if (a.area() <= 0.0 || b.area() <= 0.0) {
        return 0.0;
    }
    if (a.isAxisAligned() && b.isAxisAligned()) {
        return (a.boundingRect() & b.boundingRect()).area();
    }
    std::vector<cv::Point2f> common;
    const float area = cv::intersectConvexConvex(a.vertices(), b.vertices(), common, true);
    return std::max(0.0, static_cast<double>(area));
}

double unionArea(const Region& a, const Region& b) {
    return a.area() + b.area() - intersectionArea(a, b);
}

double overlapRatio(const Region& a, const Region& b, OverlapMode mode) {
    const double inter = intersectionArea(a, b);
    if (inter <= 0.0) {
        return 0.0;
    }
    const double denom = (mode == OverlapMode::Union)
        ? (a.area() + b.area() - inter)
        : std::min(a.area(), b.area());
    if (denom <= 0.0) {
        return 0.0;
    }
    return std::min(1.0, inter / denom);
}

bool contains(const Region& outer, const Region& inner) {
    if (outer.empty() || inner.empty()) {
        return false;
    }
    if (outer.isAxisAligned() && inner.isAxisAligned()) {
        const cv::Rect2d o = outer.boundingRect();
        const cv::Rect2d i = inner.boundingRect();
        return i.x >= o.x && i.y >= o.y && i.x + i.width <= o.x + o.width && i.y + i.height <= o.y + o.height;
    }
    for (const auto& p : inner.vertices()) {
        if (cv::pointPolygonTest(outer.vertices(), p, false) < 0.0) {
            return false;
        }
    }
    return true;
}

bool overlaps(const Region& a, const Region& b) {
    return intersectionArea(a, b) > 0.0;
}

}  // namespace mtm
