#include "core/types.hpp"

#include <iomanip>
#include <ostream>
#include <utility>

namespace mtm {

Detection::Detection(Region region, double score, int template_index, std::string label)
    : region_(std::move(region)),
      score_(score),
      template_index_(template_index),
      label_(std::move(label)) {}

double Detection::overlapRatio(const Detection& other, OverlapMode mode) const {
    return mtm::overlapRatio(region_, other.region_, mode);
}

double Detection::intersectionOverUnion(const Detection& other) const {
    return mtm::overlapRatio(region_, other.region_, OverlapMode::Union);
}

std::ostream& operator<<(std::ostream& os, const Detection& d) {
    const cv::Rect2d r = d.region().boundingRect();
    const auto flags = os.flags();
    const auto precision = os.precision();
    os << "(Detection, score:" << std::fixed << std::setprecision(2) << d.score()
       << ", xywh:(" << std::setprecision(0) << r.x << ", " << r.y << ", " << r.width << ", " << r.height << ")"
       << ", index:" << d.templateIndex();
    if (!d.label().empty()) {
        os << ", " << d.label();
    }
    os << ")";
    os.flags(flags);
    os.precision(precision);
    return os;
}

}  // namespace mtm
