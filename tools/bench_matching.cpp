#include "matching/matcher.hpp"
#include "matching/nms.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace {

inline int64_t nowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

int64_t pct(std::vector<int64_t>& v, double p) {
    if (v.empty()) return 0;
    std::sort(v.begin(), v.end());
    const std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(v.size() - 1));
    return v[idx];
}

cv::Mat makeNoise(int w, int h, uint64_t seed) {
    cv::Mat img(h, w, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(img, cv::RNG::UNIFORM, 0, 256);
    return img;
}

struct Timings {
    std::vector<int64_t> find_ns;
    std::vector<int64_t> nms_ns;
    std::size_t raw{0};
    std::size_t kept{0};
};

bool runSeries(
    const cv::Mat& scene,
    const std::vector<mtm::TemplateSpec>& templates,
    const mtm::MatchOptions& options,
    int runs,
    Timings& out) {
    mtm::NmsParams nms;
    nms.max_overlap = options.max_overlap;
    nms.mode = options.overlap_mode;

    std::vector<mtm::Detection> raw;
    std::vector<mtm::Detection> kept;
    mtm::MatchError error;
    for (int i = 0; i < runs; ++i) {
        const int64_t t0 = nowNs();
        if (!mtm::findMatches(scene, templates, options, raw, error)) {
            std::cerr << "findMatches failed: " << error.message << "\n";
            return false;
        }
        const int64_t t1 = nowNs();
        if (!mtm::suppress(raw, nms, kept, error)) {
            std::cerr << "suppress failed: " << error.message << "\n";
            return false;
        }
        const int64_t t2 = nowNs();
        out.find_ns.push_back(t1 - t0);
        out.nms_ns.push_back(t2 - t1);
    }
    out.raw = raw.size();
    out.kept = kept.size();
    return true;
}

}  // namespace

int main() {
    constexpr int kRuns = 30;
    constexpr int kTemplates = 8;

    cv::Mat scene = makeNoise(640, 480, 1);
    std::vector<mtm::TemplateSpec> templates;
    cv::RNG rng(2);
    for (int t = 0; t < kTemplates; ++t) {
        mtm::TemplateSpec spec;
        spec.image = makeNoise(32, 32, static_cast<uint64_t>(100 + t));
        spec.label = "t" + std::to_string(t);
        for (int k = 0; k < 6; ++k) {
            const cv::Rect at(rng.uniform(0, 640 - 32), rng.uniform(0, 480 - 32), 32, 32);
            spec.image.copyTo(scene(at));
        }
        templates.push_back(spec);
    }

    mtm::MatchOptions options;
    options.score_threshold = 0.5;
    options.max_overlap = 0.25;

    Timings serial;
    if (!runSeries(scene, templates, options, kRuns, serial)) {
        return 1;
    }
    options.parallel_templates = true;
    Timings parallel;
    if (!runSeries(scene, templates, options, kRuns, parallel)) {
        return 1;
    }

    std::cout << "benchmark multi_template_matching\n";
    std::cout << "templates " << kTemplates << "\n";
    std::cout << "raw_candidates " << serial.raw << "\n";
    std::cout << "kept_detections " << serial.kept << "\n";
    std::cout << "serial_find_ns_p50 " << pct(serial.find_ns, 0.50) << "\n";
    std::cout << "serial_find_ns_p95 " << pct(serial.find_ns, 0.95) << "\n";
    std::cout << "parallel_find_ns_p50 " << pct(parallel.find_ns, 0.50) << "\n";
    std::cout << "parallel_find_ns_p95 " << pct(parallel.find_ns, 0.95) << "\n";
    std::cout << "nms_ns_p50 " << pct(serial.nms_ns, 0.50) << "\n";
    std::cout << "nms_ns_p95 " << pct(serial.nms_ns, 0.95) << "\n";
    return 0;
}
