#include "matching/correlation.hpp"

#include <cmath>
#include <iostream>

#include <opencv2/core.hpp>

int main() {
    cv::Mat map(6, 6, CV_32FC1, cv::Scalar(0.0F));
    map.at<float>(0, 0) = 0.9F;  // corner peak
    map.at<float>(4, 1) = 0.8F;  // plateau of two pixels
    map.at<float>(4, 2) = 0.8F;
    map.at<float>(1, 4) = 0.7F;
    map.at<float>(2, 4) = 0.6F;  // shoulder of (1,4), not a peak
    map.at<float>(5, 5) = 0.7F;

    const auto peaks = mtm::positionsAboveThreshold(map, 0.5);
    if (peaks.size() != 4U) {
        std::cerr << "expected 4 peaks, got " << peaks.size() << "\n";
        return 1;
    }
    if (peaks[0].position != cv::Point(0, 0) || std::abs(peaks[0].score - 0.9) > 1e-6) {
        std::cerr << "border peak should come first\n";
        return 1;
    }
    if (peaks[1].position != cv::Point(1, 4)) {
        std::cerr << "plateau should be reduced to its first pixel\n";
        return 1;
    }
    // equal scores keep raster order
    if (peaks[2].position != cv::Point(4, 1) || peaks[3].position != cv::Point(5, 5)) {
        std::cerr << "tied peaks out of raster order\n";
        return 1;
    }

    const auto strong = mtm::positionsAboveThreshold(map, 0.75);
    if (strong.size() != 2U) {
        std::cerr << "threshold should keep two peaks, got " << strong.size() << "\n";
        return 1;
    }
    for (const auto& p : strong) {
        if (p.score < 0.75) {
            std::cerr << "peak below threshold returned\n";
            return 1;
        }
    }

    // a peak next to a non-peak of equal value is still a peak
    cv::Mat shoulder(4, 4, CV_32FC1, cv::Scalar(0.0F));
    shoulder.at<float>(0, 0) = 1.0F;
    shoulder.at<float>(0, 1) = 0.9F;  // borders 1.0, not a peak
    shoulder.at<float>(1, 2) = 0.9F;  // true 3x3 maximum
    const auto shoulder_peaks = mtm::positionsAboveThreshold(shoulder, 0.5);
    if (shoulder_peaks.size() != 2U || shoulder_peaks[0].position != cv::Point(0, 0) ||
        shoulder_peaks[1].position != cv::Point(2, 1)) {
        std::cerr << "expected peaks at (0,0) and (2,1), got " << shoulder_peaks.size() << "\n";
        return 1;
    }

    // U-shaped plateau is one connected run and yields one position
    cv::Mat cup(3, 4, CV_32FC1, cv::Scalar(0.0F));
    cup.at<float>(0, 0) = 0.8F;
    cup.at<float>(0, 2) = 0.8F;
    cup.at<float>(1, 0) = 0.8F;
    cup.at<float>(1, 1) = 0.8F;
    cup.at<float>(1, 2) = 0.8F;
    const auto cup_peaks = mtm::positionsAboveThreshold(cup, 0.5);
    if (cup_peaks.size() != 1U || cup_peaks[0].position != cv::Point(0, 0)) {
        std::cerr << "U-shaped plateau should give one peak at (0,0), got " << cup_peaks.size() << "\n";
        return 1;
    }

    const auto best = mtm::bestPosition(map);
    if (best.position != cv::Point(0, 0) || std::abs(best.score - 0.9) > 1e-6) {
        std::cerr << "best position mismatch\n";
        return 1;
    }

    // template as large as the image gives a 1x1 map
    cv::Mat image(12, 12, CV_8UC1);
    cv::RNG rng(11);
    rng.fill(image, cv::RNG::UNIFORM, 0, 256);
    cv::Mat score_map;
    std::string error;
    if (!mtm::correlate(image, image, cv::Mat(), mtm::CorrelationMethod::CCoeffNormed, score_map, error)) {
        std::cerr << "self correlation failed: " << error << "\n";
        return 1;
    }
    if (score_map.rows != 1 || score_map.cols != 1) {
        std::cerr << "expected 1x1 score map\n";
        return 1;
    }
    const auto single = mtm::positionsAboveThreshold(score_map, 0.5);
    if (single.size() != 1U || single[0].position != cv::Point(0, 0) || single[0].score < 0.99) {
        std::cerr << "1x1 map should produce one peak at origin\n";
        return 1;
    }
    if (!mtm::positionsAboveThreshold(score_map, 1.5).empty()) {
        std::cerr << "1x1 map below threshold should produce nothing\n";
        return 1;
    }

    // squared difference is negated: best is 0, everything else is below
    if (!mtm::correlate(image, image(cv::Rect(2, 3, 6, 6)).clone(), cv::Mat(),
                        mtm::CorrelationMethod::SqDiffNormed, score_map, error)) {
        std::cerr << "sqdiff correlation failed: " << error << "\n";
        return 1;
    }
    const auto sq_best = mtm::bestPosition(score_map);
    if (sq_best.position != cv::Point(2, 3) || sq_best.score > 1e-6 || sq_best.score < -1e-4) {
        std::cerr << "negated sqdiff best mismatch: " << sq_best.score << "\n";
        return 1;
    }

    cv::Mat color(12, 12, CV_8UC3, cv::Scalar(1, 2, 3));
    if (mtm::correlate(image, color(cv::Rect(0, 0, 4, 4)), cv::Mat(),
                       mtm::CorrelationMethod::CCoeffNormed, score_map, error)) {
        std::cerr << "type mismatch should fail\n";
        return 1;
    }

    return 0;
}
