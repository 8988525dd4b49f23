#include "matching/correlation.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>

#include <opencv2/imgproc.hpp>

namespace mtm {

int toOpenCvMethod(CorrelationMethod method) {
    switch (method) {
        case CorrelationMethod::CCoeffNormed: return cv::TM_CCOEFF_NORMED;
        case CorrelationMethod::CCorrNormed: return cv::TM_CCORR_NORMED;
        case CorrelationMethod::SqDiffNormed: return cv::TM_SQDIFF_NORMED;
    }
    return cv::TM_CCOEFF_NORMED;
}

bool correlate(
    const cv::Mat& image,
    const cv::Mat& templ,
    const cv::Mat& mask,
    CorrelationMethod method,
    cv::Mat& out_map,
    std::string& error) {
    out_map.release();
    if (image.empty() || templ.empty()) {
        error = "image and template must not be empty";
        return false;
    }
    if (image.type() != templ.type()) {
        error = "template type does not match image type";
        return false;
    }
    if (templ.cols > image.cols || templ.rows > image.rows) {
        error = "template is larger than the search image";
        return false;
    }

    try {
        cv::Mat result;
        if (mask.empty()) {
            cv::matchTemplate(image, templ, result, toOpenCvMethod(method));
        } else {
            cv::matchTemplate(image, templ, result, toOpenCvMethod(method), mask);
        }
        if (method == CorrelationMethod::SqDiffNormed) {
            result = -result;
        }
        // masked correlation can divide by zero on flat windows
        cv::patchNaNs(result, -1.0);
        out_map = result;
    } catch (const cv::Exception& e) {
        error = e.what();
        return false;
    }

    error.clear();
    return true;
}

PeakResult bestPosition(const cv::Mat& score_map) {
    PeakResult out;
    if (score_map.empty()) {
        out.score = -std::numeric_limits<double>::infinity();
        return out;
    }
    double max_val = 0.0;
    cv::Point max_loc;
    cv::minMaxLoc(score_map, nullptr, &max_val, nullptr, &max_loc);
    out.position = max_loc;
    out.score = max_val;
    return out;
}

std::vector<PeakResult> positionsAboveThreshold(const cv::Mat& score_map, double threshold) {
    std::vector<PeakResult> peaks;
    if (score_map.empty()) {
        return peaks;
    }

    cv::Mat map32;
    if (score_map.type() == CV_32FC1) {
        map32 = score_map;
    } else {
        score_map.convertTo(map32, CV_32F);
    }

    cv::Mat dilated;
    cv::dilate(map32, dilated, cv::Mat());

    cv::Mat mask(map32.size(), CV_8UC1, cv::Scalar(0));
    for (int y = 0; y < map32.rows; ++y) {
        const float* row = map32.ptr<float>(y);
        const float* dil = dilated.ptr<float>(y);
        uchar* m = mask.ptr<uchar>(y);
        for (int x = 0; x < map32.cols; ++x) {
            if (static_cast<double>(row[x]) >= threshold && row[x] >= dil[x]) {
                m[x] = 255;
            }
        }
    }

    // adjacent local maxima are equal-valued, so each component is one plateau
    cv::Mat labels;
    cv::Mat stats;
    cv::Mat centroids;
    const int count = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);
    if (count <= 1) {
        return peaks;
    }

    // first pixel of each plateau in raster order
    std::vector<bool> taken(static_cast<std::size_t>(count), false);
    for (int y = 0; y < labels.rows; ++y) {
        const int* lab = labels.ptr<int>(y);
        const float* row = map32.ptr<float>(y);
        for (int x = 0; x < labels.cols; ++x) {
            const int id = lab[x];
            if (id == 0 || taken[static_cast<std::size_t>(id)]) {
                continue;
            }
            taken[static_cast<std::size_t>(id)] = true;
            peaks.push_back(PeakResult{cv::Point(x, y), static_cast<double>(row[x])});
        }
    }

    std::stable_sort(peaks.begin(), peaks.end(), [](const PeakResult& a, const PeakResult& b) {
        return a.score > b.score;
    });
    return peaks;
}

}  // namespace mtm
