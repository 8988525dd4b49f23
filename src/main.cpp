#include "core/config.hpp"
#include "matching/matcher.hpp"
#include "render/detection_renderer.hpp"

#include <iostream>
#include <string>
#include <vector>

#include <opencv2/imgcodecs.hpp>

namespace {

std::string fileStem(const std::string& path) {
    const auto slash = path.find_last_of("/\\");
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    const auto dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name;
}

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.yaml> <image> <template> [<template>...]\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string config_path = argv[1];
    const std::string image_path = argv[2];

    mtm::AppConfig config;
    std::string error;
    if (!mtm::loadConfig(config_path, config, error)) {
        std::cerr << "Config load failed: " << error << '\n';
        return 1;
    }

    const cv::Mat image = cv::imread(image_path, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        std::cerr << "Failed to read image: " << image_path << '\n';
        return 1;
    }

    std::vector<mtm::TemplateSpec> templates;
    for (int i = 3; i < argc; ++i) {
        mtm::TemplateSpec spec;
        spec.image = cv::imread(argv[i], cv::IMREAD_UNCHANGED);
        if (spec.image.empty()) {
            std::cerr << "Failed to read template: " << argv[i] << '\n';
            return 1;
        }
        spec.label = fileStem(argv[i]);
        templates.push_back(spec);
    }

    const mtm::MatchOptions options = mtm::toMatchOptions(config.match);
    std::vector<mtm::Detection> detections;
    mtm::MatchError match_error;
    if (!mtm::matchTemplates(image, templates, options, detections, match_error)) {
        std::cerr << "Matching failed [" << mtm::toString(match_error.status) << "]: "
                  << match_error.message << '\n';
        return 1;
    }

    std::cerr << "Found " << detections.size() << " detection(s) with " << templates.size() << " template(s)\n";
    for (const auto& d : detections) {
        std::cout << d << '\n';
    }

    if (!config.output.annotated_path.empty()) {
        mtm::RenderStyle style;
        style.thickness = config.output.thickness;
        style.show_score = config.output.draw_scores;
        style.show_legend = config.output.draw_legend;
        const cv::Mat annotated = mtm::DetectionRenderer::drawDetections(image, detections, style);
        try {
            if (!cv::imwrite(config.output.annotated_path, annotated)) {
                std::cerr << "Failed to write annotated image: " << config.output.annotated_path << '\n';
                return 1;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "Failed to write annotated image: " << e.what() << '\n';
            return 1;
        }
    }

    return 0;
}
