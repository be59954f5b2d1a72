#pragma once

#include "DetectedObject.hpp"

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

class CandidateExtractor {
public:
    struct Config {
        double minimumContourArea;

        Config()
            : minimumContourArea(500.0) {}
    };

    explicit CandidateExtractor(const Config& config = Config());

    // Fits a minimal enclosing circle to every external mask region whose
    // contour area reaches minimumContourArea. Ids start at 1 in contour
    // discovery order. The mask must be CV_8UC1; anything else yields no candidates.
    std::vector<DetectedObject> extract(const cv::Mat& mask,
                                        std::optional<double> scaleFactor = std::nullopt) const;

private:
    Config config_;
};
