#include "CandidateExtractor.hpp"

CandidateExtractor::CandidateExtractor(const Config& config)
    : config_(config) {}

std::vector<DetectedObject> CandidateExtractor::extract(const cv::Mat& mask,
                                                        std::optional<double> scaleFactor) const {
    if (mask.empty() || mask.type() != CV_8UC1) {
        return {};
    }

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<DetectedObject> candidates;
    int nextId = 1;
    for (const auto& contour : contours) {
        const double area = cv::contourArea(contour);
        if (area < config_.minimumContourArea) {
            continue;
        }

        cv::Point2f center;
        float radius = 0.0F;
        cv::minEnclosingCircle(contour, center, radius);
        if (radius <= 0.0F) {
            continue;
        }

        DetectedObject candidate;
        candidate.id = nextId++;
        candidate.center = center;
        candidate.diameterPx = 2.0 * static_cast<double>(radius);
        if (scaleFactor) {
            candidate.diameterPhysical = candidate.diameterPx * *scaleFactor;
        }

        candidates.push_back(candidate);
    }

    return candidates;
}
