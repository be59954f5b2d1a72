#pragma once

#include <opencv2/opencv.hpp>
#include <cmath>
#include <optional>

// One measured object in the normalized image.
struct DetectedObject {
    int id = 0;
    cv::Point2f center;
    double diameterPx = 0.0;
    std::optional<double> diameterPhysical;

    double radiusPx() const { return diameterPx / 2.0; }
};

inline double centerDistance(const cv::Point2f& a, const cv::Point2f& b) {
    const double dx = static_cast<double>(a.x) - static_cast<double>(b.x);
    const double dy = static_cast<double>(a.y) - static_cast<double>(b.y);
    return std::hypot(dx, dy);
}

inline double centerDistance(const DetectedObject& a, const DetectedObject& b) {
    return centerDistance(a.center, b.center);
}
