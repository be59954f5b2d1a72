#include "ObjectLocator.hpp"

#include <limits>

std::optional<DetectedObject> ObjectLocator::locate(const cv::Point2f& query,
                                                    const std::vector<DetectedObject>& objects) const {
    const DetectedObject* nearest = nullptr;
    double minDistance = std::numeric_limits<double>::max();

    for (const auto& object : objects) {
        const double distance = centerDistance(query, object.center);
        if (distance < minDistance) {
            minDistance = distance;
            nearest = &object;
        }
    }

    if (nearest == nullptr || minDistance > nearest->radiusPx()) {
        return std::nullopt;
    }

    return *nearest;
}
