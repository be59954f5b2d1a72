#pragma once

#include "DetectedObject.hpp"

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

// Picks the object under a query point: the nearest center wins, and the hit
// only counts when the point lies within that object's radius.
class ObjectLocator {
public:
    std::optional<DetectedObject> locate(const cv::Point2f& query,
                                         const std::vector<DetectedObject>& objects) const;
};
