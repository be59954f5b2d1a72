#pragma once

#include <opencv2/opencv.hpp>

// Turns a normalized image into a binary foreground mask (CV_8UC1, 255 = object)
// of the same size. Objects appear as filled blobs; holes may survive.
class SegmentationProvider {
public:
    virtual ~SegmentationProvider() = default;

    virtual cv::Mat segment(const cv::Mat& image) const = 0;
};
