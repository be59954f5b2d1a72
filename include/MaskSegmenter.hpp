#pragma once

#include "SegmentationProvider.hpp"

#include <opencv2/opencv.hpp>

// Otsu threshold segmentation for dark objects on a light background.
class MaskSegmenter : public SegmentationProvider {
public:
    struct Config {
        int blurKernelSize;
        int morphKernelSize;
        int morphCloseIterations;
        int morphOpenIterations;
        bool invert;

        Config()
            : blurKernelSize(5),
              morphKernelSize(5),
              morphCloseIterations(2),
              morphOpenIterations(1),
              invert(true) {}
    };

    explicit MaskSegmenter(const Config& config = Config());

    cv::Mat segment(const cv::Mat& image) const override;

private:
    Config config_;
};
