#pragma once

#include <opencv2/opencv.hpp>

class ImageNormalizer {
public:
    struct Config {
        int maxWidth;

        Config()
            : maxWidth(800) {}
    };

    explicit ImageNormalizer(const Config& config = Config());

    // Downscales so the width does not exceed maxWidth, keeping the aspect ratio.
    // Images that already fit are returned as a shallow copy.
    cv::Mat normalize(const cv::Mat& image) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};
