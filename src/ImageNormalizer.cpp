#include "ImageNormalizer.hpp"

ImageNormalizer::ImageNormalizer(const Config& config)
    : config_(config) {}

cv::Mat ImageNormalizer::normalize(const cv::Mat& image) const {
    if (image.empty() || config_.maxWidth <= 0 || image.cols <= config_.maxWidth) {
        return image;
    }

    const double factor = static_cast<double>(config_.maxWidth) / static_cast<double>(image.cols);
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(), factor, factor, cv::INTER_LINEAR);
    return resized;
}
