#include "MaskSegmenter.hpp"

#include <algorithm>

MaskSegmenter::MaskSegmenter(const Config& config)
    : config_(config) {}

cv::Mat MaskSegmenter::segment(const cv::Mat& image) const {
    if (image.empty()) {
        return {};
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }

    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }

    // GaussianBlur needs an odd kernel
    if (config_.blurKernelSize > 1) {
        const int blurSize = config_.blurKernelSize | 1;
        cv::GaussianBlur(gray, gray, cv::Size(blurSize, blurSize), 0);
    }

    const int thresholdType = (config_.invert ? cv::THRESH_BINARY_INV : cv::THRESH_BINARY) | cv::THRESH_OTSU;
    cv::Mat mask;
    cv::threshold(gray, mask, 0, 255, thresholdType);

    const int morphKernelSize = std::max(1, config_.morphKernelSize);
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE,
                                               cv::Size(morphKernelSize, morphKernelSize));
    if (config_.morphCloseIterations > 0) {
        cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, kernel, cv::Point(-1, -1),
                         config_.morphCloseIterations);
    }
    if (config_.morphOpenIterations > 0) {
        cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel, cv::Point(-1, -1),
                         config_.morphOpenIterations);
    }

    return mask;
}
