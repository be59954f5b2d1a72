#include "MeasurementPipeline.hpp"

#include "MaskSegmenter.hpp"

#include <iostream>
#include <utility>

MeasurementPipeline::MeasurementPipeline(const Config& config,
                                         std::unique_ptr<SegmentationProvider> segmenter)
    : config_(config),
      normalizer_(config.normalizer),
      segmenter_(std::move(segmenter)),
      extractor_(config.extractor),
      resolver_(config.resolver) {
    if (!segmenter_) {
        segmenter_ = std::make_unique<MaskSegmenter>();
    }
}

MeasurementPipeline::Result MeasurementPipeline::process(const std::string& imagePath) const {
    cv::Mat image;
    try {
        image = cv::imread(imagePath, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "Failed to decode " << imagePath << ": " << e.what() << std::endl;
        return {};
    }

    return process(image);
}

MeasurementPipeline::Result MeasurementPipeline::process(const cv::Mat& image) const {
    Result result;
    if (image.empty()) {
        return result;
    }

    result.success = true;
    result.image = normalizer_.normalize(image);

    const cv::Mat mask = segmenter_->segment(result.image);
    result.objects = resolver_.resolve(extractor_.extract(mask, config_.scaleFactor));
    return result;
}
