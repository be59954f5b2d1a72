#pragma once

#include "CandidateExtractor.hpp"
#include "DetectedObject.hpp"
#include "ImageNormalizer.hpp"
#include "OverlapResolver.hpp"
#include "SegmentationProvider.hpp"

#include <opencv2/opencv.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class MeasurementPipeline {
public:
    struct Config {
        ImageNormalizer::Config normalizer;
        CandidateExtractor::Config extractor;
        OverlapResolver::Config resolver;
        std::optional<double> scaleFactor;   // Physical units per normalized pixel
    };

    struct Result {
        bool success = false;                 // False when the image could not be decoded
        cv::Mat image;                        // Normalized image the measurements refer to
        std::vector<DetectedObject> objects;
    };

    // Uses MaskSegmenter when no segmentation provider is given.
    explicit MeasurementPipeline(const Config& config = Config(),
                                 std::unique_ptr<SegmentationProvider> segmenter = nullptr);

    Result process(const std::string& imagePath) const;
    Result process(const cv::Mat& image) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    ImageNormalizer normalizer_;
    std::unique_ptr<SegmentationProvider> segmenter_;
    CandidateExtractor extractor_;
    OverlapResolver resolver_;
};
