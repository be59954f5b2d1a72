#pragma once

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace testimages {

struct Disk {
    cv::Point center;
    int radius;
};

// Dark filled disks on a white BGR canvas.
inline cv::Mat diskImage(const cv::Size& size, const std::vector<Disk>& disks) {
    cv::Mat image(size, CV_8UC3, cv::Scalar(255, 255, 255));
    for (const auto& disk : disks) {
        cv::circle(image, disk.center, disk.radius, cv::Scalar(20, 20, 20), cv::FILLED);
    }
    return image;
}

// Foreground disks on an empty CV_8UC1 mask.
inline cv::Mat diskMask(const cv::Size& size, const std::vector<Disk>& disks) {
    cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
    for (const auto& disk : disks) {
        cv::circle(mask, disk.center, disk.radius, cv::Scalar(255), cv::FILLED);
    }
    return mask;
}

// Directory under the system temp dir named after the running test, removed on destruction.
class ScratchDirectory {
public:
    ScratchDirectory() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "coin_measure_";
        if (info != nullptr) {
            name += std::string(info->test_suite_name()) + "_" + info->name();
        }
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace testimages
