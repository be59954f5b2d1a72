#include "ImageDirectory.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

ImageDirectory::ImageDirectory()
    : opened_(false) {}

bool ImageDirectory::open(const std::string& directoryPath) {
    path_ = directoryPath;
    files_.clear();
    opened_ = false;

    std::error_code ec;
    if (!fs::is_directory(directoryPath, ec)) {
        std::cerr << "Input directory not found: " << directoryPath << std::endl;
        return false;
    }

    std::vector<fs::path> entries;
    for (fs::directory_iterator it(directoryPath, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statusError;
        if (it->is_regular_file(statusError)) {
            entries.push_back(it->path());
        }
    }

    if (ec) {
        std::cerr << "Unable to read directory " << directoryPath << ": " << ec.message() << std::endl;
        return false;
    }

    std::sort(entries.begin(), entries.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    files_.reserve(entries.size());
    for (const auto& entry : entries) {
        files_.push_back(entry.string());
    }

    opened_ = true;
    return true;
}

bool ImageDirectory::isOpened() const {
    return opened_;
}

const std::vector<std::string>& ImageDirectory::files() const {
    return files_;
}

const std::string& ImageDirectory::path() const {
    return path_;
}
