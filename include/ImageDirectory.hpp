#pragma once

#include <string>
#include <vector>

// Regular files of one directory, sorted by file name.
class ImageDirectory {
public:
    ImageDirectory();

    bool open(const std::string& directoryPath);
    bool isOpened() const;

    const std::vector<std::string>& files() const;
    const std::string& path() const;

private:
    std::string path_;
    std::vector<std::string> files_;
    bool opened_;
};
