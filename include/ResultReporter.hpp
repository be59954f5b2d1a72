#pragma once

#include "DetectedObject.hpp"

#include <iostream>
#include <string>
#include <vector>

class ResultReporter {
public:
    struct Config {
        std::string unitLabel;
        int pixelPrecision;
        int physicalPrecision;

        Config()
            : unitLabel("mm"),
              pixelPrecision(1),
              physicalPrecision(2) {}
    };

    explicit ResultReporter(std::ostream& out = std::cout,
                            std::ostream& err = std::cerr,
                            const Config& config = Config());

    void reportImage(const std::string& imageName, const std::vector<DetectedObject>& objects);
    void reportSelection(const DetectedObject& object);
    void reportSkipped(const std::string& imagePath);

    // "Object 3: 41.2 px" with ", 12.34 mm" appended when a physical size is known.
    std::string formatObject(const DetectedObject& object) const;

private:
    std::ostream& out_;
    std::ostream& err_;
    Config config_;
};
