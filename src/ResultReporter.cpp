#include "ResultReporter.hpp"

#include <iomanip>
#include <sstream>

ResultReporter::ResultReporter(std::ostream& out, std::ostream& err, const Config& config)
    : out_(out),
      err_(err),
      config_(config) {}

void ResultReporter::reportImage(const std::string& imageName, const std::vector<DetectedObject>& objects) {
    out_ << "\n" << imageName << ": detected " << objects.size() << " objects." << std::endl;
    out_ << "Click an object to see its size. Press 'n' for next, 'q' to quit." << std::endl;
}

void ResultReporter::reportSelection(const DetectedObject& object) {
    out_ << formatObject(object) << std::endl;
}

void ResultReporter::reportSkipped(const std::string& imagePath) {
    err_ << "Skipping unreadable image: " << imagePath << std::endl;
}

std::string ResultReporter::formatObject(const DetectedObject& object) const {
    std::ostringstream line;
    line << "Object " << object.id << ": "
         << std::fixed << std::setprecision(config_.pixelPrecision) << object.diameterPx << " px";

    if (object.diameterPhysical) {
        line << ", " << std::setprecision(config_.physicalPrecision) << *object.diameterPhysical
             << " " << config_.unitLabel;
    }

    return line.str();
}
