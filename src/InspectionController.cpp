#include "InspectionController.hpp"

#include <string>
#include <utility>

using Params = InspectionController::Parameters;

namespace {

cv::Point toPixel(const cv::Point2f& point) {
    return {cvRound(point.x), cvRound(point.y)};
}

int drawRadius(const DetectedObject& object) {
    return static_cast<int>(object.radiusPx());
}

void annotateObjects(cv::Mat& image, const std::vector<DetectedObject>& objects) {
    for (const auto& object : objects) {
        const cv::Point center = toPixel(object.center);
        cv::circle(image, center, drawRadius(object), Params::COLOR_OUTLINE, Params::OUTLINE_THICKNESS);
        cv::putText(image,
                    std::to_string(object.id),
                    center + cv::Point(Params::LABEL_OFFSET, Params::LABEL_OFFSET),
                    cv::FONT_HERSHEY_SIMPLEX,
                    Params::FONT_SCALE,
                    Params::COLOR_LABEL,
                    Params::FONT_THICKNESS);
    }
}

} // namespace

InspectionController::InspectionController(Display& display, ResultReporter& reporter)
    : display_(display),
      reporter_(reporter) {}

void InspectionController::load(const cv::Mat& image, std::vector<DetectedObject> objects) {
    objects_ = std::move(objects);

    if (image.empty()) {
        annotated_.release();
        lastShown_.release();
        return;
    }

    if (image.channels() == 1) {
        cv::cvtColor(image, annotated_, cv::COLOR_GRAY2BGR);
    } else {
        annotated_ = image.clone();
    }

    annotateObjects(annotated_, objects_);
    show(annotated_);
}

std::optional<DetectedObject> InspectionController::handlePointer(const cv::Point2f& point) {
    if (objects_.empty() || annotated_.empty()) {
        return std::nullopt;
    }

    auto selected = locator_.locate(point, objects_);
    if (!selected) {
        return std::nullopt;
    }

    reporter_.reportSelection(*selected);

    cv::Mat highlighted = annotated_.clone();
    cv::circle(highlighted, toPixel(selected->center), drawRadius(*selected),
               Params::COLOR_SELECTION, Params::SELECTION_THICKNESS);
    show(highlighted);

    return selected;
}

InspectionController::KeyAction InspectionController::waitForNavigation() {
    while (true) {
        const int key = display_.waitForKey();
        if (key < 0) {
            return KeyAction::Quit;
        }

        const KeyAction action = interpretKey(key);
        if (action != KeyAction::Ignore) {
            return action;
        }
    }
}

InspectionController::KeyAction InspectionController::interpretKey(int key) {
    switch (key) {
    case Params::KEY_NEXT:
        return KeyAction::Next;
    case Params::KEY_QUIT:
        return KeyAction::Quit;
    default:
        return KeyAction::Ignore;
    }
}

void InspectionController::show(const cv::Mat& image) {
    lastShown_ = image;
    display_.showImage(image);
}
