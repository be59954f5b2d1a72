#include "HighGuiDisplay.hpp"

#include <utility>

HighGuiDisplay::HighGuiDisplay(const std::string& windowName)
    : windowName_(windowName) {
    cv::namedWindow(windowName_, cv::WINDOW_NORMAL);
    cv::setMouseCallback(windowName_, &HighGuiDisplay::onMouse, this);
}

HighGuiDisplay::~HighGuiDisplay() {
    cv::destroyWindow(windowName_);
}

void HighGuiDisplay::showImage(const cv::Mat& image) {
    if (image.empty()) {
        return;
    }
    cv::imshow(windowName_, image);
}

void HighGuiDisplay::setPointerHandler(PointerHandler handler) {
    pointerHandler_ = std::move(handler);
}

int HighGuiDisplay::waitForKey() {
    const int key = cv::waitKey(0);
    if (key < 0) {
        return key;
    }
    return key & 0xFF;
}

void HighGuiDisplay::onMouse(int event, int x, int y, int /*flags*/, void* userdata) {
    if (event != cv::EVENT_LBUTTONDOWN || userdata == nullptr) {
        return;
    }

    auto* display = static_cast<HighGuiDisplay*>(userdata);
    if (display->pointerHandler_) {
        display->pointerHandler_(cv::Point(x, y));
    }
}
