#pragma once

#include <opencv2/opencv.hpp>
#include <functional>

// Window capabilities the interactive viewer relies on.
class Display {
public:
    using PointerHandler = std::function<void(const cv::Point&)>;

    virtual ~Display() = default;

    virtual void showImage(const cv::Mat& image) = 0;
    virtual void setPointerHandler(PointerHandler handler) = 0;

    // Blocks until a key is pressed. Returns the key code, or a negative value
    // when no key can arrive any more (e.g. the window is gone).
    virtual int waitForKey() = 0;
};
