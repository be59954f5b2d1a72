#pragma once

#include "Display.hpp"

#include <opencv2/opencv.hpp>
#include <string>

class HighGuiDisplay : public Display {
public:
    explicit HighGuiDisplay(const std::string& windowName = "image");
    ~HighGuiDisplay() override;

    HighGuiDisplay(const HighGuiDisplay&) = delete;
    HighGuiDisplay& operator=(const HighGuiDisplay&) = delete;

    void showImage(const cv::Mat& image) override;
    void setPointerHandler(PointerHandler handler) override;
    int waitForKey() override;

private:
    static void onMouse(int event, int x, int y, int flags, void* userdata);

    std::string windowName_;
    PointerHandler pointerHandler_;
};
