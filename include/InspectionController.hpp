#pragma once

#include "DetectedObject.hpp"
#include "Display.hpp"
#include "ObjectLocator.hpp"
#include "ResultReporter.hpp"

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

// State of the image currently on screen and the reactions to user input.
class InspectionController {
public:
    enum class KeyAction {
        Next,
        Quit,
        Ignore
    };

    struct Parameters {
        inline static const cv::Scalar COLOR_OUTLINE{0, 255, 0};
        inline static const cv::Scalar COLOR_LABEL{255, 0, 0};
        inline static const cv::Scalar COLOR_SELECTION{0, 0, 255};

        static constexpr int OUTLINE_THICKNESS = 1;
        static constexpr int SELECTION_THICKNESS = 2;
        static constexpr int LABEL_OFFSET = 5;
        static constexpr double FONT_SCALE = 0.5;
        static constexpr int FONT_THICKNESS = 1;

        static constexpr int KEY_NEXT = 'n';
        static constexpr int KEY_QUIT = 'q';
    };

    InspectionController(Display& display, ResultReporter& reporter);

    // Replaces the current image and objects, draws the annotations and shows them.
    void load(const cv::Mat& image, std::vector<DetectedObject> objects);

    // Reports and highlights the object under the point; a miss leaves the view unchanged.
    std::optional<DetectedObject> handlePointer(const cv::Point2f& point);

    // Waits until the user asks for the next image or to quit.
    KeyAction waitForNavigation();

    static KeyAction interpretKey(int key);

    const std::vector<DetectedObject>& objects() const { return objects_; }
    const cv::Mat& annotatedImage() const { return annotated_; }
    const cv::Mat& lastShownImage() const { return lastShown_; }

private:
    void show(const cv::Mat& image);

    Display& display_;
    ResultReporter& reporter_;
    ObjectLocator locator_;

    cv::Mat annotated_;
    cv::Mat lastShown_;
    std::vector<DetectedObject> objects_;
};
