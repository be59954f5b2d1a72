#include "AppController.hpp"

#include "HighGuiDisplay.hpp"
#include "InspectionController.hpp"
#include "MeasurementPipeline.hpp"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

AppController::AppController(std::unique_ptr<Display> display, std::ostream& out, std::ostream& err)
    : display_(std::move(display)),
      out_(out),
      err_(err),
      reporter_(out, err) {}

int AppController::run(int argc, const char* const* argv) {
    bool exitEarly = false;
    if (!initialize(argc, argv, exitEarly)) {
        err_ << "Initialization failed." << std::endl;
        return 1;
    }
    if (exitEarly) {
        return 0;
    }

    processImages();
    return 0;
}

bool AppController::initialize(int argc, const char* const* argv, bool& exitEarly) {
    const std::string programName = argc > 0 ? fs::path(argv[0]).filename().string() : "coin_measure";

    std::string error;
    if (!parseAppOptions(argc, argv, options_, error)) {
        err_ << error << "\n" << appUsage(programName);
        return false;
    }

    if (options_.showHelp) {
        out_ << appUsage(programName);
        exitEarly = true;
        return true;
    }

    if (!directory_.open(options_.inputDir)) {
        return false;
    }

    if (!display_) {
        display_ = std::make_unique<HighGuiDisplay>();
    }

    return true;
}

void AppController::processImages() {
    MeasurementPipeline::Config pipelineConfig;
    pipelineConfig.scaleFactor = options_.scale;
    const MeasurementPipeline pipeline(pipelineConfig);

    InspectionController inspection(*display_, reporter_);
    display_->setPointerHandler([&inspection](const cv::Point& point) {
        inspection.handlePointer(point);
    });

    for (const auto& imagePath : directory_.files()) {
        MeasurementPipeline::Result result = pipeline.process(imagePath);
        if (!result.success) {
            reporter_.reportSkipped(imagePath);
            continue;
        }

        inspection.load(result.image, std::move(result.objects));
        reporter_.reportImage(fs::path(imagePath).filename().string(), inspection.objects());

        if (inspection.waitForNavigation() == InspectionController::KeyAction::Quit) {
            break;
        }
    }

    display_->setPointerHandler(nullptr);
}
