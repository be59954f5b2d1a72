#pragma once

#include "AppOptions.hpp"
#include "Display.hpp"
#include "ImageDirectory.hpp"
#include "ResultReporter.hpp"

#include <iostream>
#include <memory>
#include <string>

class AppController {
public:
    // A HighGUI window is opened when no display is supplied.
    explicit AppController(std::unique_ptr<Display> display = nullptr,
                           std::ostream& out = std::cout,
                           std::ostream& err = std::cerr);

    int run(int argc, const char* const* argv);

private:
    bool initialize(int argc, const char* const* argv, bool& exitEarly);
    void processImages();

    std::unique_ptr<Display> display_;
    std::ostream& out_;
    std::ostream& err_;
    ResultReporter reporter_;
    AppOptions options_;
    ImageDirectory directory_;
};
