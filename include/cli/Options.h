#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"

namespace unihir::cli {

    enum class HirLogMode {
        None,
        Before,
        After,
        Both
    };

    struct Options {
        bool showHelp{false};
        bool debug{false};            // --debug
        bool listPatterns{false};     // --patterns
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        std::string visualizeFile{};  // --visualize=<file.py|file.c|file.h>
        std::string outputFile{};     // -o <file>; stdout when empty
        std::vector<std::string> inputs{};
        std::string pythonFile{};     // the .py input
        std::string cFile{};          // the .c/.h input
        std::vector<std::string> breakpoints{}; // --break=<spec>, validated
        ColorMode color{ColorMode::Auto};
        int diagContext{1};
        HirLogMode hirLog{HirLogMode::None};
        std::string logPath{"."};     // --log-path=<dir> (defaults to ./)
        bool logHir{false};           // --log-hir (file logging; not to stdout)
    };

} // namespace unihir::cli
