#include "preview/Preview.hpp"
#include "preview/Scene.hpp"
#include "core/Log.hpp"

#include <ostream>
#include <string>

namespace lintel {

static void printUsage(std::ostream& err, const char* argv0) {
    err << "usage: " << argv0 << " <scene.json> [--log-level LEVEL] [--log-file PATH]\n";
}

int runPreview(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    const char* argv0 = argc > 0 ? argv[0] : "lintel_preview";
    std::string scenePath;
    std::string logLevel = "warn";
    std::string logFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            logFile = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(err, argv0);
            return 0;
        } else if (scenePath.empty() && !arg.starts_with("-")) {
            scenePath = arg;
        } else {
            printUsage(err, argv0);
            return 1;
        }
    }

    if (scenePath.empty()) {
        printUsage(err, argv0);
        return 1;
    }

    // The file sink opens eagerly; on failure the previous loggers stay in place
    try {
        Log::init(logFile, logLevel);
    } catch (const spdlog::spdlog_ex& e) {
        err << argv0 << ": cannot open log file '" << logFile << "': " << e.what() << '\n';
        return 1;
    }

    auto scene = Scene::loadFromFile(scenePath);
    if (!scene) {
        Log::shutdown();
        return 1;
    }

    PREVIEW_LOG_INFO("Running {} layout on {} children", layoutKindName(scene->layout),
                     scene->children.size());

    auto result = runScene(*scene);
    if (!result) {
        PREVIEW_LOG_ERROR("Layout failed for '{}'", scenePath);
        Log::shutdown();
        return 1;
    }

    out << result->toJson().dump(2) << '\n';

    Log::shutdown();
    return 0;
}

} // namespace lintel
