#include "core/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace lintel {

// Usable before init() so the library can report errors without setup
std::shared_ptr<spdlog::logger> Log::s_layoutLogger = Log::makeDefaultLogger("LAYOUT");
std::shared_ptr<spdlog::logger> Log::s_previewLogger = Log::makeDefaultLogger("PREVIEW");

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_layoutLogger = std::make_shared<spdlog::logger>("LAYOUT", sinks.begin(), sinks.end());
    s_previewLogger = std::make_shared<spdlog::logger>("PREVIEW", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_layoutLogger->set_level(spdLevel);
    s_previewLogger->set_level(spdLevel);

    spdlog::drop("LAYOUT");
    spdlog::drop("PREVIEW");
    spdlog::register_logger(s_layoutLogger);
    spdlog::register_logger(s_previewLogger);
}

void Log::shutdown() {
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Log::makeDefaultLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger>& Log::getLayoutLogger() {
    return s_layoutLogger;
}

std::shared_ptr<spdlog::logger>& Log::getPreviewLogger() {
    return s_previewLogger;
}

} // namespace lintel
