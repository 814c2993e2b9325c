#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace lintel {

class Log {
public:
    /// Create the LAYOUT and PREVIEW loggers (console sink plus an optional file sink).
    /// Safe to call again; earlier loggers are replaced.
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    /// Before init() these are warn-level console loggers
    static std::shared_ptr<spdlog::logger>& getLayoutLogger();
    static std::shared_ptr<spdlog::logger>& getPreviewLogger();

    /// Map "trace".."critical" to an spdlog level (unknown names map to info)
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> makeDefaultLogger(const std::string& name);

    static std::shared_ptr<spdlog::logger> s_layoutLogger;
    static std::shared_ptr<spdlog::logger> s_previewLogger;
};

} // namespace lintel

// Layout library logging macros
#define LOG_TRACE(...)    ::lintel::Log::getLayoutLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::lintel::Log::getLayoutLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::lintel::Log::getLayoutLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::lintel::Log::getLayoutLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::lintel::Log::getLayoutLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::lintel::Log::getLayoutLogger()->critical(__VA_ARGS__)

// Preview tool logging macros
#define PREVIEW_LOG_TRACE(...)    ::lintel::Log::getPreviewLogger()->trace(__VA_ARGS__)
#define PREVIEW_LOG_DEBUG(...)    ::lintel::Log::getPreviewLogger()->debug(__VA_ARGS__)
#define PREVIEW_LOG_INFO(...)     ::lintel::Log::getPreviewLogger()->info(__VA_ARGS__)
#define PREVIEW_LOG_WARN(...)     ::lintel::Log::getPreviewLogger()->warn(__VA_ARGS__)
#define PREVIEW_LOG_ERROR(...)    ::lintel::Log::getPreviewLogger()->error(__VA_ARGS__)
#define PREVIEW_LOG_CRITICAL(...) ::lintel::Log::getPreviewLogger()->critical(__VA_ARGS__)
