#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Cadence {

namespace {
constexpr const char* kLoggerName = "CADENCE";
}

std::shared_ptr<spdlog::logger> Logger::s_logger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    // Replace the fallback logger created by an early Get()
    if (s_logger) {
        spdlog::drop(kLoggerName);
        s_logger.reset();
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    s_logger->set_level(spdlog::level::trace);
    s_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_logger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_logger) {
        return;
    }

    s_logger->flush();
    spdlog::drop(kLoggerName);
    s_logger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    Get()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!s_logger) {
        s_logger = spdlog::get(kLoggerName);
        if (!s_logger) {
            s_logger = spdlog::stdout_color_mt(kLoggerName);
            s_logger->set_pattern("%^[%T] [%n] [%l]%$ %v");
            s_logger->set_level(spdlog::level::info);
        }
    }
    return s_logger;
}

} // namespace Cadence
