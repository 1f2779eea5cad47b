#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace Cadence {

/**
 * @brief Logging wrapper around spdlog
 *
 * All library diagnostics go through a single "CADENCE" logger. Per-frame
 * evaluation code never logs; only configuration, decoding and setup paths do.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                           bool consoleOutput = true);

    /**
     * @brief Flush and drop the logger
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the library logger
     *
     * Falls back to a console logger if Initialize() has not been called.
     */
    static std::shared_ptr<spdlog::logger>& Get();

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace Cadence

#define CADENCE_LOG_TRACE(...)    ::Cadence::Logger::Get()->trace(__VA_ARGS__)
#define CADENCE_LOG_DEBUG(...)    ::Cadence::Logger::Get()->debug(__VA_ARGS__)
#define CADENCE_LOG_INFO(...)     ::Cadence::Logger::Get()->info(__VA_ARGS__)
#define CADENCE_LOG_WARN(...)     ::Cadence::Logger::Get()->warn(__VA_ARGS__)
#define CADENCE_LOG_ERROR(...)    ::Cadence::Logger::Get()->error(__VA_ARGS__)
#define CADENCE_LOG_CRITICAL(...) ::Cadence::Logger::Get()->critical(__VA_ARGS__)
