#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

/**
 * @brief Process-wide spdlog setup. Called once by the entry point.
 */
class Logger
{
public:
    /**
     * @brief Registers core_logger and net_logger with console and rotating file sinks.
     * @param level Initial level for every registered logger.
     * @throws spdlog::spdlog_ex when a sink cannot be created.
     */
    static void setup_loggers(spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Returns a registered logger, or nullptr before setup.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * @brief Applies a level to every registered logger.
     */
    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Directory that receives the rotating log file.
     */
    static std::string get_log_directory();

    /**
     * @brief Parses "trace", "debug", "info", "warn", "error" or "critical".
     * @return The parsed level, or spdlog::level::info for unknown names.
     */
    static spdlog::level::level_enum parse_level(const std::string& name);
};

#endif
