#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {

constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names()
{
    static const std::vector<std::string> names = {"core_logger", "net_logger"};
    return names;
}

std::vector<spdlog::sink_ptr> build_sinks()
{
    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kLogPattern);
    sinks.push_back(console_sink);

    std::error_code ec;
    const std::filesystem::path log_dir = Logger::get_log_directory();
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        spdlog::warn("Log directory '{}' unavailable ({}); logging to console only",
                     log_dir.string(), ec.message());
        return sinks;
    }

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir / "rangefetch.log").string(), kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_pattern(kLogPattern);
    sinks.push_back(file_sink);
    return sinks;
}

} // namespace


void Logger::setup_loggers(spdlog::level::level_enum level)
{
    const auto sinks = build_sinks();
    for (const auto& name : logger_names()) {
        if (auto existing = spdlog::get(name)) {
            existing->set_level(level);
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_level(spdlog::level::level_enum level)
{
    for (const auto& name : logger_names()) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}


std::string Logger::get_log_directory()
{
    if (const char* xdg_cache = std::getenv("XDG_CACHE_HOME"); xdg_cache && xdg_cache[0] != '\0') {
        return (std::filesystem::path(xdg_cache) / "rangefetch" / "logs").string();
    }
    if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        return (std::filesystem::path(home) / ".cache" / "rangefetch" / "logs").string();
    }
    return (std::filesystem::temp_directory_path() / "rangefetch" / "logs").string();
}


spdlog::level::level_enum Logger::parse_level(const std::string& name)
{
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}
