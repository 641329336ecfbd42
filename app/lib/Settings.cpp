#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

[[noreturn]] void throw_invalid(const std::string& name, const std::string& value, const std::string& why)
{
    THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("Invalid value '{}' for {}: {}", value, name, why),
                        name);
}

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

const char* env_or_null(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return nullptr;
    }
    return value;
}

bool is_known_log_level(const std::string& level)
{
    static const std::array<const char*, 7> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical"};
    return std::any_of(levels.begin(), levels.end(),
                       [&level](const char* known) { return level == known; });
}
}


Settings::Settings()
    : server_url(Defaults::kServerUrl),
      chunk_size(Defaults::kChunkSize),
      max_retries(Defaults::kMaxRetries),
      retry_delay(Defaults::kRetryDelay),
      timeouts{Defaults::kConnectTimeout, Defaults::kReadTimeout},
      hash_block_size(Defaults::kHashBlockSize)
{
}


void Settings::load(const std::string& path)
{
    IniConfig config;
    if (!config.load(path)) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_LOAD_FAILED, "Config file: " + path);
    }
    apply(config);
    settings_log(spdlog::level::debug, "Applied settings from {}", path);
}


void Settings::apply(const IniConfig& config)
{
    if (auto value = config.findValue("download", "server_url")) {
        set_server_url(*value);
    }
    if (auto value = config.findValue("download", "chunk_size")) {
        set_chunk_size(parse_size(*value, "download.chunk_size"));
    }
    if (auto value = config.findValue("download", "max_retries")) {
        set_max_retries(parse_retry_count(*value, "download.max_retries"));
    }
    if (auto value = config.findValue("download", "retry_delay_ms")) {
        set_retry_delay(std::chrono::milliseconds(parse_integer(*value, "download.retry_delay_ms", 0)));
    }
    if (auto value = config.findValue("download", "connect_timeout_ms")) {
        set_connect_timeout(std::chrono::milliseconds(parse_integer(*value, "download.connect_timeout_ms", 1)));
    }
    if (auto value = config.findValue("download", "read_timeout_ms")) {
        set_read_timeout(std::chrono::milliseconds(parse_integer(*value, "download.read_timeout_ms", 1)));
    }
    if (auto value = config.findValue("output", "file")) {
        set_output_file(*value);
    }
    if (auto value = config.findValue("log", "level")) {
        set_log_level(*value);
    }
}


void Settings::apply_environment()
{
    if (const char* value = env_or_null("RANGEFETCH_SERVER_URL")) {
        set_server_url(value);
    }
    if (const char* value = env_or_null("RANGEFETCH_CHUNK_SIZE")) {
        set_chunk_size(parse_size(value, "RANGEFETCH_CHUNK_SIZE"));
    }
    if (const char* value = env_or_null("RANGEFETCH_MAX_RETRIES")) {
        set_max_retries(parse_retry_count(value, "RANGEFETCH_MAX_RETRIES"));
    }
    if (const char* value = env_or_null("RANGEFETCH_RETRY_DELAY_MS")) {
        set_retry_delay(std::chrono::milliseconds(parse_integer(value, "RANGEFETCH_RETRY_DELAY_MS", 0)));
    }
    if (const char* value = env_or_null("RANGEFETCH_LOG_LEVEL")) {
        set_log_level(value);
    }
}


bool Settings::save(const std::string& path) const
{
    IniConfig config;
    config.setValue("download", "server_url", server_url);
    config.setValue("download", "chunk_size", std::to_string(chunk_size));
    config.setValue("download", "max_retries", std::to_string(max_retries));
    config.setValue("download", "retry_delay_ms", std::to_string(retry_delay.count()));
    config.setValue("download", "connect_timeout_ms", std::to_string(timeouts.connect.count()));
    config.setValue("download", "read_timeout_ms", std::to_string(timeouts.read.count()));
    if (!output_file.empty()) {
        config.setValue("output", "file", output_file);
    }
    config.setValue("log", "level", log_level);

    if (!config.save(path)) {
        settings_log(spdlog::level::err, "Failed to save settings to {}", path);
        return false;
    }
    return true;
}


void Settings::set_server_url(const std::string& url)
{
    const std::string lowered = to_lower_copy(url);
    std::string::size_type host_start = std::string::npos;
    if (lowered.rfind("http://", 0) == 0) {
        host_start = 7;
    } else if (lowered.rfind("https://", 0) == 0) {
        host_start = 8;
    }
    if (host_start == std::string::npos) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_INVALID_URL,
                            "Server URL must start with http:// or https://",
                            "URL: " + url);
    }
    if (host_start >= url.size() || url[host_start] == '/' || url[host_start] == ':') {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_INVALID_URL,
                            "Server URL has no host",
                            "URL: " + url);
    }
    server_url = url;
}


void Settings::set_chunk_size(std::int64_t bytes)
{
    if (bytes < 1) {
        throw_invalid("chunk_size", std::to_string(bytes), "must be at least 1 byte");
    }
    if (bytes > Defaults::kMaxChunkSize) {
        throw_invalid("chunk_size", std::to_string(bytes),
                      fmt::format("must not exceed {} bytes", Defaults::kMaxChunkSize));
    }
    chunk_size = bytes;
}


void Settings::set_max_retries(int retries)
{
    if (retries < 1) {
        throw_invalid("max_retries", std::to_string(retries), "at least one attempt is required");
    }
    max_retries = retries;
}


void Settings::set_retry_delay(std::chrono::milliseconds delay)
{
    if (delay.count() < 0) {
        throw_invalid("retry_delay_ms", std::to_string(delay.count()), "must not be negative");
    }
    retry_delay = delay;
}


void Settings::set_connect_timeout(std::chrono::milliseconds timeout)
{
    if (timeout.count() < 1) {
        throw_invalid("connect_timeout_ms", std::to_string(timeout.count()), "must be positive");
    }
    timeouts.connect = timeout;
}


void Settings::set_read_timeout(std::chrono::milliseconds timeout)
{
    if (timeout.count() < 1) {
        throw_invalid("read_timeout_ms", std::to_string(timeout.count()), "must be positive");
    }
    timeouts.read = timeout;
}


void Settings::set_output_file(const std::string& path)
{
    output_file = path;
}


void Settings::set_log_level(const std::string& level)
{
    const std::string lowered = to_lower_copy(level);
    if (!is_known_log_level(lowered)) {
        throw_invalid("log.level", level, "expected trace, debug, info, warn, error or critical");
    }
    log_level = lowered;
}


std::int64_t Settings::parse_integer(const std::string& value, const std::string& name,
                                     std::int64_t min_value, std::int64_t max_value)
{
    std::int64_t parsed = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (value.empty() || ec != std::errc() || ptr != last) {
        throw_invalid(name, value, "not an integer");
    }
    if (parsed < min_value) {
        throw_invalid(name, value, fmt::format("must be at least {}", min_value));
    }
    if (parsed > max_value) {
        throw_invalid(name, value, fmt::format("must not exceed {}", max_value));
    }
    return parsed;
}


int Settings::parse_retry_count(const std::string& value, const std::string& name)
{
    return static_cast<int>(parse_integer(value, name, 1, std::numeric_limits<int>::max()));
}


std::int64_t Settings::parse_size(const std::string& value, const std::string& name)
{
    if (value.empty()) {
        throw_invalid(name, value, "empty size");
    }

    std::int64_t multiplier = 1;
    std::string digits = value;
    const char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(value.back())));
    if (suffix == 'K') {
        multiplier = Defaults::KB;
        digits.pop_back();
    } else if (suffix == 'M') {
        multiplier = Defaults::MB;
        digits.pop_back();
    }

    const std::int64_t base = parse_integer(digits, name, 1);
    if (base > std::numeric_limits<std::int64_t>::max() / multiplier) {
        throw_invalid(name, value, "size overflows");
    }
    return base * multiplier;
}
