#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace Defaults {
constexpr std::int64_t KB = 1024;
constexpr std::int64_t MB = 1024 * KB;
constexpr const char* kServerUrl = "http://127.0.0.1:8080";
constexpr std::int64_t kChunkSize = 16 * MB;
constexpr std::int64_t kMaxChunkSize = std::numeric_limits<std::int64_t>::max() / 2;
constexpr int kMaxRetries = 5;
constexpr std::chrono::milliseconds kRetryDelay{500};
constexpr std::chrono::milliseconds kConnectTimeout{5000};
constexpr std::chrono::milliseconds kReadTimeout{5000};
constexpr std::int64_t kHashBlockSize = 8 * KB;
} // namespace Defaults


/**
 * @brief Download configuration. Values are layered: built-in defaults,
 * then an INI file, then RANGEFETCH_* environment variables, then the
 * command line. Every setter validates its input.
 */
class Settings
{
public:
    Settings();

    /**
     * @brief Reads the [download], [output] and [log] sections of an INI file.
     * @throws ErrorCodes::AppException CONFIG_LOAD_FAILED if the file cannot be read,
     * CONFIG_INVALID_VALUE for malformed values.
     */
    void load(const std::string& path);
    void apply(const IniConfig& config);

    /**
     * @brief Applies RANGEFETCH_SERVER_URL, RANGEFETCH_CHUNK_SIZE, RANGEFETCH_MAX_RETRIES,
     * RANGEFETCH_RETRY_DELAY_MS and RANGEFETCH_LOG_LEVEL when set.
     */
    void apply_environment();

    /**
     * @brief Writes the effective settings in the format load() reads.
     */
    bool save(const std::string& path) const;

    const std::string& get_server_url() const { return server_url; }
    void set_server_url(const std::string& url);

    std::int64_t get_chunk_size() const { return chunk_size; }
    void set_chunk_size(std::int64_t bytes);

    int get_max_retries() const { return max_retries; }
    void set_max_retries(int retries);

    std::chrono::milliseconds get_retry_delay() const { return retry_delay; }
    void set_retry_delay(std::chrono::milliseconds delay);

    HttpTimeouts get_timeouts() const { return timeouts; }
    void set_connect_timeout(std::chrono::milliseconds timeout);
    void set_read_timeout(std::chrono::milliseconds timeout);

    const std::string& get_output_file() const { return output_file; }
    void set_output_file(const std::string& path);
    bool writes_to_file() const { return !output_file.empty(); }

    const std::string& get_log_level() const { return log_level; }
    void set_log_level(const std::string& level);

    std::int64_t get_hash_block_size() const { return hash_block_size; }

    /**
     * @brief Parses "16777216", "64K" or "16M" (binary multiples).
     * @throws ErrorCodes::AppException CONFIG_INVALID_VALUE.
     */
    static std::int64_t parse_size(const std::string& value, const std::string& name);

    /**
     * @brief Parses an integer in [min_value, max_value].
     * @throws ErrorCodes::AppException CONFIG_INVALID_VALUE.
     */
    static std::int64_t parse_integer(const std::string& value, const std::string& name,
                                      std::int64_t min_value,
                                      std::int64_t max_value = std::numeric_limits<std::int64_t>::max());

    /**
     * @brief Parses an attempt count that fits in an int.
     * @throws ErrorCodes::AppException CONFIG_INVALID_VALUE.
     */
    static int parse_retry_count(const std::string& value, const std::string& name);

private:
    std::string server_url;
    std::int64_t chunk_size;
    int max_retries;
    std::chrono::milliseconds retry_delay;
    HttpTimeouts timeouts;
    std::string output_file;
    std::string log_level{"info"};
    std::int64_t hash_block_size;
};

#endif
