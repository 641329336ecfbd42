#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <optional>
#include <string>

class Settings;

struct ParsedArguments {
    bool show_help{false};
    bool verbose{false};
    std::optional<std::string> config_path;
    std::optional<std::string> save_config_path;
    std::optional<std::string> server_url;
    std::optional<std::string> output_file;
    std::optional<std::string> chunk_size;
    std::optional<std::string> max_retries;
    std::optional<std::string> retry_delay_ms;
};

namespace CommandLine {

/**
 * @brief Parses "--flag value" and "--flag=value" forms.
 * @throws ErrorCodes::AppException CONFIG_INVALID for unknown flags or missing values.
 */
ParsedArguments parse(int argc, char** argv);

/**
 * @brief Applies the parsed overrides on top of settings.
 * @throws ErrorCodes::AppException CONFIG_INVALID_VALUE for malformed values.
 */
void apply(const ParsedArguments& args, Settings& settings);

std::string usage(const std::string& program_name);

} // namespace CommandLine

#endif
