#include "CommandLine.hpp"
#include "AppException.hpp"
#include "Settings.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstring>
#include <string_view>

namespace {

struct ValueOption {
    const char* flag;
    std::optional<std::string> ParsedArguments::*member;
};

constexpr ValueOption kValueOptions[] = {
    {"--config", &ParsedArguments::config_path},
    {"--save-config", &ParsedArguments::save_config_path},
    {"--url", &ParsedArguments::server_url},
    {"--output", &ParsedArguments::output_file},
    {"--chunk-size", &ParsedArguments::chunk_size},
    {"--max-retries", &ParsedArguments::max_retries},
    {"--retry-delay-ms", &ParsedArguments::retry_delay_ms},
};

const ValueOption* find_value_option(std::string_view flag)
{
    for (const auto& option : kValueOptions) {
        if (flag == option.flag) {
            return &option;
        }
    }
    return nullptr;
}

} // namespace

namespace CommandLine {

ParsedArguments parse(int argc, char** argv)
{
    ParsedArguments parsed;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            parsed.verbose = true;
            continue;
        }

        std::string_view flag = arg;
        std::optional<std::string> inline_value;
        if (const auto eq = arg.find('='); eq != std::string_view::npos) {
            flag = arg.substr(0, eq);
            inline_value = std::string(arg.substr(eq + 1));
        }

        const ValueOption* option = find_value_option(flag);
        if (!option) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                                fmt::format("Unknown option: {}", arg),
                                "Run with --help for the list of options");
        }

        if (inline_value) {
            parsed.*(option->member) = std::move(*inline_value);
        } else if (i + 1 < argc) {
            parsed.*(option->member) = std::string(argv[++i]);
        } else {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                                fmt::format("Option {} requires a value", flag),
                                "Run with --help for the list of options");
        }
    }
    return parsed;
}


void apply(const ParsedArguments& args, Settings& settings)
{
    if (args.server_url) {
        settings.set_server_url(*args.server_url);
    }
    if (args.output_file) {
        settings.set_output_file(*args.output_file);
    }
    if (args.chunk_size) {
        settings.set_chunk_size(Settings::parse_size(*args.chunk_size, "--chunk-size"));
    }
    if (args.max_retries) {
        settings.set_max_retries(Settings::parse_retry_count(*args.max_retries, "--max-retries"));
    }
    if (args.retry_delay_ms) {
        settings.set_retry_delay(
            std::chrono::milliseconds(Settings::parse_integer(*args.retry_delay_ms, "--retry-delay-ms", 0)));
    }
    if (args.verbose) {
        settings.set_log_level("debug");
    }
}


std::string usage(const std::string& program_name)
{
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Downloads a payload from an unreliable HTTP server in ranged chunks and\n"
        "prints its SHA-256 digest.\n"
        "\n"
        "Options:\n"
        "  --url <url>             Server URL (default {})\n"
        "  --output <file>         Write the payload to a file instead of memory\n"
        "  --chunk-size <size>     Bytes per range request, K/M suffixes allowed (default 16M)\n"
        "  --max-retries <n>       Attempts per chunk (default {})\n"
        "  --retry-delay-ms <ms>   Fixed delay between attempts (default {})\n"
        "  --config <file>         Read settings from an INI file\n"
        "  --save-config <file>    Write the effective settings to an INI file\n"
        "  -v, --verbose           Debug logging\n"
        "  -h, --help              Show this help\n",
        program_name, Defaults::kServerUrl, Defaults::kMaxRetries, Defaults::kRetryDelay.count());
}

} // namespace CommandLine
