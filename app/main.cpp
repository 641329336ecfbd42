#include "AppException.hpp"
#include "ChunkedDownloader.hpp"
#include "CommandLine.hpp"
#include "CurlHttpTransport.hpp"
#include "DownloadRunner.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>


namespace {

using DownloadRunner::kExitFailure;
using DownloadRunner::kExitOk;

CancellationToken* g_cancellation = nullptr;

void handle_stop_signal(int)
{
    if (g_cancellation) {
        g_cancellation->request_cancel_from_signal();
    }
}

bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

class CurlGlobalGuard {
public:
    CurlGlobalGuard()
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_INIT_FAILED, "curl_global_init failed");
        }
    }
    ~CurlGlobalGuard() { curl_global_cleanup(); }

    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

Settings resolve_settings(const ParsedArguments& args)
{
    Settings settings;
    if (args.config_path) {
        settings.load(*args.config_path);
    }
    settings.apply_environment();
    CommandLine::apply(args, settings);
    return settings;
}

DownloadOptions to_download_options(const Settings& settings)
{
    DownloadOptions options;
    options.server_url = settings.get_server_url();
    options.chunk_size = settings.get_chunk_size();
    options.max_retries = settings.get_max_retries();
    options.retry_delay = settings.get_retry_delay();
    options.timeouts = settings.get_timeouts();
    return options;
}

} // namespace


int main(int argc, char** argv)
{
    if (!initialize_loggers()) {
        return kExitFailure;
    }
    auto logger = Logger::get_logger("core_logger");
    auto cancellation = std::make_shared<CancellationToken>();

    try {
        const ParsedArguments args = CommandLine::parse(argc, argv);
        if (args.show_help) {
            std::cout << CommandLine::usage(argc > 0 ? argv[0] : "rangefetch");
            return kExitOk;
        }

        const Settings settings = resolve_settings(args);
        Logger::set_level(Logger::parse_level(settings.get_log_level()));
        if (args.save_config_path && !settings.save(*args.save_config_path)) {
            return kExitFailure;
        }

        logger->debug("Server {} | chunk {} bytes | {} attempts per chunk | {} ms delay",
                      settings.get_server_url(), settings.get_chunk_size(),
                      settings.get_max_retries(), settings.get_retry_delay().count());

        CurlGlobalGuard curl_guard;
        g_cancellation = cancellation.get();
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);

        ChunkedDownloader downloader(to_download_options(settings),
                                     std::make_shared<CurlHttpTransport>(),
                                     logger,
                                     cancellation);

        if (settings.writes_to_file()) {
            return DownloadRunner::run_file_download(downloader,
                                                     settings.get_output_file(),
                                                     static_cast<std::size_t>(settings.get_hash_block_size()),
                                                     logger);
        }
        return DownloadRunner::run_memory_download(downloader, logger);
    } catch (const ErrorCodes::AppException& ex) {
        logger->error("{}", ex.get_full_details());
        return kExitFailure;
    } catch (const std::exception& ex) {
        logger->critical("Unhandled error: {}", ex.what());
        return kExitFailure;
    }
}
