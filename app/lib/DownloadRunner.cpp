#include "DownloadRunner.hpp"

#include "AppException.hpp"
#include "Digest.hpp"

#include <spdlog/spdlog.h>

namespace {

void report_digest(const std::shared_ptr<spdlog::logger>& logger, const std::string& hash)
{
    logger->info("SHA-256 hash: {}", hash);
    logger->info("Check if this hash matches the one displayed by the server");
}

void warn_catalog(const std::shared_ptr<spdlog::logger>& logger, ErrorCodes::Code code)
{
    const auto info = ErrorCodes::ErrorCatalog::get_error_info(code);
    logger->warn("{} {}", info.message, info.resolution);
}

void warn_if_incomplete(const std::shared_ptr<spdlog::logger>& logger, const DownloadReport& report)
{
    if (report.termination == DownloadTermination::RetriesExhausted) {
        warn_catalog(logger, ErrorCodes::Code::DOWNLOAD_INCOMPLETE);
    } else if (report.termination == DownloadTermination::Interrupted) {
        warn_catalog(logger, ErrorCodes::Code::DOWNLOAD_INTERRUPTED);
    }
}

int exit_code_for(const DownloadReport& report)
{
    return report.termination == DownloadTermination::Interrupted
        ? DownloadRunner::kExitInterrupted
        : DownloadRunner::kExitOk;
}

} // namespace

namespace DownloadRunner {

int run_memory_download(ChunkedDownloader& downloader, const std::shared_ptr<spdlog::logger>& logger)
{
    const ByteBuffer data = downloader.download_data();
    const DownloadReport& report = downloader.last_report();
    if (data.empty()) {
        return exit_code_for(report);
    }
    warn_if_incomplete(logger, report);
    report_digest(logger, Digest::sha256_hex(data));
    return exit_code_for(report);
}


int run_file_download(ChunkedDownloader& downloader,
                      const std::string& path,
                      std::size_t hash_block_size,
                      const std::shared_ptr<spdlog::logger>& logger)
{
    const std::int64_t length = downloader.download_data(path);
    const DownloadReport& report = downloader.last_report();
    if (length <= 0) {
        logger->warn("Download failed, no data received");
        return exit_code_for(report);
    }
    logger->info("Download complete, {} bytes received", length);
    warn_if_incomplete(logger, report);
    report_digest(logger, Digest::sha256_file_hex(path, hash_block_size));
    return exit_code_for(report);
}

} // namespace DownloadRunner
