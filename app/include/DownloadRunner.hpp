#ifndef DOWNLOAD_RUNNER_HPP
#define DOWNLOAD_RUNNER_HPP

#include "ChunkedDownloader.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Runs one download to completion and reports the outcome to the user.
 */
namespace DownloadRunner {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInterrupted = 130;

/**
 * @brief Downloads into memory and logs the SHA-256 of whatever arrived.
 * @return kExitInterrupted if the download was cancelled, kExitOk otherwise.
 */
int run_memory_download(ChunkedDownloader& downloader, const std::shared_ptr<spdlog::logger>& logger);

/**
 * @brief Downloads into @p path, then hashes the file in @p hash_block_size blocks.
 * @return kExitInterrupted if the download was cancelled, kExitOk otherwise.
 * @throws ErrorCodes::AppException when the file cannot be written or read back.
 */
int run_file_download(ChunkedDownloader& downloader,
                      const std::string& path,
                      std::size_t hash_block_size,
                      const std::shared_ptr<spdlog::logger>& logger);

} // namespace DownloadRunner

#endif
