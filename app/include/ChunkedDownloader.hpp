#ifndef CHUNKED_DOWNLOADER_HPP
#define CHUNKED_DOWNLOADER_HPP

#include "CancellationToken.hpp"
#include "IHttpTransport.hpp"
#include "OutputSink.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Fixed parameters of a chunked download.
 */
struct DownloadOptions {
    std::string server_url;
    std::int64_t chunk_size{0};
    int max_retries{0};
    std::chrono::milliseconds retry_delay{0};
    HttpTimeouts timeouts;
};

/**
 * @brief Fetches a payload as a sequence of ranged GETs, one chunk at a time.
 *
 * Each chunk gets up to max_retries attempts over fresh connections, with a
 * fixed delay between attempts. A chunk that ends with an empty body or with
 * every attempt failed stops the transfer; the report tells the two apart.
 */
class ChunkedDownloader
{
public:
    using ProgressCallback = std::function<void(const DownloadProgress&)>;

    /**
     * @brief Constructs a downloader.
     * @param options Server URL, chunk size, retry budget, delay and timeouts.
     * @param transport Performs one ranged GET per attempt.
     * @param logger Destination for progress and retry messages; may be null.
     * @param cancellation Optional token checked between chunks and during waits.
     */
    ChunkedDownloader(DownloadOptions options,
                      std::shared_ptr<IHttpTransport> transport,
                      std::shared_ptr<spdlog::logger> logger,
                      std::shared_ptr<CancellationToken> cancellation = nullptr);

    /**
     * @brief Called after every appended chunk with the running totals.
     */
    void set_progress_callback(ProgressCallback callback);

    /**
     * @brief Downloads into memory.
     * @return Every byte received, in offset order; empty if nothing arrived.
     */
    ByteBuffer download_data();

    /**
     * @brief Downloads into a file, written chunk by chunk.
     * @return Number of bytes written.
     * @throws ErrorCodes::AppException when the file cannot be opened.
     */
    std::int64_t download_data(const std::string& file_path);

    /**
     * @brief Runs the chunk loop against any sink.
     */
    DownloadReport download_data(OutputSink& output);

    /**
     * @brief Requests bytes [start, end], retrying up to max_retries times.
     */
    ChunkResult download_chunk(std::int64_t start, std::int64_t end);

    /**
     * @brief Report of the most recent download_data() call.
     */
    const DownloadReport& last_report() const { return last_report_; }

private:
    enum class AttemptOutcome { Data, EmptyBody, BadStatus, TransportFailure };

    DownloadOptions options_;
    std::shared_ptr<IHttpTransport> transport_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<CancellationToken> cancellation_;
    ProgressCallback progress_callback_;
    DownloadReport last_report_;

    AttemptOutcome attempt_chunk(const ByteRange& range, int attempt, ByteBuffer& chunk);
    bool pause_before_retry();
    void report_progress(const DownloadProgress& progress) const;
    bool cancellation_requested() const;
};

#endif
