#include "ChunkedDownloader.hpp"
#include "AppException.hpp"
#include "HttpRange.hpp"
#include "Settings.hpp"
#include "TestHooks.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <thread>
#include <utility>

namespace {

TestHooks::RetryWaitOverride& retry_wait_override_slot() {
    static TestHooks::RetryWaitOverride hook;
    return hook;
}

} // namespace

namespace TestHooks {

void set_retry_wait_override(RetryWaitOverride hook) {
    retry_wait_override_slot() = std::move(hook);
}

void reset_retry_wait_override() {
    retry_wait_override_slot() = RetryWaitOverride{};
}

} // namespace TestHooks


ChunkedDownloader::ChunkedDownloader(DownloadOptions options,
                                     std::shared_ptr<IHttpTransport> transport,
                                     std::shared_ptr<spdlog::logger> logger,
                                     std::shared_ptr<CancellationToken> cancellation)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      logger_(std::move(logger)),
      cancellation_(std::move(cancellation))
{
    if (!transport_) {
        throw std::invalid_argument("ChunkedDownloader requires a transport");
    }
    if (options_.chunk_size < 1 || options_.chunk_size > Defaults::kMaxChunkSize) {
        throw std::invalid_argument("ChunkedDownloader chunk size must be in [1, kMaxChunkSize]");
    }
    if (options_.max_retries < 1) {
        throw std::invalid_argument("ChunkedDownloader needs at least one attempt per chunk");
    }
}


void ChunkedDownloader::set_progress_callback(ProgressCallback callback)
{
    progress_callback_ = std::move(callback);
}


ByteBuffer ChunkedDownloader::download_data()
{
    MemorySink output;
    download_data(output);
    if (logger_) {
        logger_->info("Download finished, total size: {} bytes", output.size());
    }
    return output.release();
}


std::int64_t ChunkedDownloader::download_data(const std::string& file_path)
{
    FileSink output(file_path);
    const DownloadReport report = download_data(output);
    output.close();
    return report.bytes_written;
}


DownloadReport ChunkedDownloader::download_data(OutputSink& output)
{
    DownloadProgress progress;
    DownloadTermination termination = DownloadTermination::Completed;
    if (logger_) {
        logger_->debug("Starting download...");
    }

    while (true) {
        if (cancellation_requested()) {
            if (logger_) {
                logger_->warn("Download was interrupted after {} bytes", progress.total_bytes);
            }
            termination = DownloadTermination::Interrupted;
            break;
        }

        bool retry_after_delay = false;
        try {
            const ByteRange range = ByteRange::from_offset(progress.total_bytes, options_.chunk_size);
            if (logger_) {
                logger_->debug("Requesting chunk: bytes={}-{}", range.start, range.end);
            }

            ChunkResult chunk = download_chunk(range.start, range.end);
            if (chunk.empty()) {
                if (chunk.status == ChunkStatus::Exhausted) {
                    termination = DownloadTermination::RetriesExhausted;
                }
                if (logger_) {
                    logger_->info("Download complete");
                }
                break;
            }

            output.write(chunk.bytes);
            progress.total_bytes += static_cast<std::int64_t>(chunk.bytes.size());
            ++progress.chunk_count;
            report_progress(progress);
        } catch (const DownloadInterrupted& e) {
            if (logger_) {
                logger_->warn("Download was interrupted: {}", e.what());
            }
            termination = DownloadTermination::Interrupted;
            break;
        } catch (const ErrorCodes::AppException& e) {
            if (!e.is_io_error()) {
                throw;
            }
            if (logger_) {
                logger_->warn("I/O error during download: {} ({})", e.what(), e.get_error_info().context);
            }
            retry_after_delay = true;
        } catch (const std::logic_error& e) {
            if (logger_) {
                logger_->critical("Client state error: {}", e.what());
            }
            retry_after_delay = true;
        }

        if (retry_after_delay) {
            if (logger_) {
                logger_->info("Retrying in {}ms...", options_.retry_delay.count());
            }
            if (pause_before_retry()) {
                if (logger_) {
                    logger_->warn("Download was interrupted while waiting to retry");
                }
                termination = DownloadTermination::Interrupted;
                break;
            }
        }
    }

    last_report_ = DownloadReport{progress.total_bytes, progress.chunk_count, termination};
    return last_report_;
}


ChunkResult ChunkedDownloader::download_chunk(std::int64_t start, std::int64_t end)
{
    const ByteRange range{start, end};
    ChunkStatus failure = ChunkStatus::EndOfStream;

    for (int attempt = 1; attempt <= options_.max_retries; ++attempt) {
        ByteBuffer chunk;
        const AttemptOutcome outcome = attempt_chunk(range, attempt, chunk);
        if (outcome == AttemptOutcome::Data) {
            return ChunkResult::data(std::move(chunk), attempt);
        }

        failure = (outcome == AttemptOutcome::EmptyBody) ? ChunkStatus::EndOfStream
                                                         : ChunkStatus::Exhausted;
        if (attempt < options_.max_retries && pause_before_retry()) {
            throw DownloadInterrupted(
                fmt::format("cancelled while retrying bytes={}-{}", range.start, range.end));
        }
    }

    if (logger_) {
        logger_->error("Failed to download chunk after {} attempts", options_.max_retries);
    }
    return failure == ChunkStatus::EndOfStream ? ChunkResult::end_of_stream(options_.max_retries)
                                               : ChunkResult::exhausted(options_.max_retries);
}


ChunkedDownloader::AttemptOutcome
ChunkedDownloader::attempt_chunk(const ByteRange& range, int attempt, ByteBuffer& chunk)
{
    HttpResponse response;
    try {
        response = transport_->get_range(options_.server_url, range, options_.timeouts);
    } catch (const TransportError& e) {
        if (logger_) {
            if (e.timed_out()) {
                logger_->warn("Connection timed out (attempt {}/{}): {}",
                              attempt, options_.max_retries, e.what());
            } else {
                logger_->warn("Network error (attempt {}/{}): {}",
                              attempt, options_.max_retries, e.what());
            }
        }
        return AttemptOutcome::TransportFailure;
    }

    if (!HttpRange::is_success_status(response.status_code)) {
        if (logger_) {
            logger_->warn("Error: {}-{}", response.status_code, response.reason);
        }
        return AttemptOutcome::BadStatus;
    }

    if (response.body.empty()) {
        if (logger_) {
            logger_->warn("Got empty response, retrying...");
        }
        return AttemptOutcome::EmptyBody;
    }

    if (logger_) {
        logger_->debug("Downloaded {} bytes (server total {})",
                       response.body.size(), response.content_range_total);
    }
    chunk = std::move(response.body);
    return AttemptOutcome::Data;
}


bool ChunkedDownloader::pause_before_retry()
{
    if (auto& hook = retry_wait_override_slot()) {
        return hook(options_.retry_delay);
    }
    if (cancellation_) {
        return cancellation_->wait_for(options_.retry_delay);
    }
    std::this_thread::sleep_for(options_.retry_delay);
    return false;
}


void ChunkedDownloader::report_progress(const DownloadProgress& progress) const
{
    if (logger_) {
        const std::int64_t kilobytes = progress.total_bytes / Defaults::KB;
        const std::int64_t megabytes = progress.total_bytes / Defaults::MB;
        if (megabytes > 0) {
            logger_->info("Downloaded {} chunks → {} MB, {} KB", progress.chunk_count, megabytes, kilobytes);
        } else {
            logger_->info("Downloaded {} chunks → {} KB", progress.chunk_count, kilobytes);
        }
    }
    if (progress_callback_) {
        progress_callback_(progress);
    }
}


bool ChunkedDownloader::cancellation_requested() const
{
    return cancellation_ && cancellation_->is_cancelled();
}
