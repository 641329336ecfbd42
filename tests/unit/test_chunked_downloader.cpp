#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "AppException.hpp"
#include "ChunkedDownloader.hpp"
#include "ScriptedTransport.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"
#include "TestHooks.hpp"

namespace {

constexpr const char* kUrl = "http://127.0.0.1:8080";

DownloadOptions make_options(std::int64_t chunk_size, int max_retries = 5) {
    DownloadOptions options;
    options.server_url = kUrl;
    options.chunk_size = chunk_size;
    options.max_retries = max_retries;
    options.retry_delay = std::chrono::milliseconds(250);
    return options;
}

// Records every retry wait instead of sleeping. Returns true (cancel) once
// the configured number of waits has been seen.
struct RetryWaitRecorder {
    explicit RetryWaitRecorder(int cancel_on_wait = 0) {
        TestHooks::set_retry_wait_override([this, cancel_on_wait](std::chrono::milliseconds delay) {
            waits.push_back(delay);
            return cancel_on_wait > 0 && static_cast<int>(waits.size()) >= cancel_on_wait;
        });
    }
    ~RetryWaitRecorder() {
        TestHooks::reset_retry_wait_override();
    }

    std::vector<std::chrono::milliseconds> waits;
};

class FailingOnceSink : public MemorySink {
public:
    explicit FailingOnceSink(ErrorCodes::Code code) : code_(code) {}

    void write(const char* data, std::size_t size) override {
        if (!failed_) {
            failed_ = true;
            THROW_APP_ERROR(code_, "simulated write failure");
        }
        MemorySink::write(data, size);
    }
    using OutputSink::write;

private:
    ErrorCodes::Code code_;
    bool failed_{false};
};

// Serves chunk_count full chunks of filler, then empty 200 responses.
class FixedChunkTransport : public IHttpTransport {
public:
    FixedChunkTransport(std::int64_t chunk_size, int chunk_count)
        : chunk_size_(chunk_size), chunk_count_(chunk_count) {}

    HttpResponse get_range(const std::string&, const ByteRange& range, const HttpTimeouts&) override {
        ++requests;
        if (range.start >= chunk_size_ * chunk_count_) {
            return HttpResponse{200, "OK", {}, -1};
        }
        return HttpResponse{206, "Partial Content",
                            ByteBuffer(static_cast<std::size_t>(range.length()), 'x'),
                            chunk_size_ * chunk_count_};
    }

    int requests{0};

private:
    std::int64_t chunk_size_;
    int chunk_count_;
};

} // namespace

TEST_CASE("Chunk requests advance by the received size until an empty response") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    ChunkedDownloader downloader(make_options(40), transport, make_null_logger());

    const ByteBuffer data = downloader.download_data();

    REQUIRE(data == payload);
    REQUIRE(transport->requests.size() == 3 + 5);
    REQUIRE(transport->requests[0] == ByteRange{0, 39});
    REQUIRE(transport->requests[1] == ByteRange{40, 79});
    REQUIRE(transport->requests[2] == ByteRange{80, 119});
    for (std::size_t i = 3; i < transport->requests.size(); ++i) {
        REQUIRE(transport->requests[i] == ByteRange{120, 159});
    }
    for (const auto& url : transport->urls) {
        REQUIRE(url == kUrl);
    }
    REQUIRE(downloader.last_report().termination == DownloadTermination::Completed);
    REQUIRE(downloader.last_report().chunk_count == 3);
    REQUIRE(downloader.last_report().bytes_written == 100);
}

TEST_CASE("Payload is reassembled for chunk sizes that do and do not divide it") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(100, 42);

    for (std::int64_t chunk_size : {1, 3, 7, 50, 99, 100, 101, 4096}) {
        auto transport = std::make_shared<ScriptedTransport>(payload);
        ChunkedDownloader downloader(make_options(chunk_size, 2), transport, nullptr);
        REQUIRE(downloader.download_data() == payload);
    }
}

TEST_CASE("Exact multiple of the chunk size ends after one extra empty request") {
    RetryWaitRecorder recorder;
    const std::int64_t chunk_size = Defaults::kChunkSize;
    auto transport = std::make_shared<FixedChunkTransport>(chunk_size, 3);
    ChunkedDownloader downloader(make_options(chunk_size), transport, nullptr);

    const ByteBuffer data = downloader.download_data();

    REQUIRE(static_cast<std::int64_t>(data.size()) == 3 * chunk_size);
    REQUIRE(downloader.last_report().chunk_count == 3);
    REQUIRE(transport->requests == 3 + 5);
}

TEST_CASE("Empty first response yields an empty payload") {
    RetryWaitRecorder recorder;
    auto transport = std::make_shared<ScriptedTransport>(ByteBuffer{});
    ChunkedDownloader downloader(make_options(40), transport, make_null_logger());

    REQUIRE(downloader.download_data().empty());
    REQUIRE(transport->requests.size() == 5);
    REQUIRE(recorder.waits.size() == 4);
    REQUIRE(downloader.last_report().termination == DownloadTermination::Completed);
    REQUIRE(downloader.last_report().chunk_count == 0);
}

TEST_CASE("Transient failures below the retry budget do not change the payload") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    transport->queue_faults({Fault::network_error(), Fault::status(503),
                             Fault::empty_body(), Fault::timeout()});
    ChunkedDownloader downloader(make_options(40), transport, make_null_logger());

    REQUIRE(downloader.download_data() == payload);
    REQUIRE(transport->requests[4] == ByteRange{0, 39});
    REQUIRE(transport->requests[5] == ByteRange{40, 79});
    // Four waits for the faults plus four between the trailing empty responses.
    REQUIRE(recorder.waits.size() == 8);
    for (const auto& wait : recorder.waits) {
        REQUIRE(wait == std::chrono::milliseconds(250));
    }
}

TEST_CASE("Server that ignores Range has its whole body appended on every request") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    transport->set_ignore_range(true);
    auto token = std::make_shared<CancellationToken>();
    ChunkedDownloader downloader(make_options(40), transport, nullptr, token);

    downloader.set_progress_callback([&](const DownloadProgress& progress) {
        if (progress.chunk_count == 3) {
            token->request_cancel();
        }
    });

    const ByteBuffer data = downloader.download_data();

    REQUIRE(data == payload + payload + payload);
    REQUIRE(transport->requests.size() == 3);
    REQUIRE(transport->requests[0] == ByteRange{0, 39});
    REQUIRE(transport->requests[1] == ByteRange{100, 139});
    REQUIRE(transport->requests[2] == ByteRange{200, 239});
    REQUIRE(downloader.last_report().chunk_count == 3);
    REQUIRE(downloader.last_report().termination == DownloadTermination::Interrupted);
    REQUIRE(recorder.waits.empty());
}

TEST_CASE("Chunk that fails every attempt truncates the payload") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    transport->queue_fault(Fault::none(), 1);
    transport->queue_fault(Fault::status(500), 5);

    std::ostringstream log;
    ChunkedDownloader downloader(make_options(40), transport, make_capture_logger(log));

    const ByteBuffer data = downloader.download_data();

    REQUIRE(data == payload.substr(0, 40));
    REQUIRE(transport->requests.size() == 6);
    REQUIRE(downloader.last_report().termination == DownloadTermination::RetriesExhausted);
    REQUIRE_FALSE(downloader.last_report().is_complete());
    REQUIRE(log.str().find("warning: Error: 500-Glitch") != std::string::npos);
    REQUIRE(log.str().find("error: Failed to download chunk after 5 attempts") != std::string::npos);
}

TEST_CASE("download_chunk reports how the last attempt ended") {
    RetryWaitRecorder recorder;

    SECTION("successful status with empty body on every attempt") {
        auto transport = std::make_shared<ScriptedTransport>(ByteBuffer{});
        ChunkedDownloader downloader(make_options(10), transport, nullptr);
        const ChunkResult result = downloader.download_chunk(0, 9);
        REQUIRE(result.status == ChunkStatus::EndOfStream);
        REQUIRE(result.empty());
        REQUIRE(result.attempts == 5);
    }

    SECTION("timeouts on every attempt") {
        auto transport = std::make_shared<ScriptedTransport>(make_payload(10));
        transport->queue_fault(Fault::timeout(), 5);
        ChunkedDownloader downloader(make_options(10), transport, nullptr);
        const ChunkResult result = downloader.download_chunk(0, 9);
        REQUIRE(result.status == ChunkStatus::Exhausted);
        REQUIRE(result.empty());
    }

    SECTION("last attempt decides between the two") {
        auto transport = std::make_shared<ScriptedTransport>(ByteBuffer{});
        transport->queue_fault(Fault::network_error(), 4);
        ChunkedDownloader downloader(make_options(10), transport, nullptr);
        REQUIRE(downloader.download_chunk(0, 9).status == ChunkStatus::EndOfStream);

        transport->queue_fault(Fault::empty_body(), 4);
        transport->queue_fault(Fault::status(502), 1);
        REQUIRE(downloader.download_chunk(0, 9).status == ChunkStatus::Exhausted);
    }

    SECTION("data after failures reports the attempt that succeeded") {
        const ByteBuffer payload = make_payload(10);
        auto transport = std::make_shared<ScriptedTransport>(payload);
        transport->queue_faults({Fault::timeout(), Fault::status(429)});
        ChunkedDownloader downloader(make_options(10), transport, nullptr);
        const ChunkResult result = downloader.download_chunk(0, 9);
        REQUIRE(result.status == ChunkStatus::Data);
        REQUIRE(result.bytes == payload);
        REQUIRE(result.attempts == 3);
    }
}

TEST_CASE("No wait follows the final failed attempt") {
    RetryWaitRecorder recorder;
    auto transport = std::make_shared<ScriptedTransport>(make_payload(10));
    transport->queue_fault(Fault::network_error(), 3);
    ChunkedDownloader downloader(make_options(10, 3), transport, nullptr);

    downloader.download_chunk(0, 9);

    REQUIRE(transport->requests.size() == 3);
    REQUIRE(recorder.waits.size() == 2);
}

TEST_CASE("Single attempt budget never waits") {
    RetryWaitRecorder recorder;
    auto transport = std::make_shared<ScriptedTransport>(ByteBuffer{});
    ChunkedDownloader downloader(make_options(10, 1), transport, nullptr);

    REQUIRE(downloader.download_data().empty());
    REQUIRE(transport->requests.size() == 1);
    REQUIRE(recorder.waits.empty());
}

TEST_CASE("Cancellation during a retry wait keeps the bytes received so far") {
    RetryWaitRecorder recorder(1);
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    transport->queue_faults({Fault::none(), Fault::status(503)});
    ChunkedDownloader downloader(make_options(40), transport, make_null_logger());

    const ByteBuffer data = downloader.download_data();

    REQUIRE(data == payload.substr(0, 40));
    REQUIRE(transport->requests.size() == 2);
    REQUIRE(downloader.last_report().termination == DownloadTermination::Interrupted);
}

TEST_CASE("Cancellation is checked before every chunk") {
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    auto token = std::make_shared<CancellationToken>();
    ChunkedDownloader downloader(make_options(40), transport, nullptr, token);

    std::vector<DownloadProgress> seen;
    downloader.set_progress_callback([&](const DownloadProgress& progress) {
        seen.push_back(progress);
        token->request_cancel();
    });

    const ByteBuffer data = downloader.download_data();

    REQUIRE(data == payload.substr(0, 40));
    REQUIRE(seen.size() == 1);
    REQUIRE(transport->requests.size() == 1);
    REQUIRE(downloader.last_report().termination == DownloadTermination::Interrupted);
}

TEST_CASE("Cancelling the token wakes a long retry wait") {
    auto transport = std::make_shared<ScriptedTransport>(make_payload(10));
    transport->queue_fault(Fault::status(503), 1);
    auto token = std::make_shared<CancellationToken>();
    DownloadOptions options = make_options(10);
    options.retry_delay = std::chrono::seconds(30);
    ChunkedDownloader downloader(options, transport, nullptr, token);

    auto canceller = std::async(std::launch::async, [token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token->request_cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    const ByteBuffer data = downloader.download_data();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.get();

    REQUIRE(data.empty());
    REQUIRE(elapsed < std::chrono::seconds(10));
    REQUIRE(downloader.last_report().termination == DownloadTermination::Interrupted);
}

TEST_CASE("Progress callback receives running totals") {
    RetryWaitRecorder recorder;
    auto transport = std::make_shared<ScriptedTransport>(make_payload(100));
    ChunkedDownloader downloader(make_options(40), transport, make_null_logger());

    std::vector<DownloadProgress> seen;
    downloader.set_progress_callback([&](const DownloadProgress& progress) { seen.push_back(progress); });
    downloader.download_data();

    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0].chunk_count == 1);
    REQUIRE(seen[0].total_bytes == 40);
    REQUIRE(seen[1].total_bytes == 80);
    REQUIRE(seen[2].chunk_count == 3);
    REQUIRE(seen[2].total_bytes == 100);
}

TEST_CASE("Storage write failure is retried at the same offset") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    ChunkedDownloader downloader(make_options(40), transport, make_null_logger());

    FailingOnceSink sink(ErrorCodes::Code::FILE_WRITE_FAILED);
    const DownloadReport report = downloader.download_data(sink);

    REQUIRE(sink.bytes() == payload);
    REQUIRE(report.bytes_written == 100);
    REQUIRE(transport->requests[0] == ByteRange{0, 39});
    REQUIRE(transport->requests[1] == ByteRange{0, 39});
    REQUIRE(transport->requests[2] == ByteRange{40, 79});
}

TEST_CASE("Non-storage application errors are not retried") {
    RetryWaitRecorder recorder;
    auto transport = std::make_shared<ScriptedTransport>(make_payload(100));
    ChunkedDownloader downloader(make_options(40), transport, nullptr);

    FailingOnceSink sink(ErrorCodes::Code::CONFIG_INVALID);
    REQUIRE_THROWS_AS(downloader.download_data(sink), ErrorCodes::AppException);
    REQUIRE(transport->requests.size() == 1);
}

TEST_CASE("Client state error is logged and the chunk is requested again") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    transport->queue_fault(Fault::state_error(), 1);

    std::ostringstream log;
    ChunkedDownloader downloader(make_options(40), transport, make_capture_logger(log));

    REQUIRE(downloader.download_data() == payload);
    REQUIRE(log.str().find("critical: Client state error: connection used after release") != std::string::npos);
    REQUIRE(log.str().find("Retrying in 250ms...") != std::string::npos);
    REQUIRE(transport->requests[1] == ByteRange{0, 39});
}

TEST_CASE("File download streams the payload to disk") {
    RetryWaitRecorder recorder;
    TempDir tmp;
    const auto destination = (tmp.path() / "payload.bin").string();
    const ByteBuffer payload = make_payload(100);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    transport->queue_faults({Fault::timeout(), Fault::none(), Fault::status(500)});
    ChunkedDownloader downloader(make_options(40), transport, make_null_logger());

    REQUIRE(downloader.download_data(destination) == 100);
    REQUIRE(read_file(destination) == payload);
}

TEST_CASE("File download fails when the destination cannot be opened") {
    TempDir tmp;
    const auto destination = (tmp.path() / "missing-dir" / "payload.bin").string();
    auto transport = std::make_shared<ScriptedTransport>(make_payload(10));
    ChunkedDownloader downloader(make_options(10), transport, nullptr);

    try {
        downloader.download_data(destination);
        FAIL("expected AppException");
    } catch (const ErrorCodes::AppException& ex) {
        REQUIRE(ex.get_error_code() == ErrorCodes::Code::FILE_OPEN_FAILED);
    }
    REQUIRE(transport->requests.empty());
}

TEST_CASE("Downloader rejects unusable options") {
    auto transport = std::make_shared<ScriptedTransport>(ByteBuffer{});
    REQUIRE_THROWS_AS(ChunkedDownloader(make_options(10), nullptr, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(ChunkedDownloader(make_options(0), transport, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(ChunkedDownloader(make_options(10, 0), transport, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(ChunkedDownloader(make_options(Defaults::kMaxChunkSize + 1), transport, nullptr),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ChunkedDownloader(make_options(std::numeric_limits<std::int64_t>::max()), transport, nullptr),
                      std::invalid_argument);
}

TEST_CASE("Largest allowed chunk size still produces forward ranges") {
    RetryWaitRecorder recorder;
    const ByteBuffer payload = make_payload(10);
    auto transport = std::make_shared<ScriptedTransport>(payload);
    ChunkedDownloader downloader(make_options(Defaults::kMaxChunkSize, 1), transport, nullptr);

    REQUIRE(downloader.download_data() == payload);
    REQUIRE(transport->requests.size() == 2);
    REQUIRE(transport->requests[0] == ByteRange{0, Defaults::kMaxChunkSize - 1});
    REQUIRE(transport->requests[1].start == 10);
    REQUIRE(transport->requests[1].end == 10 + Defaults::kMaxChunkSize - 1);
    REQUIRE(transport->requests[1].end > transport->requests[1].start);
}
