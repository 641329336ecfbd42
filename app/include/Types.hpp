#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

/// Raw payload bytes; std::string keeps curl appends and file writes cheap.
using ByteBuffer = std::string;

/// Inclusive byte interval sent as "Range: bytes=<start>-<end>".
struct ByteRange {
    std::int64_t start{0};
    std::int64_t end{0};

    std::int64_t length() const { return end - start + 1; }

    /// End saturates at INT64_MAX instead of overflowing.
    static ByteRange from_offset(std::int64_t offset, std::int64_t chunk_size) {
        const std::int64_t span = chunk_size - 1;
        if (offset > std::numeric_limits<std::int64_t>::max() - span) {
            return {offset, std::numeric_limits<std::int64_t>::max()};
        }
        return {offset, offset + span};
    }
};

inline bool operator==(const ByteRange& lhs, const ByteRange& rhs) {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

struct HttpTimeouts {
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds read{5000};
};

struct HttpResponse {
    long status_code{0};
    std::string reason;
    ByteBuffer body;
    std::int64_t content_range_total{-1}; ///< -1 when Content-Range is absent or malformed.
};

enum class ChunkStatus {
    Data,        ///< Non-empty payload.
    EndOfStream, ///< Final attempt got a successful status with an empty body.
    Exhausted    ///< Final attempt failed with a transport error or a bad status.
};

struct ChunkResult {
    ChunkStatus status{ChunkStatus::EndOfStream};
    ByteBuffer bytes;
    int attempts{0};

    bool empty() const { return bytes.empty(); }

    static ChunkResult data(ByteBuffer bytes, int attempts) {
        return {ChunkStatus::Data, std::move(bytes), attempts};
    }

    static ChunkResult end_of_stream(int attempts) {
        return {ChunkStatus::EndOfStream, {}, attempts};
    }

    static ChunkResult exhausted(int attempts) {
        return {ChunkStatus::Exhausted, {}, attempts};
    }
};

struct DownloadProgress {
    std::int64_t chunk_count{0};
    std::int64_t total_bytes{0};
};

enum class DownloadTermination {
    Completed,
    RetriesExhausted,
    Interrupted
};

struct DownloadReport {
    std::int64_t bytes_written{0};
    std::int64_t chunk_count{0};
    DownloadTermination termination{DownloadTermination::Completed};

    bool is_complete() const { return termination == DownloadTermination::Completed; }
};

#endif
