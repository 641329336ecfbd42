#ifndef OUTPUT_SINK_HPP
#define OUTPUT_SINK_HPP

#include "Types.hpp"
#include <cstdint>
#include <fstream>
#include <string>

/**
 * @brief Append-only destination for downloaded chunks.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /**
     * @brief Appends bytes at the end of the sink.
     * @throws ErrorCodes::AppException when the bytes cannot be stored.
     */
    virtual void write(const char* data, std::size_t size) = 0;

    /**
     * @brief Number of bytes written so far.
     */
    virtual std::int64_t size() const = 0;

    void write(const ByteBuffer& bytes) { write(bytes.data(), bytes.size()); }
};

/**
 * @brief Keeps the whole payload in memory.
 */
class MemorySink : public OutputSink {
public:
    void write(const char* data, std::size_t size) override;
    std::int64_t size() const override;
    using OutputSink::write;

    const ByteBuffer& bytes() const { return buffer_; }
    ByteBuffer release();

private:
    ByteBuffer buffer_;
};

/**
 * @brief Streams the payload to a file opened for truncating binary write.
 */
class FileSink : public OutputSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const char* data, std::size_t size) override;
    std::int64_t size() const override;
    using OutputSink::write;

    /**
     * @brief Flushes and closes the file, dropping anything past the bytes
     * written successfully; further writes fail.
     * @throws ErrorCodes::AppException when buffered data cannot be flushed or
     * the file cannot be trimmed.
     */
    void close();

private:
    std::string path_;
    std::ofstream stream_;
    std::int64_t written_{0};
};

#endif
