#include "OutputSink.hpp"
#include "AppException.hpp"
#include "Logger.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <system_error>
#include <utility>

void MemorySink::write(const char* data, std::size_t size)
{
    buffer_.append(data, size);
}


std::int64_t MemorySink::size() const
{
    return static_cast<std::int64_t>(buffer_.size());
}


ByteBuffer MemorySink::release()
{
    ByteBuffer released;
    released.swap(buffer_);
    return released;
}


FileSink::FileSink(const std::string& path)
    : path_(path),
      stream_(path, std::ios::binary | std::ios::out | std::ios::trunc)
{
    if (!stream_.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_OPEN_FAILED, "Output file: " + path_);
    }
}


FileSink::~FileSink()
{
    try {
        close();
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", ex.get_full_details());
        }
    }
}


void FileSink::write(const char* data, std::size_t size)
{
    if (!stream_.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, "Output file already closed: " + path_);
    }
    stream_.write(data, static_cast<std::streamsize>(size));
    if (!stream_) {
        // Rewind so a retried chunk lands at the same offset.
        stream_.clear();
        stream_.seekp(written_);
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED,
                        fmt::format("Output file: {} ({} bytes at offset {})", path_, size, written_));
    }
    written_ += static_cast<std::int64_t>(size);
}


std::int64_t FileSink::size() const
{
    return written_;
}


void FileSink::close()
{
    if (!stream_.is_open()) {
        return;
    }
    stream_.flush();
    const bool flushed = static_cast<bool>(stream_);
    stream_.close();
    if (!flushed || stream_.fail()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, "Failed to flush output file: " + path_);
    }

    // A rewound failed write can leave bytes past the last good offset.
    std::error_code ec;
    const auto on_disk = std::filesystem::file_size(path_, ec);
    if (!ec && on_disk > static_cast<std::uintmax_t>(written_)) {
        std::filesystem::resize_file(path_, static_cast<std::uintmax_t>(written_), ec);
    }
    if (ec) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED,
                        fmt::format("Failed to trim output file {} to {} bytes: {}", path_, written_, ec.message()));
    }
}
