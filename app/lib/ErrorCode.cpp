#include "ErrorCode.hpp"

#include <fmt/format.h>

#include <unordered_map>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::UNKNOWN_ERROR,
         {"An unknown error occurred.",
          "Run again with --verbose and check the log file for details."}},
        {Code::FILE_OPEN_FAILED,
         {"The file could not be opened.",
          "Check that the directory exists and that you have permission to access it."}},
        {Code::FILE_READ_FAILED,
         {"The file could not be read.",
          "Check the file permissions and that the disk is healthy."}},
        {Code::FILE_WRITE_FAILED,
         {"The file could not be written.",
          "Check free disk space and write permissions on the output directory."}},
        {Code::CONFIG_INVALID,
         {"The configuration is invalid.",
          "Review the configuration file and command-line options."}},
        {Code::CONFIG_LOAD_FAILED,
         {"The configuration file could not be loaded.",
          "Check that the file passed with --config exists and is readable."}},
        {Code::CONFIG_INVALID_VALUE,
         {"A configuration value is out of range or malformed.",
          "Use positive integers; sizes accept K and M suffixes."}},
        {Code::SYSTEM_INIT_FAILED,
         {"A system library failed to initialize.",
          "Reinstall libcurl and OpenSSL and try again."}},
        {Code::SYSTEM_DIGEST_FAILED,
         {"The SHA-256 digest could not be computed.",
          "Check that the OpenSSL installation provides SHA-256."}},
        {Code::DOWNLOAD_CURL_INIT_FAILED,
         {"The HTTP client could not be initialized.",
          "Reinstall libcurl and try again."}},
        {Code::DOWNLOAD_INVALID_URL,
         {"The server URL is invalid.",
          "Use a URL of the form http://host:port/path."}},
        {Code::DOWNLOAD_INCOMPLETE,
         {"The download stopped before the server signalled the end of the data.",
          "Run the download again; the digest will not match the server's."}},
        {Code::DOWNLOAD_INTERRUPTED,
         {"The download was interrupted.",
          "Run the download again to fetch the full payload."}},
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return fmt::format("{}\n\n{}", message, resolution);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error Code: {} ({})\n{}",
                                      static_cast<int>(code),
                                      ErrorCatalog::get_category_name(code),
                                      message);
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    if (!context.empty()) {
        details += fmt::format("\nDetails: {}", context);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    auto it = entries.find(code);
    if (it == entries.end()) {
        it = entries.find(Code::UNKNOWN_ERROR);
    }
    return ErrorInfo(code, it->second.message, it->second.resolution, context);
}

std::string ErrorCatalog::get_category_name(Code code)
{
    const int value = static_cast<int>(code);
    if (value >= 1200 && value < 1300) return "File System";
    if (value >= 1500 && value < 1600) return "Configuration";
    if (value >= 1700 && value < 1800) return "System";
    if (value >= 1900 && value < 2000) return "Download";
    return "General";
}

} // namespace ErrorCodes
