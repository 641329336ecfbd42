#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Numeric error codes, grouped by subsystem
enum class Code {
    UNKNOWN_ERROR = 0,

    // File system (1200-1299)
    FILE_OPEN_FAILED = 1204,
    FILE_READ_FAILED = 1205,
    FILE_WRITE_FAILED = 1206,

    // Configuration (1500-1599)
    CONFIG_INVALID = 1500,
    CONFIG_LOAD_FAILED = 1504,
    CONFIG_INVALID_VALUE = 1505,

    // System (1700-1799)
    SYSTEM_INIT_FAILED = 1704,
    SYSTEM_DIGEST_FAILED = 1706,

    // Download (1900-1999)
    DOWNLOAD_CURL_INIT_FAILED = 1901,
    DOWNLOAD_INVALID_URL = 1902,
    DOWNLOAD_INCOMPLETE = 1905,
    DOWNLOAD_INTERRUPTED = 1906
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution steps
    std::string get_user_message() const;

    // Code, message, resolution and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static std::string get_category_name(Code code);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
