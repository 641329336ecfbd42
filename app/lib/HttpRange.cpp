#include "HttpRange.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>

namespace HttpRange {

std::string format_range_header(const ByteRange& range)
{
    return fmt::format("bytes={}-{}", range.start, range.end);
}

std::int64_t parse_content_range_total(const std::string& header_value)
{
    const auto slash = header_value.rfind('/');
    if (slash == std::string::npos || slash + 1 >= header_value.size()) {
        return -1;
    }

    std::size_t begin = slash + 1;
    std::size_t end = header_value.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(header_value[end - 1]))) {
        --end;
    }

    std::int64_t total = -1;
    const char* first = header_value.data() + begin;
    const char* last = header_value.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, total);
    if (ec != std::errc() || ptr != last || total < 0) {
        return -1;
    }
    return total;
}

bool is_success_status(long status_code)
{
    return status_code == 200 || status_code == 206;
}

} // namespace HttpRange
