#ifndef HTTPRANGE_HPP
#define HTTPRANGE_HPP

#include "Types.hpp"
#include <cstdint>
#include <string>

namespace HttpRange {

/// "bytes=<start>-<end>"
std::string format_range_header(const ByteRange& range);

/// Total size from "bytes <start>-<end>/<total>", or -1 when absent, "*" or malformed.
std::int64_t parse_content_range_total(const std::string& header_value);

/// 200 (range ignored) and 206 (range honored) are the only accepted codes.
bool is_success_status(long status_code);

} // namespace HttpRange

#endif
