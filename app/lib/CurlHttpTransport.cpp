#include "CurlHttpTransport.hpp"
#include "AppException.hpp"
#include "HttpRange.hpp"
#include "Logger.hpp"

#include <curl/easy.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::string trim_line_endings(std::string value)
{
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

bool starts_with_ci(const std::string& line, const std::string& prefix)
{
    if (line.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), line.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

// "HTTP/1.1 206 Partial Content" -> "Partial Content"
std::string reason_from_status_line(const std::string& line)
{
    const auto first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return {};
    }
    const auto second_space = line.find(' ', first_space + 1);
    if (second_space == std::string::npos) {
        return {};
    }
    return line.substr(second_space + 1);
}

long to_seconds_ceil(std::chrono::milliseconds value)
{
    const auto ms = value.count();
    if (ms <= 0) {
        return 1;
    }
    return static_cast<long>((ms + 999) / 1000);
}

} // namespace

struct CurlHttpTransport::ResponseState {
    ByteBuffer body;
    std::string reason;
    std::string content_range;
};


CurlHttpTransport::CurlHttpTransport()
    : logger_(Logger::get_logger("net_logger"))
{
}


size_t CurlHttpTransport::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* state = static_cast<ResponseState*>(userdata);
    const size_t total = size * nmemb;
    state->body.append(ptr, total);
    return total;
}


size_t CurlHttpTransport::header_callback(char* buffer, size_t size, size_t nitems, void* userdata)
{
    auto* state = static_cast<ResponseState*>(userdata);
    const size_t total = size * nitems;
    const std::string line = trim_line_endings(std::string(buffer, total));

    if (starts_with_ci(line, "HTTP/")) {
        // A new status line starts a new header block (e.g. after "100 Continue").
        state->reason = reason_from_status_line(line);
        state->content_range.clear();
    } else if (starts_with_ci(line, "Content-Range:")) {
        state->content_range = line.substr(std::string("Content-Range:").size());
    }
    return total;
}


void CurlHttpTransport::setup_request(CURL* curl,
                                      const std::string& url,
                                      const curl_slist* headers,
                                      const HttpTimeouts& timeouts,
                                      ResponseState& state) const
{
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeouts.connect.count()));
    // Read timeout: abort when nothing arrives for the whole read window.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, to_seconds_ceil(timeouts.read));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
}


HttpResponse CurlHttpTransport::get_range(const std::string& url,
                                          const ByteRange& range,
                                          const HttpTimeouts& timeouts)
{
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        THROW_APP_ERROR(ErrorCodes::Code::DOWNLOAD_CURL_INIT_FAILED, "curl_easy_init returned null");
    }

    const std::string range_header = "Range: " + HttpRange::format_range_header(range);
    CurlHeaderList headers(curl_slist_append(nullptr, range_header.c_str()), &curl_slist_free_all);
    if (!headers) {
        THROW_APP_ERROR(ErrorCodes::Code::DOWNLOAD_CURL_INIT_FAILED, "curl_slist_append returned null");
    }

    ResponseState state;
    setup_request(curl.get(), url, headers.get(), timeouts, state);

    if (logger_) {
        logger_->debug("GET {} ({})", url, range_header);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        const bool timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        if (logger_) {
            logger_->debug("GET {} failed: {}", url, curl_easy_strerror(res));
        }
        throw TransportError(curl_easy_strerror(res), timed_out);
    }

    HttpResponse response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    response.reason = std::move(state.reason);
    response.body = std::move(state.body);
    response.content_range_total = HttpRange::parse_content_range_total(state.content_range);

    if (logger_) {
        logger_->debug("GET {} returned HTTP {} with {} bytes (content-range total {})",
                       url, response.status_code, response.body.size(), response.content_range_total);
    }
    return response;
}
