#ifndef CURLHTTPTRANSPORT_HPP
#define CURLHTTPTRANSPORT_HPP

#include "IHttpTransport.hpp"
#include <curl/curl.h>
#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief libcurl-backed transport. Every call owns its own easy handle;
 * nothing is pooled or reused between attempts.
 */
class CurlHttpTransport : public IHttpTransport {
public:
    CurlHttpTransport();

    HttpResponse get_range(const std::string& url,
                           const ByteRange& range,
                           const HttpTimeouts& timeouts) override;

private:
    struct ResponseState;

    std::shared_ptr<spdlog::logger> logger_;

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
    void setup_request(CURL* curl,
                       const std::string& url,
                       const curl_slist* headers,
                       const HttpTimeouts& timeouts,
                       ResponseState& state) const;
};

#endif
