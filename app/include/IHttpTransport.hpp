#pragma once
#include "Types.hpp"
#include <stdexcept>
#include <string>

/**
 * @brief Connection-level failure of a single request (connect error, read
 * timeout, reset). Status codes are not transport errors.
 */
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, bool timed_out)
        : std::runtime_error(message), timed_out_(timed_out) {}

    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_{false};
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * @brief Performs one GET for the given byte range over a fresh connection.
     * @throws TransportError on connection-level failures.
     */
    virtual HttpResponse get_range(const std::string& url,
                                   const ByteRange& range,
                                   const HttpTimeouts& timeouts) = 0;
};

