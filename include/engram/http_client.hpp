#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace engram {

/**
 * Blocking HTTP/1.1 client over Boost.Beast. One connection per request.
 * Methods are virtual so tests can substitute a gmock double.
 */
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient() = default;

    /**
     * Send a request and return the HTTP status code. The response body is
     * written to `response` whatever the status. Connection failures and
     * timeouts throw BackendUnavailableError.
     */
    virtual unsigned send_request(
        const std::string& method,
        const std::string& target,
        const std::string& body,
        std::string& response,
        const std::string& host,
        uint16_t port);

    // Sent with every request, e.g. "api-key".
    void set_header(const std::string& name, const std::string& value);
    const std::map<std::string, std::string>& headers() const { return headers_; }

    void set_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    std::map<std::string, std::string> headers_;
};

} // namespace engram
