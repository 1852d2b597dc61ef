#include "engram/http_client.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace engram {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

HttpClient::HttpClient()
    : timeout_(std::chrono::milliseconds(30000)) {}

unsigned HttpClient::send_request(
    const std::string& method,
    const std::string& target,
    const std::string& body,
    std::string& response,
    const std::string& host,
    uint16_t port) {

    const http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw InvalidArgumentError("Unsupported HTTP method: " + method, __func__);
    }

    ENGRAM_LOG_DEBUG("HTTP " + method + " " + host + ":" + std::to_string(port) + target);

    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        stream.expires_after(timeout_);
        auto const results = resolver.resolve(host, std::to_string(port));
        stream.connect(results);

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        for (const auto& header : headers_) {
            req.set(header.first, header.second);
        }
        req.body() = body;
        req.prepare_payload();

        stream.expires_after(timeout_);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            ENGRAM_LOG_DEBUG("Socket shutdown: " + ec.message());
        }

        response = res.body();
        return res.result_int();
    } catch (const beast::system_error& e) {
        throw BackendUnavailableError(
            "HTTP " + method + " " + target + " to " + host + ":" + std::to_string(port) +
            " failed: " + e.what(),
            __func__, "Check that the service is running and reachable");
    }
}

void HttpClient::set_header(const std::string& name, const std::string& value) {
    if (value.empty()) {
        headers_.erase(name);
    } else {
        headers_[name] = value;
    }
}

void HttpClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

} // namespace engram
