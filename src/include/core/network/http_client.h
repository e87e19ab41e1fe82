#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <core/discovery/cancellation_controller.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = boost::asio::ip::tcp;

namespace bridgefinder::core {

using HttpResponse = http::response<http::string_body>;

inline constexpr std::string_view kUserAgent = "BridgeFinder/1.0";

// Plain HTTP/1.1 connection to one host. Bridges serve /api/0/config and
// /description.xml over http.
class HttpClient {
public:
    explicit HttpClient(net::any_io_executor executor);
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    net::awaitable<bool> Connect(std::string_view host,
                                 unsigned short port,
                                 std::chrono::milliseconds timeout);

    net::awaitable<bool> Disconnect();

    bool IsConnected() const;

    // Aborts whatever is in flight; the pending operation completes with
    // operation_aborted.
    void Cancel();

    template<typename RequestBody>
    net::awaitable<HttpResponse> SendRequest(http::request<RequestBody>& req,
                                             std::chrono::milliseconds timeout);

    template<typename Body>
    http::request<Body> CreateRequest(http::verb method,
                                      const std::string& target,
                                      bool keep_alive = false) const;

private:
    net::any_io_executor executor_;
    tcp::resolver resolver_;
    std::unique_ptr<beast::tcp_stream> connection_;
    std::string current_host_;
    unsigned short current_port_ = 0;
};

// TLS counterpart, used for the cloud directory. The peer certificate is
// verified against the system trust store and the requested host name.
class HttpsClient {
public:
    HttpsClient(net::any_io_executor executor, ssl::context& ssl_ctx);
    ~HttpsClient();

    HttpsClient(const HttpsClient&) = delete;
    HttpsClient& operator=(const HttpsClient&) = delete;

    // Throws boost::system::system_error on resolve, connect or handshake
    // failure so callers can tell transport errors apart.
    net::awaitable<void> Connect(std::string_view host,
                                 unsigned short port,
                                 std::chrono::milliseconds timeout);

    net::awaitable<bool> Disconnect();

    bool IsConnected() const;

    void Cancel();

    template<typename RequestBody>
    net::awaitable<HttpResponse> SendRequest(http::request<RequestBody>& req,
                                             std::chrono::milliseconds timeout);

    template<typename Body>
    http::request<Body> CreateRequest(http::verb method,
                                      const std::string& target,
                                      bool keep_alive = false) const;

private:
    net::any_io_executor executor_;
    ssl::context& ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> connection_;
    std::string current_host_;
    unsigned short current_port_ = 0;
    SSL_SESSION* ssl_session_ = nullptr;
};

// One GET over a fresh HttpClient. Transport errors and `stop` yield
// std::nullopt; they are logged at debug level only since most scanned
// addresses are expected not to answer.
net::awaitable<std::optional<HttpResponse>> HttpGet(std::string host,
                                                    unsigned short port,
                                                    std::string target,
                                                    std::string accept,
                                                    std::chrono::milliseconds timeout,
                                                    StopSignal stop);

template<typename RequestBody>
net::awaitable<HttpResponse> HttpClient::SendRequest(http::request<RequestBody>& req,
                                                     std::chrono::milliseconds timeout) {
    if (!connection_) {
        throw std::runtime_error("No active connection");
    }

    connection_->expires_after(timeout);
    co_await http::async_write(*connection_, req, net::use_awaitable);

    beast::flat_buffer buffer;
    HttpResponse res;
    co_await http::async_read(*connection_, buffer, res, net::use_awaitable);
    connection_->expires_never();

    co_return res;
}

template<typename Body>
http::request<Body> HttpClient::CreateRequest(http::verb method,
                                              const std::string& target,
                                              bool keep_alive) const {
    http::request<Body> req{method, target, 11};

    if (!current_host_.empty()) {
        req.set(http::field::host,
                current_port_ == 80 ? current_host_
                                    : current_host_ + ":" + std::to_string(current_port_));
    }
    req.set(http::field::user_agent, std::string(kUserAgent));
    req.keep_alive(keep_alive);

    return req;
}

template<typename RequestBody>
net::awaitable<HttpResponse> HttpsClient::SendRequest(http::request<RequestBody>& req,
                                                      std::chrono::milliseconds timeout) {
    if (!connection_) {
        throw std::runtime_error("No active connection");
    }

    beast::get_lowest_layer(*connection_).expires_after(timeout);
    co_await http::async_write(*connection_, req, net::use_awaitable);

    beast::flat_buffer buffer;
    HttpResponse res;
    co_await http::async_read(*connection_, buffer, res, net::use_awaitable);
    beast::get_lowest_layer(*connection_).expires_never();

    co_return res;
}

template<typename Body>
http::request<Body> HttpsClient::CreateRequest(http::verb method,
                                               const std::string& target,
                                               bool keep_alive) const {
    http::request<Body> req{method, target, 11};

    if (!current_host_.empty()) {
        req.set(http::field::host,
                current_port_ == 443 ? current_host_
                                     : current_host_ + ":" + std::to_string(current_port_));
    }
    req.set(http::field::user_agent, std::string(kUserAgent));
    req.keep_alive(keep_alive);

    return req;
}

} // namespace bridgefinder::core
