#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <core/network/http_client.h>
#include <spdlog/spdlog.h>

namespace bridgefinder::core {

HttpClient::HttpClient(net::any_io_executor executor)
    : executor_(executor)
    , resolver_(executor) {}

net::awaitable<bool> HttpClient::Connect(std::string_view host,
                                         unsigned short port,
                                         std::chrono::milliseconds timeout) {
    try {
        if (connection_) {
            co_await Disconnect();
        }

        connection_ = std::make_unique<beast::tcp_stream>(executor_);

        auto results = co_await resolver_.async_resolve(std::string(host),
                                                        std::to_string(port),
                                                        net::use_awaitable);

        connection_->expires_after(timeout);
        co_await connection_->async_connect(results, net::use_awaitable);
        connection_->expires_never();

        current_host_ = host;
        current_port_ = port;

        spdlog::trace("Connected to {}:{}", host, port);
        co_return true;
    } catch (const std::exception& e) {
        spdlog::trace("Connection to {}:{} failed: {}", host, port, e.what());
        connection_.reset();
        current_host_.clear();
        current_port_ = 0;

        co_return false;
    }
}

net::awaitable<bool> HttpClient::Disconnect() {
    if (!connection_) {
        co_return true;
    }

    beast::error_code ec;
    connection_->socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::trace("Shutdown notice: {}", ec.message());
    }

    connection_.reset();
    current_host_.clear();
    current_port_ = 0;
    co_return true;
}

bool HttpClient::IsConnected() const {
    return connection_ != nullptr;
}

void HttpClient::Cancel() {
    resolver_.cancel();
    if (connection_) {
        connection_->cancel();
    }
}

HttpsClient::HttpsClient(net::any_io_executor executor, ssl::context& ssl_ctx)
    : executor_(executor)
    , ssl_ctx_(ssl_ctx)
    , resolver_(executor) {}

HttpsClient::~HttpsClient() {
    if (ssl_session_) {
        SSL_SESSION_free(ssl_session_);
        ssl_session_ = nullptr;
    }
}

net::awaitable<void> HttpsClient::Connect(std::string_view host,
                                          unsigned short port,
                                          std::chrono::milliseconds timeout) {
    if (connection_) {
        co_await Disconnect();
    }

    try {
        connection_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
            beast::tcp_stream(executor_), ssl_ctx_);

        std::string hostname(host);
        if (!SSL_set_tlsext_host_name(connection_->native_handle(), hostname.c_str())) {
            throw std::runtime_error("Failed to set SNI Hostname");
        }
        connection_->set_verify_mode(ssl::verify_peer);
        connection_->set_verify_callback(ssl::host_name_verification(hostname));
        if (ssl_session_) {
            SSL_set_session(connection_->native_handle(), ssl_session_);
        }

        auto results = co_await resolver_.async_resolve(hostname,
                                                        std::to_string(port),
                                                        net::use_awaitable);

        beast::get_lowest_layer(*connection_).expires_after(timeout);
        co_await beast::get_lowest_layer(*connection_).async_connect(results, net::use_awaitable);
        co_await connection_->async_handshake(ssl::stream_base::client, net::use_awaitable);
        beast::get_lowest_layer(*connection_).expires_never();

        if (ssl_session_) {
            SSL_SESSION_free(ssl_session_);
        }
        ssl_session_ = SSL_get1_session(connection_->native_handle());

        current_host_ = hostname;
        current_port_ = port;

        spdlog::debug("Connected to {}:{}", host, port);
    } catch (const std::exception& e) {
        spdlog::debug("Connection to {}:{} failed: {}", host, port, e.what());
        connection_.reset();
        current_host_.clear();
        current_port_ = 0;
        throw;
    }
}

net::awaitable<bool> HttpsClient::Disconnect() {
    if (!connection_) {
        co_return true;
    }

    beast::error_code ec;
    beast::get_lowest_layer(*connection_).expires_after(std::chrono::seconds(1));
    co_await connection_->async_shutdown(net::redirect_error(net::use_awaitable, ec));

    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("SSL shutdown notice: {}", ec.message());
    }

    connection_.reset();
    current_host_.clear();
    current_port_ = 0;

    spdlog::debug("Disconnected");
    co_return true;
}

bool HttpsClient::IsConnected() const {
    return connection_ != nullptr;
}

void HttpsClient::Cancel() {
    resolver_.cancel();
    if (connection_) {
        beast::get_lowest_layer(*connection_).cancel();
    }
}

net::awaitable<std::optional<HttpResponse>> HttpGet(std::string host,
                                                    unsigned short port,
                                                    std::string target,
                                                    std::string accept,
                                                    std::chrono::milliseconds timeout,
                                                    StopSignal stop) {
    if (stop.StopRequested()) {
        co_return std::optional<HttpResponse>{};
    }

    auto executor = co_await net::this_coro::executor;
    HttpClient client(executor);
    auto on_stop = stop.OnStop([&client] { client.Cancel(); });

    try {
        if (!co_await client.Connect(host, port, timeout)) {
            co_return std::optional<HttpResponse>{};
        }

        auto req = client.CreateRequest<http::empty_body>(http::verb::get, target);
        req.set(http::field::accept, accept);

        auto res = co_await client.SendRequest(req, timeout);
        co_await client.Disconnect();
        co_return std::optional<HttpResponse>(std::move(res));
    } catch (const std::exception& e) {
        spdlog::trace("GET http://{}:{}{} failed: {}", host, port, target, e.what());
        co_return std::optional<HttpResponse>{};
    }
}

} // namespace bridgefinder::core
