#pragma once

#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <core/discovery/discovery_probe.h>
#include <core/network/http_client.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

struct DirectoryOptions {
    std::string host = "discovery.meethue.com";
    uint16_t port = 443;
    std::string target = "/";
    bool tls = true; // plain http only for a local mirror
    int attempts = 3;
    std::chrono::milliseconds request_timeout{8000};
    std::chrono::milliseconds retry_backoff{1000}; // multiplied by the attempt number
    std::chrono::milliseconds deadline{25000};
};

// `[{"id": "...", "internalipaddress": "...", "port": 443}, ...]`. Entries
// without id or address are skipped; std::nullopt when the body is not a
// JSON array.
std::optional<std::vector<CandidateRecord>> ParseDirectoryResponse(std::string_view body);

// Asks the vendor's cloud directory which bridges registered from this
// network's public address.
class DirectoryProbe : public DiscoveryProbe {
public:
    DirectoryProbe(DirectoryOptions options, std::shared_ptr<boost::asio::ssl::context> ssl_ctx);

    std::string_view name() const override { return "directory"; }

    boost::asio::awaitable<std::vector<CandidateRecord>> Run(StopSignal stop) override;

private:
    // One GET of the directory. Transport failures throw
    // boost::system::system_error.
    boost::asio::awaitable<HttpResponse> fetch(boost::asio::any_io_executor executor,
                                               StopSignal stop) const;

    DirectoryOptions options_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
};

} // namespace bridgefinder::core
