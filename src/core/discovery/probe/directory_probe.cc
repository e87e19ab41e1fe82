#include <boost/asio/this_coro.hpp>
#include <core/discovery/probe/directory_probe.h>
#include <core/discovery/stop_scope.h>
#include <core/network/http_client.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <type_traits>

namespace bridgefinder::core {

std::optional<std::vector<CandidateRecord>> ParseDirectoryResponse(std::string_view body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        return std::nullopt;
    }

    std::vector<CandidateRecord> records;
    for (const auto& entry : json) {
        if (!entry.is_object()) {
            continue;
        }
        auto id = entry.find("id");
        auto address = entry.find("internalipaddress");
        if (id == entry.end() || !id->is_string() || address == entry.end()
            || !address->is_string()) {
            spdlog::debug("Skipping directory entry {}", entry.dump());
            continue;
        }
        auto id_text = id->get<std::string>();
        auto address_text = address->get<std::string>();
        if (id_text.empty() || address_text.empty()) {
            continue;
        }

        std::optional<uint16_t> port;
        if (auto it = entry.find("port"); it != entry.end() && it->is_number_unsigned()
                                          && it->get<uint64_t>() <= 65535) {
            port = static_cast<uint16_t>(it->get<uint64_t>());
        }
        std::optional<std::string> name;
        if (auto it = entry.find("name"); it != entry.end() && it->is_string()) {
            name = it->get<std::string>();
        }

        records.push_back(CandidateRecord::Make(id_text, address_text, port, std::move(name)));
    }
    return records;
}

DirectoryProbe::DirectoryProbe(DirectoryOptions options,
                               std::shared_ptr<boost::asio::ssl::context> ssl_ctx)
    : options_(std::move(options))
    , ssl_ctx_(std::move(ssl_ctx)) {}

namespace {

template<typename Client>
net::awaitable<HttpResponse> getListing(Client& client,
                                        const DirectoryOptions& options,
                                        const StopSignal& stop) {
    auto on_stop = stop.OnStop([&client] { client.Cancel(); });

    if constexpr (std::is_same_v<Client, HttpClient>) {
        if (!co_await client.Connect(options.host, options.port, options.request_timeout)) {
            throw boost::system::system_error(make_error_code(net::error::connection_refused));
        }
    } else {
        co_await client.Connect(options.host, options.port, options.request_timeout);
    }

    auto req = client.template CreateRequest<http::empty_body>(http::verb::get, options.target);
    req.set(http::field::accept, "application/json");
    auto res = co_await client.SendRequest(req, options.request_timeout);
    co_await client.Disconnect();
    co_return res;
}

} // namespace

net::awaitable<HttpResponse> DirectoryProbe::fetch(net::any_io_executor executor,
                                                   StopSignal stop) const {
    if (!options_.tls) {
        HttpClient client(executor);
        co_return co_await getListing(client, options_, stop);
    }
    if (!ssl_ctx_) {
        throw std::runtime_error("no TLS context");
    }
    HttpsClient client(executor, *ssl_ctx_);
    co_return co_await getListing(client, options_, stop);
}

net::awaitable<std::vector<CandidateRecord>> DirectoryProbe::Run(StopSignal stop) {
    std::vector<CandidateRecord> found;

    auto executor = co_await net::this_coro::executor;
    StopScope scope(executor, stop, options_.deadline);

    for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
        if (scope.StopRequested()) {
            break;
        }

        std::chrono::milliseconds backoff{0};
        try {
            auto res = co_await fetch(executor, scope.signal());

            auto status = res.result_int();
            if (status == 200) {
                if (auto records = ParseDirectoryResponse(res.body())) {
                    found = std::move(*records);
                    spdlog::info("Directory listed {} bridge(s)", found.size());
                    break;
                }
                spdlog::warn("Directory answered with something other than a JSON array "
                             "(attempt {}/{})",
                             attempt,
                             options_.attempts);
                backoff = 2 * attempt * options_.retry_backoff;
            } else if (status >= 500 || status == 408) {
                spdlog::warn("Directory returned HTTP {} (attempt {}/{})",
                             status,
                             attempt,
                             options_.attempts);
                backoff = attempt * options_.retry_backoff;
            } else {
                spdlog::warn("Directory returned HTTP {}, giving up", status);
                break;
            }
        } catch (const boost::system::system_error& e) {
            if (scope.StopRequested()) {
                break;
            }
            spdlog::warn("Directory request failed (attempt {}/{}): {}",
                         attempt,
                         options_.attempts,
                         e.what());
            backoff = attempt * options_.retry_backoff;
        } catch (const std::exception& e) {
            spdlog::error("Directory request failed: {}", e.what());
            break;
        }

        if (attempt < options_.attempts && !co_await SleepFor(backoff, scope.signal())) {
            break;
        }
    }

    if (scope.expired()) {
        spdlog::info("Directory probe reached its deadline");
    }
    co_return found;
}

} // namespace bridgefinder::core
