#include <array>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/discovery/probe/local_service_probe.h>
#include <core/network/mdns.h>
#include <core/network/ssdp.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using udp = net::ip::udp;

namespace bridgefinder::core {

namespace {

udp::socket openMulticastSender(const net::any_io_executor& executor, int hops) {
    udp::socket socket(executor);
    socket.open(udp::v4());
    socket.set_option(net::ip::multicast::hops(hops));
    socket.bind(udp::endpoint(net::ip::address_v4::any(), 0));
    return socket;
}

} // namespace

LocalServiceProbe::LocalServiceProbe(LocalServiceOptions options, ValidationOptions validation)
    : options_(options)
    , validator_(std::move(validation)) {}

net::awaitable<std::vector<CandidateRecord>> LocalServiceProbe::Run(StopSignal stop) {
    if (!options_.mdns && !options_.ssdp) {
        co_return std::vector<CandidateRecord>{};
    }

    auto executor = co_await net::this_coro::executor;
    auto collector = LocalBridgeCollector::Create(
        executor,
        stop,
        options_.window,
        options_.settle,
        [this](std::string address, StopSignal signal) {
            return validator_.Validate(std::move(address), std::move(signal));
        });

    if (options_.mdns) {
        collector->Spawn(browseMdns(collector));
    }
    if (options_.ssdp) {
        collector->Spawn(searchSsdp(collector));
    }

    auto found = co_await collector->Wait();
    if (found.empty()) {
        spdlog::debug("No bridge answered on the local network");
    }
    co_return found;
}

net::awaitable<void> LocalServiceProbe::browseMdns(std::shared_ptr<LocalBridgeCollector> collector) {
    try {
        auto socket = openMulticastSender(collector->executor(), 255);
        auto on_stop = collector->signal().OnStop([&socket] {
            boost::system::error_code ignored;
            socket.cancel(ignored);
        });

        auto query = mdns::BuildPtrQuery(mdns::kHueService);
        udp::endpoint group(net::ip::make_address_v4(mdns::kMulticastAddress), mdns::kPort);
        co_await socket.async_send_to(net::buffer(query), group, net::use_awaitable);
        spdlog::debug("mDNS query for {} sent", mdns::kHueService);

        std::array<uint8_t, 9000> buffer;
        udp::endpoint sender;
        while (!collector->StopRequested()) {
            boost::system::error_code ec;
            auto n = co_await socket.async_receive_from(net::buffer(buffer),
                                                        sender,
                                                        net::redirect_error(net::use_awaitable,
                                                                            ec));
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    spdlog::debug("mDNS receive failed: {}", ec.message());
                }
                break;
            }

            auto message = mdns::Parse(std::span<const uint8_t>(buffer.data(), n));
            if (!message || !message->IsResponse()) {
                continue;
            }
            for (const auto& instance : mdns::ResolveInstances(*message, mdns::kHueService)) {
                auto address = instance.address ? instance.address->to_string()
                                                : sender.address().to_string();
                auto bridge_id = instance.txt.find("bridgeid");
                if (bridge_id == instance.txt.end() || bridge_id->second.empty()) {
                    collector->Confirm(address);
                    continue;
                }
                std::optional<uint16_t> port;
                if (instance.port != 0) {
                    port = instance.port;
                }
                collector->Add(CandidateRecord::Make(bridge_id->second,
                                                     address,
                                                     port,
                                                     instance.Label(mdns::kHueService)),
                               "mDNS");
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("mDNS browse failed: {}", e.what());
    }
}

net::awaitable<void> LocalServiceProbe::searchSsdp(std::shared_ptr<LocalBridgeCollector> collector) {
    try {
        auto socket = openMulticastSender(collector->executor(), 2);
        auto on_stop = collector->signal().OnStop([&socket] {
            boost::system::error_code ignored;
            socket.cancel(ignored);
        });

        auto request = ssdp::BuildSearchRequest();
        udp::endpoint group(net::ip::make_address_v4(ssdp::kMulticastAddress), ssdp::kPort);
        co_await socket.async_send_to(net::buffer(request), group, net::use_awaitable);
        spdlog::debug("SSDP M-SEARCH sent");

        std::array<char, 4096> buffer;
        udp::endpoint sender;
        while (!collector->StopRequested()) {
            boost::system::error_code ec;
            auto n = co_await socket.async_receive_from(net::buffer(buffer),
                                                        sender,
                                                        net::redirect_error(net::use_awaitable,
                                                                            ec));
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    spdlog::debug("SSDP receive failed: {}", ec.message());
                }
                break;
            }

            auto response = ssdp::ParseResponse(std::string_view(buffer.data(), n));
            if (!response || !response->LooksLikeHueBridge()) {
                continue;
            }

            auto address = sender.address().to_string();
            std::optional<uint16_t> port;
            if (auto header = response->Header("location")) {
                if (auto location = ssdp::ParseLocation(*header)) {
                    boost::system::error_code parse_ec;
                    net::ip::make_address_v4(location->host, parse_ec);
                    if (!parse_ec) {
                        address = location->host;
                        port = location->port;
                    }
                }
            }

            if (auto bridge_id = response->BridgeId(); bridge_id && !bridge_id->empty()) {
                collector->Add(CandidateRecord::Make(*bridge_id, address, port), "SSDP");
            } else {
                collector->Confirm(address);
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("SSDP search failed: {}", e.what());
    }
}

} // namespace bridgefinder::core
