#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/argument_parser.h>
#include <core/constant/path.h>
#include <core/discovery/discovery_coordinator.h>
#include <core/discovery/probe_factory.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <core/util/system.h>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>

namespace net = boost::asio;
using namespace bridgefinder;

namespace {

constexpr int kExitFound = 0;
constexpr int kExitNotFound = 1;
constexpr int kExitUsage = 2;

void printTable(const std::vector<core::CandidateRecord>& bridges) {
    if (bridges.empty()) {
        std::cout << "No bridge found." << std::endl;
        return;
    }
    std::cout << std::left << std::setw(20) << "ID" << std::setw(18) << "ADDRESS"
              << std::setw(7) << "PORT"
              << "NAME" << '\n';
    for (const auto& bridge : bridges) {
        std::cout << std::setw(20) << bridge.normalized_id << std::setw(18) << bridge.address
                  << std::setw(7) << (bridge.port ? std::to_string(*bridge.port) : "-")
                  << bridge.display_name.value_or("") << '\n';
    }
    std::cout.flush();
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = ArgumentParser(argc, argv).Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        ArgumentParser::ShowHelp();
        return kExitUsage;
    }
    if (options.help) {
        ArgumentParser::ShowHelp();
        return kExitFound;
    }

    auto cli_level = options.log_level ? Logger::ParseLevel(*options.log_level) : std::nullopt;
    Logger logger(cli_level.value_or(Logger::Level::info), core::path::kLogDir);

    core::InitConfig(options.config_path ? std::filesystem::path(*options.config_path)
                                         : core::path::kConfigFile);
    if (!cli_level) {
        if (auto level = Logger::ParseLevel(core::settings.log_level)) {
            logger.set_log_level(*level);
        } else {
            spdlog::warn("Unknown log level \"{}\" in configuration", core::settings.log_level);
        }
    }

    auto settings = core::settings;
    if (options.timeout) {
        settings.timeout = *options.timeout;
    }
    if (options.probes) {
        settings.probes = *options.probes;
    }

    core::OpenSSLProvider::InitOpenSSL();
    std::shared_ptr<net::ssl::context> ssl_ctx;
    try {
        ssl_ctx = std::make_shared<net::ssl::context>(core::OpenSSLProvider::BuildClientContext());
    } catch (const std::exception& e) {
        spdlog::error("Failed to set up TLS: {}", e.what());
    }

    net::io_context ioc;
    core::DiscoveryCoordinator coordinator(ioc,
                                           core::BuildProbes(settings,
                                                             ssl_ctx,
                                                             core::system::LocalIpv4Address));

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&coordinator](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Signal {} received, stopping", signal_number);
            coordinator.Stop();
        }
    });

    auto work = net::make_work_guard(ioc);
    std::thread io_thread([&ioc]() { ioc.run(); });

    auto local = core::system::LocalIpv4Address();
    spdlog::info("Searching for bridges from {} ({})",
                 core::system::Hostname(),
                 local ? local->to_string() : "no IPv4 address");

    auto bridges = coordinator.Discover(settings.timeout).get();

    net::post(ioc, [&signals] { signals.cancel(); });
    work.reset();
    if (io_thread.joinable()) {
        io_thread.join();
    }

    if (options.json) {
        nlohmann::json result = bridges;
        std::cout << result.dump(2) << std::endl;
    } else {
        printTable(bridges);
    }

    if (auto outcome = coordinator.LastOutcome()) {
        spdlog::debug("Session {} ended: {}", outcome->session_id, outcome->Describe());
    }

    return bridges.empty() ? kExitNotFound : kExitFound;
}
