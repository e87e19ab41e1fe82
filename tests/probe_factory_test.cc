#include <boost/asio/ssl/context.hpp>
#include <core/discovery/probe_factory.h>
#include <gtest/gtest.h>

using namespace bridgefinder::core;

namespace {

std::vector<std::string> names(const ProbeList& probes) {
    std::vector<std::string> result;
    for (const auto& probe : probes) {
        result.emplace_back(probe->name());
    }
    return result;
}

std::optional<boost::asio::ip::address_v4> noLocalAddress() {
    return std::nullopt;
}

} // namespace

TEST(BuildProbes, AllProbesInPriorityOrder) {
    auto ssl_ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);

    auto probes = BuildProbes(Settings{}, ssl_ctx, noLocalAddress);

    EXPECT_EQ(names(probes),
              (std::vector<std::string>{"local", "directory", "heuristic", "bruteforce"}));
}

TEST(BuildProbes, DirectoryNeedsTls) {
    auto probes = BuildProbes(Settings{}, nullptr, noLocalAddress);

    EXPECT_EQ(names(probes), (std::vector<std::string>{"local", "heuristic", "bruteforce"}));
}

TEST(BuildProbes, SubsetIsReordered) {
    Settings selected;
    selected.probes = {ProbeKind::kBruteForce, ProbeKind::kLocal, ProbeKind::kBruteForce};

    auto probes = BuildProbes(selected, nullptr, noLocalAddress);

    EXPECT_EQ(names(probes), (std::vector<std::string>{"local", "bruteforce"}));
}

TEST(BuildProbes, PlainHttpDirectoryNeedsNoTls) {
    Settings mirror;
    mirror.probes = {ProbeKind::kDirectory};
    mirror.directory.tls = false;

    auto probes = BuildProbes(mirror, nullptr, noLocalAddress);

    EXPECT_EQ(names(probes), (std::vector<std::string>{"directory"}));
}
