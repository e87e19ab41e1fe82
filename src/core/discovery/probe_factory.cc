#include <core/discovery/probe_factory.h>
#include <spdlog/spdlog.h>

namespace bridgefinder::core {

ProbeList BuildProbes(const Settings& settings,
                      std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                      LocalAddressProvider local_address) {
    ProbeList probes;
    for (auto kind : NormalizeProbeKinds(settings.probes)) {
        switch (kind) {
        case ProbeKind::kLocal:
            probes.push_back(
                std::make_shared<LocalServiceProbe>(settings.local, settings.validation));
            break;
        case ProbeKind::kDirectory:
            if (settings.directory.tls && !ssl_ctx) {
                spdlog::warn("No TLS context, directory probe disabled");
                break;
            }
            probes.push_back(std::make_shared<DirectoryProbe>(settings.directory, ssl_ctx));
            break;
        case ProbeKind::kHeuristic:
            probes.push_back(std::make_shared<HeuristicProbe>(settings.heuristic,
                                                              settings.validation,
                                                              local_address));
            break;
        case ProbeKind::kBruteForce:
            probes.push_back(std::make_shared<BruteForceProbe>(settings.brute_force,
                                                               settings.validation,
                                                               local_address));
            break;
        }
    }

    spdlog::debug("{} probe(s) registered", probes.size());
    return probes;
}

} // namespace bridgefinder::core
