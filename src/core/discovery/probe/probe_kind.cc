#include <algorithm>
#include <core/discovery/probe/probe_kind.h>

namespace bridgefinder::core {

std::string_view ToString(ProbeKind kind) {
    switch (kind) {
    case ProbeKind::kLocal:
        return "local";
    case ProbeKind::kDirectory:
        return "directory";
    case ProbeKind::kHeuristic:
        return "heuristic";
    case ProbeKind::kBruteForce:
        return "bruteforce";
    }
    return "unknown";
}

std::optional<ProbeKind> ParseProbeKind(std::string_view name) {
    if (name == "local") {
        return ProbeKind::kLocal;
    } else if (name == "directory") {
        return ProbeKind::kDirectory;
    } else if (name == "heuristic") {
        return ProbeKind::kHeuristic;
    } else if (name == "bruteforce" || name == "brute-force") {
        return ProbeKind::kBruteForce;
    }
    return std::nullopt;
}

std::vector<ProbeKind> NormalizeProbeKinds(std::vector<ProbeKind> kinds) {
    std::sort(kinds.begin(), kinds.end());
    kinds.erase(std::unique(kinds.begin(), kinds.end()), kinds.end());
    return kinds;
}

} // namespace bridgefinder::core
