#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

// Declared in priority order.
enum class ProbeKind {
    kLocal,
    kDirectory,
    kHeuristic,
    kBruteForce,
};

inline constexpr ProbeKind kAllProbes[] = {
    ProbeKind::kLocal,
    ProbeKind::kDirectory,
    ProbeKind::kHeuristic,
    ProbeKind::kBruteForce,
};

std::string_view ToString(ProbeKind kind);

// "local", "directory", "heuristic", "bruteforce" (also "brute-force").
std::optional<ProbeKind> ParseProbeKind(std::string_view name);

// Sorts into priority order and drops duplicates.
std::vector<ProbeKind> NormalizeProbeKinds(std::vector<ProbeKind> kinds);

} // namespace bridgefinder::core
