#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

// One device reported by a probe. Immutable once a probe hands it over,
// except for normalized_id which is filled in at merge time.
struct CandidateRecord {
    std::string id;                          // as reported by the network
    std::string normalized_id;               // deduplication key
    std::optional<std::string> display_name; // human readable name
    std::string address;                     // IPv4 address
    std::optional<uint16_t> port;

    static CandidateRecord Make(std::string_view id,
                                std::string_view address,
                                std::optional<uint16_t> port = std::nullopt,
                                std::optional<std::string> display_name = std::nullopt);

    // Uppercase, everything except [A-Z0-9] removed.
    static std::string NormalizeId(std::string_view id);

    // Key used for merging: normalized_id, or the address when the id is unusable.
    std::string MergeKey() const;

    bool operator==(const CandidateRecord&) const = default;
};

// Merges records referring to the same device. Order is preserved and the
// first record seen for a key wins.
std::vector<CandidateRecord> Deduplicate(std::vector<CandidateRecord> records);

void to_json(nlohmann::json& j, const CandidateRecord& record);
void from_json(const nlohmann::json& j, CandidateRecord& record);

} // namespace bridgefinder::core
