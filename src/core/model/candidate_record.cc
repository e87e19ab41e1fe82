#include <algorithm>
#include <cctype>
#include <core/model/candidate_record.h>
#include <unordered_set>

namespace bridgefinder::core {

CandidateRecord CandidateRecord::Make(std::string_view id,
                                      std::string_view address,
                                      std::optional<uint16_t> port,
                                      std::optional<std::string> display_name) {
    CandidateRecord record;
    record.id = std::string(id);
    record.normalized_id = NormalizeId(id);
    record.display_name = std::move(display_name);
    record.address = std::string(address);
    record.port = port;
    return record;
}

std::string CandidateRecord::NormalizeId(std::string_view id) {
    std::string normalized;
    normalized.reserve(id.size());
    for (unsigned char c : id) {
        if (std::isalnum(c)) {
            normalized.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return normalized;
}

std::string CandidateRecord::MergeKey() const {
    if (!normalized_id.empty()) {
        return normalized_id;
    }
    return "@" + address;
}

std::vector<CandidateRecord> Deduplicate(std::vector<CandidateRecord> records) {
    std::vector<CandidateRecord> merged;
    merged.reserve(records.size());
    std::unordered_set<std::string> seen;

    for (auto& record : records) {
        if (record.normalized_id.empty()) {
            record.normalized_id = CandidateRecord::NormalizeId(record.id);
        }
        if (seen.insert(record.MergeKey()).second) {
            merged.push_back(std::move(record));
        }
    }
    return merged;
}

void to_json(nlohmann::json& j, const CandidateRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"normalized_id", record.normalized_id},
        {"address", record.address},
    };
    if (record.display_name) {
        j["name"] = *record.display_name;
    }
    if (record.port) {
        j["port"] = *record.port;
    }
}

void from_json(const nlohmann::json& j, CandidateRecord& record) {
    j.at("id").get_to(record.id);
    j.at("address").get_to(record.address);
    record.normalized_id = j.value("normalized_id", CandidateRecord::NormalizeId(record.id));
    if (j.contains("name") && j["name"].is_string()) {
        record.display_name = j["name"].get<std::string>();
    } else {
        record.display_name.reset();
    }
    if (j.contains("port") && j["port"].is_number_unsigned()) {
        record.port = j["port"].get<uint16_t>();
    } else {
        record.port.reset();
    }
}

} // namespace bridgefinder::core
