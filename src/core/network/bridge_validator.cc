#include <algorithm>
#include <cctype>
#include <core/discovery/discovery_probe.h>
#include <core/network/bridge_validator.h>
#include <core/network/http_client.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace bridgefinder::core {

namespace {

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

// Text between <tag> and </tag>, tag matched case-insensitively.
std::optional<std::string> elementText(std::string_view xml,
                                       std::string_view lower_xml,
                                       std::string_view tag) {
    std::string open = "<" + toLower(tag) + ">";
    std::string close = "</" + toLower(tag) + ">";
    auto start = lower_xml.find(open);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    start += open.size();
    auto end = lower_xml.find(close, start);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return trim(xml.substr(start, end - start));
}

bool isHueDescription(std::string_view lower_xml) {
    for (std::string_view marker : {"philips hue", "royal philips", "ipbridge", "signify"}) {
        if (lower_xml.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

std::optional<CandidateRecord> ParseBridgeConfig(std::string_view body,
                                                 std::string_view address,
                                                 uint16_t port) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    if (!json.contains("bridgeid") || !json["bridgeid"].is_string()) {
        return std::nullopt;
    }
    auto bridge_id = json["bridgeid"].get<std::string>();
    if (bridge_id.empty()) {
        return std::nullopt;
    }

    if (json.contains("modelid") && json["modelid"].is_string()) {
        auto model = toLower(json["modelid"].get<std::string>());
        if (model.find("hue") == std::string::npos && model.find("bsb") == std::string::npos) {
            spdlog::debug("{} reports model {}, not a Hue bridge", address, model);
            return std::nullopt;
        }
    }

    std::string name(kDefaultBridgeName);
    if (json.contains("name") && json["name"].is_string()
        && !json["name"].get<std::string>().empty()) {
        name = json["name"].get<std::string>();
    }
    return CandidateRecord::Make(bridge_id, address, port, std::move(name));
}

std::optional<CandidateRecord> ParseDescriptionXml(std::string_view body,
                                                   std::string_view address,
                                                   uint16_t port) {
    if (body.empty()) {
        return std::nullopt;
    }
    auto lower = toLower(body);
    if (!isHueDescription(lower)) {
        return std::nullopt;
    }

    std::string id;
    if (auto serial = elementText(body, lower, "serialNumber"); serial && !serial->empty()) {
        id = *serial;
    } else if (auto udn = elementText(body, lower, "UDN");
               udn && udn->starts_with("uuid:") && udn->size() >= 12 + 5) {
        id = udn->substr(udn->size() - 12);
    } else {
        id = "unknown_" + std::string(address);
        std::replace(id.begin(), id.end(), '.', '_');
    }

    std::string name(kDefaultBridgeName);
    for (std::string_view tag : {"friendlyName", "modelDescription"}) {
        if (auto text = elementText(body, lower, tag); text && !text->empty()) {
            name = *text;
            break;
        }
    }

    return CandidateRecord::Make(id, address, port, std::move(name));
}

BridgeValidator::BridgeValidator(ValidationOptions options)
    : options_(std::move(options)) {}

net::awaitable<std::optional<CandidateRecord>> BridgeValidator::Validate(std::string address,
                                                                         StopSignal stop) const {
    for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
        if (stop.StopRequested()) {
            co_return std::optional<CandidateRecord>{};
        }
        if (attempt > 1 && !co_await SleepFor(options_.retry_delay, stop)) {
            co_return std::optional<CandidateRecord>{};
        }

        auto record = co_await checkOnce(address, stop);
        if (record) {
            spdlog::info("Bridge {} confirmed at {}", record->id, address);
            co_return record;
        }
    }
    co_return std::optional<CandidateRecord>{};
}

net::awaitable<std::optional<CandidateRecord>> BridgeValidator::checkOnce(
    const std::string& address, StopSignal stop) const {
    auto config = co_await HttpGet(address,
                                   options_.port,
                                   "/api/0/config",
                                   "application/json",
                                   options_.config_timeout,
                                   stop);
    if (config && config->result() == http::status::ok) {
        if (auto record = ParseBridgeConfig(config->body(), address, options_.port)) {
            co_return record;
        }
        spdlog::debug("{} answered /api/0/config without a bridge id", address);
    }

    if (stop.StopRequested()) {
        co_return std::optional<CandidateRecord>{};
    }

    auto description = co_await HttpGet(address,
                                        options_.port,
                                        "/description.xml",
                                        "text/xml",
                                        options_.xml_timeout,
                                        stop);
    if (description && description->result() == http::status::ok) {
        co_return ParseDescriptionXml(description->body(), address, options_.port);
    }
    co_return std::optional<CandidateRecord>{};
}

} // namespace bridgefinder::core
