#include <core/util/config.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace bridgefinder::core {

namespace {

using ConstView = toml::node_view<const toml::node>;

constexpr int64_t kMaxTimeoutSeconds = 24 * 60 * 60;

std::filesystem::path config_file = path::kConfigFile;

void readMilliseconds(ConstView node, std::chrono::milliseconds& out, std::string_view key) {
    if (!node) {
        return;
    }
    auto value = node.value<int64_t>();
    if (!value || *value <= 0) {
        spdlog::warn("Ignoring invalid value for \"{}\"", key);
        return;
    }
    out = std::chrono::milliseconds(*value);
}

template<typename T>
void readCount(ConstView node, T& out, int64_t min, int64_t max, std::string_view key) {
    if (!node) {
        return;
    }
    auto value = node.value<int64_t>();
    if (!value || *value < min || *value > max) {
        spdlog::warn("Ignoring invalid value for \"{}\"", key);
        return;
    }
    out = static_cast<T>(*value);
}

void readBool(ConstView node, bool& out, std::string_view key) {
    if (!node) {
        return;
    }
    if (auto value = node.value<bool>()) {
        out = *value;
    } else {
        spdlog::warn("Ignoring invalid value for \"{}\"", key);
    }
}

void readString(ConstView node, std::string& out, std::string_view key) {
    if (!node) {
        return;
    }
    auto value = node.value<std::string>();
    if (!value || value->empty()) {
        spdlog::warn("Ignoring invalid value for \"{}\"", key);
        return;
    }
    out = *value;
}

std::optional<std::vector<std::string>> readStrings(ConstView node, std::string_view key) {
    if (!node) {
        return std::nullopt;
    }
    const auto* array = node.as_array();
    if (!array) {
        spdlog::warn("Ignoring \"{}\": expected an array of strings", key);
        return std::nullopt;
    }
    std::vector<std::string> values;
    for (const auto& element : *array) {
        if (auto text = element.value<std::string>()) {
            values.push_back(*text);
        } else {
            spdlog::warn("Ignoring a non-string element of \"{}\"", key);
        }
    }
    return values;
}

int64_t toInteger(std::chrono::milliseconds value) {
    return static_cast<int64_t>(value.count());
}

} // namespace

Settings LoadSettings(const toml::table& table) {
    Settings result;

    auto discovery = table["discovery"];
    auto timeout_seconds = std::chrono::duration_cast<std::chrono::seconds>(result.timeout).count();
    readCount(discovery["timeout"], timeout_seconds, 1, kMaxTimeoutSeconds, "discovery.timeout");
    result.timeout = std::chrono::seconds(timeout_seconds);
    if (auto names = readStrings(discovery["probes"], "discovery.probes")) {
        std::vector<ProbeKind> kinds;
        for (const auto& name : *names) {
            if (auto kind = ParseProbeKind(name)) {
                kinds.push_back(*kind);
            } else {
                spdlog::warn("Unknown probe \"{}\" in configuration", name);
            }
        }
        if (kinds.empty()) {
            spdlog::warn("No usable probe configured, keeping all of them");
        } else {
            result.probes = NormalizeProbeKinds(std::move(kinds));
        }
    }

    auto local = table["local"];
    readBool(local["mdns"], result.local.mdns, "local.mdns");
    readBool(local["ssdp"], result.local.ssdp, "local.ssdp");
    readMilliseconds(local["window-ms"], result.local.window, "local.window-ms");
    readMilliseconds(local["settle-ms"], result.local.settle, "local.settle-ms");

    auto directory = table["directory"];
    readString(directory["host"], result.directory.host, "directory.host");
    readCount(directory["port"], result.directory.port, 1, 65535, "directory.port");
    readString(directory["target"], result.directory.target, "directory.target");
    readBool(directory["tls"], result.directory.tls, "directory.tls");
    readCount(directory["attempts"], result.directory.attempts, 1, 10, "directory.attempts");
    readMilliseconds(directory["request-timeout-ms"],
                     result.directory.request_timeout,
                     "directory.request-timeout-ms");
    readMilliseconds(directory["retry-backoff-ms"],
                     result.directory.retry_backoff,
                     "directory.retry-backoff-ms");
    readMilliseconds(directory["deadline-ms"], result.directory.deadline, "directory.deadline-ms");

    auto heuristic = table["heuristic"];
    if (auto addresses = readStrings(heuristic["addresses"], "heuristic.addresses")) {
        result.heuristic.addresses = std::move(*addresses);
    }
    readCount(heuristic["concurrency"],
              result.heuristic.concurrency,
              1,
              256,
              "heuristic.concurrency");
    readMilliseconds(heuristic["deadline-ms"], result.heuristic.deadline, "heuristic.deadline-ms");

    auto brute_force = table["brute-force"];
    if (auto subnets = readStrings(brute_force["subnets"], "brute-force.subnets")) {
        result.brute_force.subnets.clear();
        for (const auto& cidr : *subnets) {
            if (auto network = ParseSubnet(cidr)) {
                result.brute_force.subnets.push_back(*network);
            } else {
                spdlog::warn("Ignoring invalid subnet \"{}\"", cidr);
            }
        }
    }
    readCount(brute_force["concurrency"],
              result.brute_force.concurrency,
              1,
              1024,
              "brute-force.concurrency");
    readMilliseconds(brute_force["deadline-ms"],
                     result.brute_force.deadline,
                     "brute-force.deadline-ms");

    auto validation = table["validation"];
    readMilliseconds(validation["config-timeout-ms"],
                     result.validation.config_timeout,
                     "validation.config-timeout-ms");
    readMilliseconds(validation["xml-timeout-ms"],
                     result.validation.xml_timeout,
                     "validation.xml-timeout-ms");
    readCount(validation["attempts"], result.validation.attempts, 1, 10, "validation.attempts");

    readString(table["log"]["level"], result.log_level, "log.level");

    return result;
}

toml::table SettingsToTable(const Settings& value) {
    toml::array probes;
    for (auto kind : value.probes) {
        probes.push_back(std::string(ToString(kind)));
    }
    toml::array addresses;
    for (const auto& address : value.heuristic.addresses) {
        addresses.push_back(address);
    }
    toml::array subnets;
    for (const auto& subnet : value.brute_force.subnets) {
        subnets.push_back(subnet.to_string());
    }

    return toml::table{
        {"discovery",
         toml::table{
             {"timeout",
              static_cast<int64_t>(
                  std::chrono::duration_cast<std::chrono::seconds>(value.timeout).count())},
             {"probes", probes},
         }},
        {"local",
         toml::table{
             {"mdns", value.local.mdns},
             {"ssdp", value.local.ssdp},
             {"window-ms", toInteger(value.local.window)},
             {"settle-ms", toInteger(value.local.settle)},
         }},
        {"directory",
         toml::table{
             {"host", value.directory.host},
             {"port", static_cast<int64_t>(value.directory.port)},
             {"target", value.directory.target},
             {"tls", value.directory.tls},
             {"attempts", static_cast<int64_t>(value.directory.attempts)},
             {"request-timeout-ms", toInteger(value.directory.request_timeout)},
             {"retry-backoff-ms", toInteger(value.directory.retry_backoff)},
             {"deadline-ms", toInteger(value.directory.deadline)},
         }},
        {"heuristic",
         toml::table{
             {"addresses", addresses},
             {"concurrency", static_cast<int64_t>(value.heuristic.concurrency)},
             {"deadline-ms", toInteger(value.heuristic.deadline)},
         }},
        {"brute-force",
         toml::table{
             {"subnets", subnets},
             {"concurrency", static_cast<int64_t>(value.brute_force.concurrency)},
             {"deadline-ms", toInteger(value.brute_force.deadline)},
         }},
        {"validation",
         toml::table{
             {"config-timeout-ms", toInteger(value.validation.config_timeout)},
             {"xml-timeout-ms", toInteger(value.validation.xml_timeout)},
             {"attempts", static_cast<int64_t>(value.validation.attempts)},
         }},
        {"log",
         toml::table{
             {"level", value.log_level},
         }},
    };
}

void InitConfig(const std::filesystem::path& file) {
    config_file = file;

    std::error_code ec;
    if (file.has_parent_path() && !std::filesystem::exists(file.parent_path(), ec)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", file.parent_path().string(), ec.message());
        }
    }

    bool created = false;
    if (!std::filesystem::exists(file, ec)) {
        spdlog::info("Config file does not exist, creating...");
        std::ofstream ofs(file);
        created = ofs.is_open();
    }

    try {
        config = toml::parse_file(file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", file.string(), err.description());
        config = toml::table{};
    }

    settings = LoadSettings(config);

    if (created) {
        SaveConfig();
    }
}

void SaveConfig() {
    std::ofstream ofs(config_file);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", config_file.string());
        return;
    }

    auto fresh = SettingsToTable(settings);
    for (auto&& [key, value] : fresh) {
        if (auto* section = value.as_table()) {
            config.insert_or_assign(std::string(key), *section);
        }
    }
    ofs << config;
}

} // namespace bridgefinder::core
