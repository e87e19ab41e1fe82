/*
    config.h
    Application configuration stored as a TOML file.

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = bridgefinder::core::config["section"]["key"].value_or(default_value);

    Application settings:
    - Read a setting:
        auto timeout = bridgefinder::core::settings.timeout;
        auto probes = bridgefinder::core::settings.probes;
        auto subnets = bridgefinder::core::settings.brute_force.subnets;
    - Write a setting:
        bridgefinder::core::settings.heuristic.addresses.push_back("192.168.2.20");

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        bridgefinder::core::InitConfig();
    - Save the current configuration to file:
        bridgefinder::core::SaveConfig();
*/

#pragma once

#include <chrono>
#include <core/constant/path.h>
#include <core/discovery/probe/brute_force_probe.h>
#include <core/discovery/probe/directory_probe.h>
#include <core/discovery/probe/heuristic_probe.h>
#include <core/discovery/probe/local_service_probe.h>
#include <core/discovery/probe/probe_kind.h>
#include <core/network/bridge_validator.h>
#include <filesystem>
#include <string>
#include <toml++/toml.h>
#include <vector>

namespace bridgefinder::core {

inline toml::table config;

struct Settings {
    std::chrono::milliseconds timeout{40000}; // whole discovery
    std::vector<ProbeKind> probes{std::begin(kAllProbes), std::end(kAllProbes)};
    LocalServiceOptions local;
    DirectoryOptions directory;
    HeuristicOptions heuristic;
    BruteForceOptions brute_force;
    ValidationOptions validation;
    std::string log_level = "info";
};

inline Settings settings;

// Reads settings out of `table`. Missing or invalid values keep their
// defaults; invalid ones are logged.
Settings LoadSettings(const toml::table& table);

toml::table SettingsToTable(const Settings& value);

void InitConfig(const std::filesystem::path& file = path::kConfigFile);

void SaveConfig();

} // namespace bridgefinder::core
