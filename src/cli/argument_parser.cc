#include <algorithm>
#include <cctype>
#include <cli/argument_parser.h>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace bridgefinder {

namespace {

constexpr std::chrono::seconds kMaxTimeout = std::chrono::hours(24);

} // namespace

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];
        if (arg.empty() || arg[0] != '-') {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
        parseOption(arg, options);
        i++;
    }

    validateOptions(options);
    return options;
}

std::string ArgumentParser::nextValue(const std::string& arg) {
    if (++i >= argc_) {
        throw std::invalid_argument("Missing value for " + arg);
    }
    return argv_[i];
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    if (arg == "-t" || arg == "--timeout") {
        auto value = nextValue(arg);
        std::size_t consumed = 0;
        long seconds = 0;
        try {
            seconds = std::stol(value, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid timeout: " + value);
        }
        if (consumed != value.size()) {
            throw std::invalid_argument("Invalid timeout: " + value);
        }
        options.timeout = std::chrono::seconds(seconds);
    } else if (arg == "-c" || arg == "--config") {
        options.config_path = nextValue(arg);
    } else if (arg == "-l" || arg == "--log-level") {
        auto level = nextValue(arg);
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        options.log_level = level;
    } else if (arg == "-p" || arg == "--probes") {
        options.probes = parseProbeList(nextValue(arg));
    } else if (arg == "-j" || arg == "--json") {
        options.json = true;
    } else if (arg == "-h" || arg == "--help") {
        options.help = true;
    } else {
        throw std::invalid_argument("Unknown option: " + arg);
    }
}

std::vector<core::ProbeKind> ArgumentParser::parseProbeList(const std::string& list) {
    std::vector<core::ProbeKind> kinds;
    std::stringstream stream(list);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (name.empty()) {
            continue;
        }
        auto kind = core::ParseProbeKind(name);
        if (!kind) {
            throw std::invalid_argument("Unknown probe: " + name);
        }
        kinds.push_back(*kind);
    }
    if (kinds.empty()) {
        throw std::invalid_argument("No probe given");
    }
    return core::NormalizeProbeKinds(std::move(kinds));
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.timeout && (options.timeout->count() <= 0 || *options.timeout > kMaxTimeout)) {
        throw std::invalid_argument("Timeout must be between 1 and 86400 seconds");
    }

    if (options.log_level) {
        const auto& level = *options.log_level;
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            throw std::invalid_argument("Invalid log level: " + level);
        }
    }
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: bridgefinder [options]\n\n"
              << "Searches the local network for Hue bridges and prints what it found.\n\n"
              << "Options:\n"
              << "  -t, --timeout SECONDS  Overall time budget (default: 40)\n"
              << "  -c, --config PATH      Config file path\n"
              << "  -l, --log-level LVL    Log level (debug|info|warning|error)\n"
              << "  -p, --probes LIST      Comma separated subset of\n"
              << "                         local,directory,heuristic,bruteforce\n"
              << "  -j, --json             Print the result as JSON\n"
              << "  -h, --help             Show this help message\n\n"
              << "Exit status: 0 when a bridge was found, 1 when none, 2 on usage errors.\n";
}

} // namespace bridgefinder
