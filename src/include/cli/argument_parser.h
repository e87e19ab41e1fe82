#pragma once

#include <chrono>
#include <core/discovery/probe/probe_kind.h>
#include <optional>
#include <string>
#include <vector>

namespace bridgefinder {

struct CliOptions {
    std::optional<std::chrono::seconds> timeout;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::vector<core::ProbeKind>> probes;
    bool json = false;
    bool help = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // Throws std::invalid_argument on unknown options or bad values.
    CliOptions Parse();

    static void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i; // index of the argument being parsed

    void parseOption(const std::string& arg, CliOptions& options);
    std::string nextValue(const std::string& arg);

    static std::vector<core::ProbeKind> parseProbeList(const std::string& list);
    static void validateOptions(const CliOptions& options);
};

} // namespace bridgefinder
