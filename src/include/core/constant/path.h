#pragma once

#include <cstdlib>
#include <filesystem>

namespace bridgefinder::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    return std::filesystem::temp_directory_path();
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path()
                                             / "BridgeFinder" / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(__APPLE__)
    kHomeDir / "Library" / "Application Support" / "BridgeFinder";
#else
    kHomeDir / ".config" / "BridgeFinder";
#endif

inline const std::filesystem::path kConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace bridgefinder::core
