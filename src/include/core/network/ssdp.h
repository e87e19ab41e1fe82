#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bridgefinder::core::ssdp {

inline constexpr std::string_view kMulticastAddress = "239.255.255.250";
inline constexpr uint16_t kPort = 1900;
inline constexpr std::string_view kBasicDevice = "urn:schemas-upnp-org:device:basic:1";

std::string BuildSearchRequest(std::string_view search_target = kBasicDevice, int mx = 3);

// Unicast M-SEARCH reply or NOTIFY announcement.
struct Response {
    int status = 0;                             // 0 for NOTIFY
    std::map<std::string, std::string> headers; // keys lowercased, values trimmed

    std::optional<std::string> Header(std::string_view name) const;

    // Hue bridges add "hue-bridgeid: 001788FFFE4A2B3C" to their replies.
    std::optional<std::string> BridgeId() const { return Header("hue-bridgeid"); }

    bool LooksLikeHueBridge() const;
};

std::optional<Response> ParseResponse(std::string_view datagram);

struct Location {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";
};

// Accepts "http://host[:port][/path]".
std::optional<Location> ParseLocation(std::string_view url);

} // namespace bridgefinder::core::ssdp
