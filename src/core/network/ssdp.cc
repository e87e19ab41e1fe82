#include <algorithm>
#include <cctype>
#include <charconv>
#include <core/network/ssdp.h>

namespace bridgefinder::core::ssdp {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

std::string BuildSearchRequest(std::string_view search_target, int mx) {
    std::string request = "M-SEARCH * HTTP/1.1\r\n";
    request += "HOST: " + std::string(kMulticastAddress) + ":" + std::to_string(kPort) + "\r\n";
    request += "MAN: \"ssdp:discover\"\r\n";
    request += "MX: " + std::to_string(mx) + "\r\n";
    request += "ST: " + std::string(search_target) + "\r\n";
    request += "\r\n";
    return request;
}

std::optional<std::string> Response::Header(std::string_view name) const {
    auto it = headers.find(lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Response::LooksLikeHueBridge() const {
    if (auto id = BridgeId(); id && !id->empty()) {
        return true;
    }
    auto server = Header("server");
    return server && lower(*server).find("ipbridge") != std::string::npos;
}

std::optional<Response> ParseResponse(std::string_view datagram) {
    auto line_end = datagram.find("\r\n");
    if (line_end == std::string_view::npos) {
        return std::nullopt;
    }

    Response response;
    auto status_line = trim(datagram.substr(0, line_end));
    if (status_line.starts_with("HTTP/")) {
        auto space = status_line.find(' ');
        if (space == std::string_view::npos) {
            return std::nullopt;
        }
        auto code = trim(status_line.substr(space + 1)).substr(0, 3);
        auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), response.status);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
    } else if (!status_line.starts_with("NOTIFY")) {
        return std::nullopt;
    }

    auto rest = datagram.substr(line_end + 2);
    while (!rest.empty()) {
        auto end = rest.find("\r\n");
        auto line = rest.substr(0, end);
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 2);
        if (trim(line).empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        response.headers.insert_or_assign(lower(trim(line.substr(0, colon))),
                                          std::string(trim(line.substr(colon + 1))));
    }
    return response;
}

std::optional<Location> ParseLocation(std::string_view url) {
    constexpr std::string_view scheme = "http://";
    if (url.size() <= scheme.size() || lower(url.substr(0, scheme.size())) != scheme) {
        return std::nullopt;
    }
    url.remove_prefix(scheme.size());

    Location location;
    auto slash = url.find('/');
    auto authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        location.target = std::string(url.substr(slash));
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port = authority.substr(colon + 1);
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), location.port);
        if (ec != std::errc{} || ptr != port.data() + port.size()) {
            return std::nullopt;
        }
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    location.host = std::string(authority);
    return location;
}

} // namespace bridgefinder::core::ssdp
