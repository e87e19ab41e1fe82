/*
    mdns.h
    Minimal DNS message codec for one-shot multicast DNS service queries
    (RFC 6762 / RFC 6763). Only what a PTR browse needs is decoded: A, PTR,
    SRV and TXT records. Everything else is skipped.
*/
#pragma once

#include <boost/asio/ip/address_v4.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bridgefinder::core::mdns {

inline constexpr std::string_view kMulticastAddress = "224.0.0.251";
inline constexpr uint16_t kPort = 5353;
inline constexpr std::string_view kHueService = "_hue._tcp.local";

enum RecordType : uint16_t {
    kA = 1,
    kPtr = 12,
    kTxt = 16,
    kSrv = 33,
};

struct ResourceRecord {
    std::string name;
    uint16_t type = 0;
    uint32_t ttl = 0;

    std::string target;                                  // PTR, SRV
    uint16_t port = 0;                                   // SRV
    std::vector<std::string> text;                       // TXT
    std::optional<boost::asio::ip::address_v4> address; // A
};

struct Message {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<ResourceRecord> records; // answer, authority and additional sections

    bool IsResponse() const { return (flags & 0x8000) != 0; }
};

// One resolved service instance of a browse.
struct ServiceInstance {
    std::string instance_name; // "Philips Hue - 4A2B3C._hue._tcp.local"
    std::string host;          // SRV target
    uint16_t port = 0;
    std::map<std::string, std::string> txt; // keys lowercased
    std::optional<boost::asio::ip::address_v4> address;

    // Instance name without the service suffix.
    std::string Label(std::string_view service) const;
};

// Query for PTR records of `service` with the unicast-response bit set.
std::vector<uint8_t> BuildPtrQuery(std::string_view service, uint16_t id = 0);

std::optional<Message> Parse(std::span<const uint8_t> packet);

// Joins PTR, SRV, TXT and A records of `message` into service instances.
std::vector<ServiceInstance> ResolveInstances(const Message& message, std::string_view service);

} // namespace bridgefinder::core::mdns
