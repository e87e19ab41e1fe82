#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/discovery/cancellation_controller.h>
#include <core/model/candidate_record.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bridgefinder::core {

inline constexpr std::string_view kDefaultBridgeName = "Philips Hue Bridge";

struct ValidationOptions {
    std::chrono::milliseconds config_timeout{4000};
    std::chrono::milliseconds xml_timeout{3000};
    int attempts = 2;
    std::chrono::milliseconds retry_delay{500};
    uint16_t port = 80;
};

// Body of GET /api/0/config. A bridge answers this without a user name.
std::optional<CandidateRecord> ParseBridgeConfig(std::string_view body,
                                                 std::string_view address,
                                                 uint16_t port = 80);

// Body of GET /description.xml (UPnP device description).
std::optional<CandidateRecord> ParseDescriptionXml(std::string_view body,
                                                   std::string_view address,
                                                   uint16_t port = 80);

// Confirms that an address hosts a Hue bridge and reads its identity.
class BridgeValidator {
public:
    explicit BridgeValidator(ValidationOptions options = {});

    // std::nullopt when the address is not a bridge, does not answer, or
    // `stop` fired.
    boost::asio::awaitable<std::optional<CandidateRecord>> Validate(std::string address,
                                                                    StopSignal stop) const;

    const ValidationOptions& options() const { return options_; }

private:
    boost::asio::awaitable<std::optional<CandidateRecord>> checkOnce(const std::string& address,
                                                                     StopSignal stop) const;

    ValidationOptions options_;
};

} // namespace bridgefinder::core
