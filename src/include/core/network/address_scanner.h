#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <core/discovery/cancellation_controller.h>
#include <core/model/candidate_record.h>
#include <core/network/bridge_validator.h>
#include <cstddef>
#include <string>
#include <vector>

namespace bridgefinder::core {

// Runs a BridgeValidator over a list of addresses with bounded concurrency.
class AddressScanner {
public:
    AddressScanner(const BridgeValidator& validator, std::size_t concurrency);

    // Returns once every address was checked or `stop` fired and the
    // in-flight checks unwound. Bridges confirmed before that are returned
    // in the order they were confirmed.
    boost::asio::awaitable<std::vector<CandidateRecord>> Scan(std::vector<std::string> addresses,
                                                              StopSignal stop) const;

private:
    const BridgeValidator& validator_;
    std::size_t concurrency_;
};

} // namespace bridgefinder::core
