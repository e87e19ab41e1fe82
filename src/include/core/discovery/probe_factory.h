#pragma once

#include <boost/asio/ssl/context.hpp>
#include <core/discovery/discovery_probe.h>
#include <core/network/address_plan.h>
#include <core/util/config.h>
#include <memory>

namespace bridgefinder::core {

// Instantiates the probes enabled in `settings`, in priority order.
// `ssl_ctx` is only used by the directory probe.
ProbeList BuildProbes(const Settings& settings,
                      std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                      LocalAddressProvider local_address);

} // namespace bridgefinder::core
