#pragma once

#include <string>

namespace QD::Web {

// IPv4 address of the interface that routes to the outside world, found by
// connecting a UDP socket (no packet is sent). Falls back to 127.0.0.1.
auto DiscoverLocalAddress() -> std::string;

// http://<address>:<port>
auto MakeShareUrl(std::string const& address, int port) -> std::string;

} // namespace QD::Web
