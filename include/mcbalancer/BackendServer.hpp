#ifndef MCBALANCER_BACKENDSERVER_HPP
#define MCBALANCER_BACKENDSERVER_HPP

#include <string>

#include "impl/Utils.hpp"

namespace mcbalancer {

struct BackendServer {
	static constexpr port_t DEFAULT_PORT{25565};

	std::string name{};  // Optional label, only used for logging
	std::string address{};
	// Used when `address` has no explicit port and no SRV record exists
	port_t default_port{DEFAULT_PORT};

	// Backends are identified by their address alone
	bool operator==(const BackendServer& other) const {
		return address == other.address;
	}

	[[nodiscard]] std::string to_string() const {
		return name.empty() ? address : name + " (" + address + ")";
	}
};

}  // namespace mcbalancer

#endif  // MCBALANCER_BACKENDSERVER_HPP
