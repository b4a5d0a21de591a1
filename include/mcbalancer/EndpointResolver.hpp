#ifndef MCBALANCER_ENDPOINTRESOLVER_HPP
#define MCBALANCER_ENDPOINTRESOLVER_HPP

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "impl/SrvResolver.hpp"
#include "impl/Utils.hpp"

namespace mcbalancer {

struct ResolvedEndpoint {
	// Literal address, or the SRV target host name when the port came from an SRV record
	std::string ip{};
	port_t port{};
	std::string original_input{};
	std::string resolved_host{};
};

class EndpointError : public std::runtime_error {
public:
	enum class Kind {
		InvalidHostPort,
		NoAddress,
		NoSrvAndNoFallback,
		Lookup,
	};

	EndpointError(Kind kind, const std::string& message);

	[[nodiscard]] Kind kind() const noexcept;

private:
	Kind error_kind;
};

/**
 * Turns user supplied addresses (`host`, `host:port`, `[v6]:port`, bare IPv6 literals) into an IP and port.
 *
 * Without an explicit port, host names are looked up as `_{service}._{proto}.{host}` SRV records first and fall
 * back to a plain address lookup with `fallback_port`.
 */
class EndpointResolver {
public:
	EndpointResolver() = default;
	// Blocking lookups of async_resolve() are run on `blocking_executor`, usually a thread pool
	explicit EndpointResolver(boost::asio::any_io_executor blocking_executor);
	virtual ~EndpointResolver() = default;

	[[nodiscard]] ResolvedEndpoint resolve(std::string_view input, std::string_view service, std::string_view proto,
	                                       port_t fallback_port) const;

	[[nodiscard]] boost::asio::awaitable<ResolvedEndpoint> async_resolve(std::string input, std::string service,
	                                                                     std::string proto,
	                                                                     port_t fallback_port) const;

	// std::nullopt when `input` carries no explicit port
	[[nodiscard]] static std::optional<std::pair<std::string_view, port_t>> split_host_port(std::string_view input);

protected:
	[[nodiscard]] virtual std::vector<boost::asio::ip::address> lookup_host(const std::string& host) const;
	[[nodiscard]] virtual _impl::records_t lookup_srv(std::string_view service, std::string_view proto,
	                                                  std::string_view domain) const;

private:
	std::optional<boost::asio::any_io_executor> blocking_executor{};

	[[nodiscard]] ResolvedEndpoint first_address(std::string_view input, const std::string& host, port_t port) const;
};

}  // namespace mcbalancer

#endif  // MCBALANCER_ENDPOINTRESOLVER_HPP
