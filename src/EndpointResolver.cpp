#include "mcbalancer/EndpointResolver.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer {

namespace {

std::optional<boost::asio::ip::address> parse_ip(std::string_view text) {
	boost::system::error_code ec;
	const boost::asio::ip::address address = boost::asio::ip::make_address(std::string{text}, ec);

	if (ec.failed()) {
		return std::nullopt;
	}

	return address;
}

}  // namespace

EndpointError::EndpointError(Kind kind, const std::string& message) : std::runtime_error{message}, error_kind{kind} {}

EndpointError::Kind EndpointError::kind() const noexcept {
	return error_kind;
}

EndpointResolver::EndpointResolver(boost::asio::any_io_executor blocking_executor)
    : blocking_executor{std::move(blocking_executor)} {}

ResolvedEndpoint EndpointResolver::resolve(std::string_view input, std::string_view service, std::string_view proto,
                                           port_t fallback_port) const {
	if (const auto host_port = split_host_port(input)) {
		const auto [host, port] = *host_port;

		if (const auto ip = parse_ip(host)) {
			return ResolvedEndpoint{ip->to_string(), port, std::string{input}, std::string{host}};
		}

		return first_address(input, std::string{_impl::strip_trailing_dot(host)}, port);
	}

	std::string_view host = _impl::strip_trailing_dot(_impl::trim(input));
	if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
		host = host.substr(1, host.size() - 2);
	}

	if (const auto ip = parse_ip(host)) {
		return ResolvedEndpoint{ip->to_string(), fallback_port, std::string{input}, std::string{host}};
	}

	if (!_impl::contains_alpha(host)) {
		throw EndpointError{EndpointError::Kind::NoSrvAndNoFallback,
		                    "SRV lookup failed and no fallback available for \"" + std::string{input} + "\""};
	}

	try {
		const _impl::records_t records = lookup_srv(service, proto, host);

		if (!records.empty()) {
			const _impl::SrvRecord& record = _impl::pick_record(records);
			const std::string target{_impl::strip_trailing_dot(record.target)};

			MCBALANCER_LOG_DEBUG("SRV record for {} points to {}:{}", host, target, record.port);
			return ResolvedEndpoint{target, record.port, std::string{input}, target};
		}
	} catch (const std::runtime_error& e) {
		// No SRV records found, continue with normal DNS lookup
		MCBALANCER_LOG_DEBUG("No SRV record for {}: {}", host, e.what());
	}

	return first_address(input, std::string{host}, fallback_port);
}

boost::asio::awaitable<ResolvedEndpoint> EndpointResolver::async_resolve(std::string input, std::string service,
                                                                         std::string proto,
                                                                         port_t fallback_port) const {
	if (!blocking_executor) {
		co_return resolve(input, service, proto, fallback_port);
	}

	co_return co_await boost::asio::co_spawn(
	    *blocking_executor,
	    [this, input = std::move(input), service = std::move(service), proto = std::move(proto),
	     fallback_port]() -> boost::asio::awaitable<ResolvedEndpoint> {
		    co_return resolve(input, service, proto, fallback_port);
	    },
	    boost::asio::use_awaitable);
}

std::optional<std::pair<std::string_view, port_t>> EndpointResolver::split_host_port(std::string_view input) {
	const auto invalid = [input]() {
		return EndpointError{EndpointError::Kind::InvalidHostPort,
		                     "Invalid host:port format \"" + std::string{input} + "\""};
	};

	if (input.starts_with('[')) {
		const auto end = input.find(']');
		if (end == std::string_view::npos) {
			throw invalid();
		}

		const std::string_view host = input.substr(1, end - 1);
		if (end + 1 == input.size()) {
			return std::nullopt;
		}
		if (host.empty() || input[end + 1] != ':') {
			throw invalid();
		}

		const auto port = _impl::parse_port(input.substr(end + 2));
		if (!port) {
			throw invalid();
		}

		return std::make_pair(host, *port);
	}

	// Brackets are only valid around a leading IPv6 literal
	if (input.find_first_of("[]") != std::string_view::npos) {
		throw invalid();
	}

	const auto colon_count = std::count(input.begin(), input.end(), ':');
	if (colon_count == 0) {
		return std::nullopt;
	}
	if (colon_count > 1 && parse_ip(input)) {
		return std::nullopt;  // IPv6 literal without brackets
	}

	const auto colon = input.rfind(':');
	const std::string_view host = input.substr(0, colon);
	const std::string_view port_string = input.substr(colon + 1);
	if (host.empty() || port_string.empty()) {
		throw invalid();
	}

	const auto port = _impl::parse_port(port_string);
	if (!port) {
		throw invalid();
	}

	return std::make_pair(host, *port);
}

std::vector<boost::asio::ip::address> EndpointResolver::lookup_host(const std::string& host) const {
	boost::system::error_code ec;
	boost::asio::io_context io_context;
	boost::asio::ip::tcp::resolver resolver(io_context);

	const auto results = resolver.resolve(host, std::string{}, ec);

	if (ec.failed()) {
		throw EndpointError{EndpointError::Kind::Lookup,
		                    "Failed to resolve host \"" + host + "\": " + ec.message()};
	}

	std::vector<boost::asio::ip::address> addresses;
	for (const auto& entry : results) {
		addresses.push_back(entry.endpoint().address());
	}

	return addresses;
}

_impl::records_t EndpointResolver::lookup_srv(std::string_view service, std::string_view proto,
                                              std::string_view domain) const {
	return _impl::resolve_srv(service, proto, domain);
}

ResolvedEndpoint EndpointResolver::first_address(std::string_view input, const std::string& host, port_t port) const {
	const std::vector<boost::asio::ip::address> addresses = lookup_host(host);

	if (addresses.empty()) {
		throw EndpointError{EndpointError::Kind::NoAddress, "No A/AAAA records found for " + host};
	}

	return ResolvedEndpoint{addresses.front().to_string(), port, std::string{input}, host};
}

}  // namespace mcbalancer
