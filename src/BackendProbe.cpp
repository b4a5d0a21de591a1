#include "mcbalancer/BackendProbe.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/json.hpp>
#include <limits>
#include <stdexcept>
#include <string>

#include "mcbalancer/Logger.hpp"
#include "mcbalancer/McPacket.hpp"
#include "mcbalancer/Packets.hpp"
#include "mcbalancer/impl/Timeout.hpp"

namespace mcbalancer {

JavaBackendProbe::JavaBackendProbe(std::shared_ptr<const EndpointResolver> resolver) : resolver{std::move(resolver)} {}

auto JavaBackendProbe::probe(const BackendServer& server, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::optional<players_t>> {
	try {
		const players_t online = co_await _impl::with_timeout(query(server, timeout), timeout);

		MCBALANCER_LOG_DEBUG("{} reports {} players online", server.to_string(), online);
		co_return online;
	} catch (const std::exception& e) {
		MCBALANCER_LOG_DEBUG("Getting player count from {} failed: {}", server.to_string(), e.what());
		co_return std::nullopt;
	}
}

auto JavaBackendProbe::query(BackendServer server, std::chrono::milliseconds timeout) const
    -> boost::asio::awaitable<players_t> {
	const ResolvedEndpoint endpoint =
	    co_await resolver->async_resolve(server.address, "minecraft", "tcp", server.default_port);

	const auto executor = co_await boost::asio::this_coro::executor;
	auto socket = std::make_shared<boost::asio::ip::tcp::socket>(executor);

	// Closing the socket fails whatever operation is pending on it, so an abandoned query winds down by itself
	boost::asio::steady_timer watchdog{executor};
	watchdog.expires_after(timeout);
	watchdog.async_wait([socket](const boost::system::error_code& ec) {
		if (!ec) {
			boost::system::error_code close_ec;
			socket->close(close_ec);
		}
	});

	boost::asio::ip::tcp::resolver tcp_resolver{executor};
	const auto results =
	    co_await tcp_resolver.async_resolve(endpoint.ip, std::to_string(endpoint.port), boost::asio::use_awaitable);
	co_await boost::asio::async_connect(*socket, results, boost::asio::use_awaitable);

	co_await handshake(*socket, endpoint);

	McPacket request;
	packets::StatusRequest{}.write(request);
	co_await request.async_write_to_socket(*socket);

	McPacket::buffer_t pending;
	McPacket response = co_await McPacket::async_read_from_socket(*socket, pending);

	if (response.read_varint() != packets::StatusResponse::ID) {
		throw std::runtime_error("Invalid status response packet");
	}

	co_return parse_online_players(packets::StatusResponse::read(response).json_response);
}

boost::asio::awaitable<void> JavaBackendProbe::handshake(boost::asio::ip::tcp::socket& socket,
                                                         const ResolvedEndpoint& endpoint) {
	McPacket packet;
	packets::Handshake{PROTOCOL_VERSION, endpoint.resolved_host, endpoint.port, packets::NextState::Status}.write(
	    packet);

	co_await packet.async_write_to_socket(socket);
}

auto JavaBackendProbe::parse_online_players(std::string_view status_response) -> players_t {
	const boost::json::value parsed_status =
	    boost::json::parse(boost::json::string_view{status_response.data(), status_response.size()});

	const boost::json::object* status = parsed_status.if_object();
	if (status == nullptr || !status->contains("players") || !status->at("players").is_object()) {
		throw std::runtime_error("Response did not contain 'players' field");
	}

	const boost::json::object& players = status->at("players").as_object();
	if (!players.contains("online")) {
		throw std::runtime_error("Response did not contain 'online' field");
	}

	const boost::json::value& online = players.at("online");
	if (online.is_int64() && online.as_int64() >= 0) {
		return online.as_int64();
	}
	if (online.is_uint64() && online.as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<players_t>::max())) {
		return static_cast<players_t>(online.as_uint64());
	}

	throw std::runtime_error("'online' field is not a non-negative integer");
}

}  // namespace mcbalancer
