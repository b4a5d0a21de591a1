#ifndef MCBALANCER_CONNECTION_HPP
#define MCBALANCER_CONNECTION_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "EndpointResolver.hpp"
#include "McPacket.hpp"
#include "ServerSelector.hpp"
#include "StatusCache.hpp"

namespace mcbalancer {

class ConnectionError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Everything a connection needs besides its socket, shared by all connections
struct ConnectionContext {
	std::string motd{};
	std::shared_ptr<ServerSelector> selector{};
	std::shared_ptr<StatusCache> status_cache{};
	std::shared_ptr<const EndpointResolver> resolver{};
};

/**
 * Protocol state machine of one client connection.
 *
 * A connection either answers status and ping requests, or completes the login and transfers the client to the
 * backend picked by the selector. Once the transfer packet is written the connection is closed.
 */
class Connection {
public:
	enum class State {
		Handshake,
		Status,
		Login,
		Config,
	};

	// Oldest protocol reported in status responses
	static constexpr std::int32_t MIN_STATUS_PROTOCOL{766};

	Connection(boost::asio::ip::tcp::socket socket, std::uint64_t id, std::shared_ptr<const ConnectionContext> context);

	// Serves the connection until the client leaves, an error occurs or the client was transferred. Never throws.
	boost::asio::awaitable<void> run();

	[[nodiscard]] std::uint64_t get_id() const;
	[[nodiscard]] State get_state() const;
	[[nodiscard]] std::int32_t get_protocol_version() const;

	[[nodiscard]] static bool is_valid_transition(State from, State to);
	[[nodiscard]] static std::string_view to_string(State state);

	// IPv4 clients accepted on a dual stack socket show up as v4-mapped v6 addresses
	[[nodiscard]] static boost::asio::ip::address normalize_address(const boost::asio::ip::address& address);

private:
	boost::asio::ip::tcp::socket socket;
	std::uint64_t id;
	std::shared_ptr<const ConnectionContext> context;
	boost::asio::ip::address client{};

	State state{State::Handshake};
	std::int32_t protocol_version{0};
	bool finished{false};
	McPacket::buffer_t pending{};

	void transition(State to);

	boost::asio::awaitable<void> handle_packet(std::int32_t packet_id, McPacket& packet);
	boost::asio::awaitable<void> handle_handshake(std::int32_t packet_id, McPacket& packet);
	boost::asio::awaitable<void> handle_status(std::int32_t packet_id, McPacket& packet);
	boost::asio::awaitable<void> handle_login(std::int32_t packet_id, McPacket& packet);
	boost::asio::awaitable<void> transfer();
};

}  // namespace mcbalancer

#endif  // MCBALANCER_CONNECTION_HPP
