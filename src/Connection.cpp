#include "mcbalancer/Connection.hpp"

#include <algorithm>
#include <array>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <utility>

#include "mcbalancer/Logger.hpp"
#include "mcbalancer/Packets.hpp"

namespace mcbalancer {

namespace {

constexpr std::array<std::pair<Connection::State, Connection::State>, 3> TRANSITIONS{{
    {Connection::State::Handshake, Connection::State::Status},
    {Connection::State::Handshake, Connection::State::Login},
    {Connection::State::Login, Connection::State::Config},
}};

}  // namespace

Connection::Connection(boost::asio::ip::tcp::socket socket, std::uint64_t id,
                       std::shared_ptr<const ConnectionContext> context)
    : socket{std::move(socket)}, id{id}, context{std::move(context)} {}

boost::asio::awaitable<void> Connection::run() {
	std::int32_t packet_id = -1;

	try {
		client = normalize_address(socket.remote_endpoint().address());
		MCBALANCER_LOG_DEBUG("({}) Connection from {}", id, client.to_string());

		while (!finished) {
			McPacket packet = co_await McPacket::async_read_from_socket(socket, pending);
			packet_id = packet.read_varint();

			MCBALANCER_LOG_TRACE("({}) Received packet {:#04x} in state {}", id, packet_id, to_string(state));

			co_await handle_packet(packet_id, packet);
		}
	} catch (const boost::system::system_error& e) {
		if (e.code() == boost::asio::error::eof || e.code() == boost::asio::error::connection_reset) {
			MCBALANCER_LOG_DEBUG("({}) Client disconnected in state {}", id, to_string(state));
		} else {
			MCBALANCER_LOG_ERROR("({}) Connection error in state {} (last packet id {}): {}", id, to_string(state),
			                     packet_id, e.what());
		}
	} catch (const std::exception& e) {
		MCBALANCER_LOG_ERROR("({}) Failed to handle packet with id {} (state {}): {}", id, packet_id,
		                     to_string(state), e.what());
	}

	boost::system::error_code ec;
	socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
	socket.close(ec);

	MCBALANCER_LOG_DEBUG("({}) Connection closed", id);
}

std::uint64_t Connection::get_id() const {
	return id;
}

Connection::State Connection::get_state() const {
	return state;
}

std::int32_t Connection::get_protocol_version() const {
	return protocol_version;
}

bool Connection::is_valid_transition(State from, State to) {
	return std::find(TRANSITIONS.begin(), TRANSITIONS.end(), std::make_pair(from, to)) != TRANSITIONS.end();
}

std::string_view Connection::to_string(State state) {
	switch (state) {
		case State::Handshake:
			return "Handshake";
		case State::Status:
			return "Status";
		case State::Login:
			return "Login";
		case State::Config:
			return "Config";
	}

	return "Unknown";
}

boost::asio::ip::address Connection::normalize_address(const boost::asio::ip::address& address) {
	if (address.is_v6() && address.to_v6().is_v4_mapped()) {
		return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6());
	}

	return address;
}

void Connection::transition(State to) {
	if (!is_valid_transition(state, to)) {
		throw ConnectionError{"Illegal state transition from " + std::string{to_string(state)} + " to " +
		                      std::string{to_string(to)}};
	}

	MCBALANCER_LOG_DEBUG("({}) Switched from {} to {}", id, to_string(state), to_string(to));
	state = to;
}

boost::asio::awaitable<void> Connection::handle_packet(std::int32_t packet_id, McPacket& packet) {
	switch (state) {
		case State::Handshake:
			co_await handle_handshake(packet_id, packet);
			break;
		case State::Status:
			co_await handle_status(packet_id, packet);
			break;
		case State::Login:
			co_await handle_login(packet_id, packet);
			break;
		case State::Config:
			throw ConnectionError{"No packets are accepted in the configuration state"};
	}
}

boost::asio::awaitable<void> Connection::handle_handshake(std::int32_t packet_id, McPacket& packet) {
	if (packet_id != packets::Handshake::ID) {
		MCBALANCER_LOG_WARN("({}) Ignoring unknown packet with id {} during handshake", id, packet_id);
		co_return;
	}

	const packets::Handshake handshake = packets::Handshake::read(packet);
	protocol_version = handshake.protocol_version;

	// Transfer intent is handled like a fresh login
	transition(handshake.next_state == packets::NextState::Status ? State::Status : State::Login);
}

boost::asio::awaitable<void> Connection::handle_status(std::int32_t packet_id, McPacket& packet) {
	McPacket response;

	switch (packet_id) {
		case packets::StatusRequest::ID: {
			const std::int32_t protocol = std::max(MIN_STATUS_PROTOCOL, protocol_version);
			std::string payload = co_await context->status_cache->get_status(context->motd, protocol);

			packets::StatusResponse{std::move(payload)}.write(response);
			break;
		}
		case packets::PingRequest::ID:
			packets::PingResponse{packets::PingRequest::read(packet).payload}.write(response);
			break;
		default:
			throw ConnectionError{"Unknown packet id " + std::to_string(packet_id) + " in status state"};
	}

	co_await response.async_write_to_socket(socket);
}

boost::asio::awaitable<void> Connection::handle_login(std::int32_t packet_id, McPacket& packet) {
	switch (packet_id) {
		case packets::LoginStart::ID: {
			const packets::LoginStart login = packets::LoginStart::read(packet);
			MCBALANCER_LOG_DEBUG("({}) Login start from {}", id, login.name);

			McPacket response;
			packets::LoginSuccess{login.uuid, login.name}.write(response);
			co_await response.async_write_to_socket(socket);
			break;
		}
		case packets::LoginAcknowledged::ID:
			// The client is redirected right away, nothing it sends in the configuration state is read
			transition(State::Config);
			co_await transfer();
			finished = true;
			break;
		default:
			throw ConnectionError{"Unknown packet id " + std::to_string(packet_id) + " in login state"};
	}
}

boost::asio::awaitable<void> Connection::transfer() {
	const BackendServer server = co_await context->selector->find_server(client);
	const ResolvedEndpoint endpoint =
	    co_await context->resolver->async_resolve(server.address, "minecraft", "tcp", server.default_port);

	MCBALANCER_LOG_INFO("({}) Transferring {} to {}:{}", id, client.to_string(), endpoint.ip, endpoint.port);

	McPacket packet;
	packets::Transfer{endpoint.ip, endpoint.port}.write(packet);
	co_await packet.async_write_to_socket(socket);
}

}  // namespace mcbalancer
