#ifndef MCBALANCER_PACKETS_HPP
#define MCBALANCER_PACKETS_HPP

#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <string>

#include "McPacket.hpp"

namespace mcbalancer {

// Java Edition protocol packets the balancer speaks. `read` expects the packet id to be consumed already,
// `write` emits the id followed by the fields.
namespace packets {

enum class NextState : std::int32_t {
	Status = 1,
	Login = 2,
	Transfer = 3,
};

// Serverbound, handshake state

struct Handshake {
	static constexpr std::int32_t ID{0x00};

	std::int32_t protocol_version{};
	std::string server_address{};
	std::uint16_t server_port{};
	NextState next_state{NextState::Status};

	[[nodiscard]] static Handshake read(McPacket& packet);
	void write(McPacket& packet) const;
};

// Serverbound, status state

struct StatusRequest {
	static constexpr std::int32_t ID{0x00};

	void write(McPacket& packet) const;
};

struct PingRequest {
	static constexpr std::int32_t ID{0x01};

	std::int64_t payload{};

	[[nodiscard]] static PingRequest read(McPacket& packet);
	void write(McPacket& packet) const;
};

// Clientbound, status state

struct StatusResponse {
	static constexpr std::int32_t ID{0x00};

	std::string json_response{};

	[[nodiscard]] static StatusResponse read(McPacket& packet);
	void write(McPacket& packet) const;
};

struct PingResponse {
	static constexpr std::int32_t ID{0x01};

	std::int64_t payload{};

	[[nodiscard]] static PingResponse read(McPacket& packet);
	void write(McPacket& packet) const;
};

// Serverbound, login state

struct LoginStart {
	static constexpr std::int32_t ID{0x00};

	std::string name{};
	boost::uuids::uuid uuid{};

	[[nodiscard]] static LoginStart read(McPacket& packet);
	void write(McPacket& packet) const;
};

struct LoginAcknowledged {
	static constexpr std::int32_t ID{0x03};

	void write(McPacket& packet) const;
};

// Clientbound, login state

struct LoginSuccess {
	static constexpr std::int32_t ID{0x02};

	boost::uuids::uuid uuid{};
	std::string name{};
	// Properties are never forwarded, the array is always written empty

	[[nodiscard]] static LoginSuccess read(McPacket& packet);
	void write(McPacket& packet) const;
};

// Clientbound, configuration state

struct Transfer {
	static constexpr std::int32_t ID{0x0B};

	std::string host{};
	std::int32_t port{};

	[[nodiscard]] static Transfer read(McPacket& packet);
	void write(McPacket& packet) const;
};

}  // namespace packets

}  // namespace mcbalancer

#endif  // MCBALANCER_PACKETS_HPP
