#include "mcbalancer/Packets.hpp"

#include <tuple>

namespace mcbalancer::packets {

Handshake Handshake::read(McPacket& packet) {
	Handshake handshake;
	handshake.protocol_version = packet.read_varint();
	handshake.server_address = packet.read_utf();
	handshake.server_port = packet.read_ushort();

	const std::int32_t next_state = packet.read_varint();
	switch (next_state) {
		case static_cast<std::int32_t>(NextState::Status):
		case static_cast<std::int32_t>(NextState::Login):
		case static_cast<std::int32_t>(NextState::Transfer):
			handshake.next_state = static_cast<NextState>(next_state);
			break;
		default:
			throw McPacket::PacketDecodingError{"Invalid handshake next state " + std::to_string(next_state)};
	}

	return handshake;
}

void Handshake::write(McPacket& packet) const {
	packet.write_varint(ID);
	packet.write_varint(protocol_version);
	packet.write_utf(server_address);
	packet.write_ushort(server_port);
	packet.write_varint(static_cast<std::int32_t>(next_state));
}

void StatusRequest::write(McPacket& packet) const {
	packet.write_varint(ID);
}

PingRequest PingRequest::read(McPacket& packet) {
	return PingRequest{packet.read_long()};
}

void PingRequest::write(McPacket& packet) const {
	packet.write_varint(ID);
	packet.write_long(payload);
}

StatusResponse StatusResponse::read(McPacket& packet) {
	return StatusResponse{packet.read_utf()};
}

void StatusResponse::write(McPacket& packet) const {
	packet.write_varint(ID);
	packet.write_utf(json_response);
}

PingResponse PingResponse::read(McPacket& packet) {
	return PingResponse{packet.read_long()};
}

void PingResponse::write(McPacket& packet) const {
	packet.write_varint(ID);
	packet.write_long(payload);
}

LoginStart LoginStart::read(McPacket& packet) {
	LoginStart login;
	login.name = packet.read_utf();
	login.uuid = packet.read_uuid();
	return login;
}

void LoginStart::write(McPacket& packet) const {
	packet.write_varint(ID);
	packet.write_utf(name);
	packet.write_uuid(uuid);
}

void LoginAcknowledged::write(McPacket& packet) const {
	packet.write_varint(ID);
}

LoginSuccess LoginSuccess::read(McPacket& packet) {
	LoginSuccess success;
	success.uuid = packet.read_uuid();
	success.name = packet.read_utf();

	const std::int32_t properties = packet.read_varint();
	for (std::int32_t i = 0; i < properties; ++i) {
		std::ignore = packet.read_utf();  // name
		std::ignore = packet.read_utf();  // value
		if (packet.read_bool()) {
			std::ignore = packet.read_utf();  // signature
		}
	}

	return success;
}

void LoginSuccess::write(McPacket& packet) const {
	packet.write_varint(ID);
	packet.write_uuid(uuid);
	packet.write_utf(name);
	packet.write_varint(0);
}

Transfer Transfer::read(McPacket& packet) {
	Transfer transfer;
	transfer.host = packet.read_utf();
	transfer.port = packet.read_varint();
	return transfer;
}

void Transfer::write(McPacket& packet) const {
	packet.write_varint(ID);
	packet.write_utf(host);
	packet.write_varint(port);
}

}  // namespace mcbalancer::packets
