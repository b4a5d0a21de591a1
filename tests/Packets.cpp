#include "mcbalancer/Packets.hpp"

#include <gtest/gtest.h>

#include <boost/uuid/string_generator.hpp>

using namespace mcbalancer;

TEST(PacketsTest, HandshakeLayout) {
	McPacket packet{};
	packets::Handshake{772, "mc.example.com", 25565, packets::NextState::Login}.write(packet);

	EXPECT_EQ(packet.read_varint(), packets::Handshake::ID);

	const packets::Handshake handshake = packets::Handshake::read(packet);
	EXPECT_EQ(handshake.protocol_version, 772);
	EXPECT_EQ(handshake.server_address, "mc.example.com");
	EXPECT_EQ(handshake.server_port, 25565);
	EXPECT_EQ(handshake.next_state, packets::NextState::Login);
	EXPECT_TRUE(packet.eof());
}

TEST(PacketsTest, HandshakeTransferIntent) {
	McPacket packet{};
	packet.write_varint(767);
	packet.write_utf("localhost");
	packet.write_ushort(25565);
	packet.write_varint(3);

	EXPECT_EQ(packets::Handshake::read(packet).next_state, packets::NextState::Transfer);
}

TEST(PacketsTest, HandshakeInvalidNextState) {
	McPacket packet{};
	packet.write_varint(767);
	packet.write_utf("localhost");
	packet.write_ushort(25565);
	packet.write_varint(7);

	EXPECT_THROW(std::ignore = packets::Handshake::read(packet), McPacket::PacketDecodingError);
}

TEST(PacketsTest, HandshakeTruncated) {
	McPacket packet{};
	packet.write_varint(767);
	packet.write_utf("localhost");

	EXPECT_THROW(std::ignore = packets::Handshake::read(packet), McPacket::PacketDecodingError);
}

TEST(PacketsTest, PingEchoesPayload) {
	McPacket request{};
	packets::PingRequest{-1234567890123LL}.write(request);

	ASSERT_EQ(request.read_varint(), packets::PingRequest::ID);
	const packets::PingRequest ping = packets::PingRequest::read(request);

	McPacket response{};
	packets::PingResponse{ping.payload}.write(response);

	EXPECT_EQ(response.read_varint(), packets::PingResponse::ID);
	EXPECT_EQ(packets::PingResponse::read(response).payload, -1234567890123LL);
}

TEST(PacketsTest, StatusRequestIsIdOnly) {
	McPacket packet{};
	packets::StatusRequest{}.write(packet);

	EXPECT_EQ(packet.size(), 1u);
	EXPECT_EQ(packet.read_varint(), packets::StatusRequest::ID);
}

TEST(PacketsTest, LoginStartAndSuccess) {
	const boost::uuids::uuid uuid = boost::uuids::string_generator{}("069a79f4-44e9-4726-a5be-fca90e38aaf5");

	McPacket start{};
	packets::LoginStart{"Notch", uuid}.write(start);
	ASSERT_EQ(start.read_varint(), packets::LoginStart::ID);

	const packets::LoginStart login = packets::LoginStart::read(start);
	EXPECT_EQ(login.name, "Notch");
	EXPECT_EQ(login.uuid, uuid);

	McPacket success{};
	packets::LoginSuccess{login.uuid, login.name}.write(success);
	ASSERT_EQ(success.read_varint(), packets::LoginSuccess::ID);

	const packets::LoginSuccess decoded = packets::LoginSuccess::read(success);
	EXPECT_EQ(decoded.uuid, uuid);
	EXPECT_EQ(decoded.name, "Notch");
	EXPECT_TRUE(success.eof());
}

TEST(PacketsTest, LoginSuccessSkipsProperties) {
	McPacket packet{};
	packet.write_uuid(boost::uuids::uuid{});
	packet.write_utf("Notch");
	packet.write_varint(2);
	packet.write_utf("textures");
	packet.write_utf("value");
	packet.write_bool(true);
	packet.write_utf("signature");
	packet.write_utf("other");
	packet.write_utf("value");
	packet.write_bool(false);

	EXPECT_EQ(packets::LoginSuccess::read(packet).name, "Notch");
	EXPECT_TRUE(packet.eof());
}

TEST(PacketsTest, TransferLayout) {
	McPacket packet{};
	packets::Transfer{"203.0.113.5", 25566}.write(packet);

	const McPacket::buffer_t frame = packet.write_to_buffer();
	McPacket decoded = McPacket::read_from_buffer(frame);

	EXPECT_EQ(decoded.read_varint(), 0x0B);
	EXPECT_EQ(decoded.read_utf(), "203.0.113.5");
	EXPECT_EQ(decoded.read_varint(), 25566);
	EXPECT_TRUE(decoded.eof());
}
