#include "mcbalancer/McPacket.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/uuid/string_generator.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

using namespace mcbalancer;

class McPacketAccessor : public McPacket {
public:
	explicit McPacketAccessor(const buffer_t& buffer) : McPacket{buffer} {}
};

// Payload bytes of `packet`. Bodies in these tests stay below 128 bytes, so the length prefix is a single byte.
McPacket::buffer_t body_of(const McPacket& packet) {
	const McPacket::buffer_t frame = packet.write_to_buffer();
	return McPacket::buffer_t(frame.begin() + 1, frame.end());
}

TEST(McPacketTest, Reset) {
	McPacket packet{};

	packet.write_bool(true);
	packet.write_bool(false);
	EXPECT_EQ(packet.read_bool(), true);

	packet.reset();
	EXPECT_EQ(packet.read_bool(), true);
	EXPECT_EQ(packet.read_bool(), false);
	EXPECT_TRUE(packet.eof());
}

TEST(McPacketTest, VarintEncoding) {
	const std::vector<std::pair<std::int32_t, McPacket::buffer_t>> cases{
	    {0, {0x00}},
	    {127, {0x7F}},
	    {128, {0x80, 0x01}},
	    {25565, {0xDD, 0xC7, 0x01}},
	    {2097151, {0xFF, 0xFF, 0x7F}},
	    {INT32_MAX, {0xFF, 0xFF, 0xFF, 0xFF, 0x07}},
	    {-1, {0xFF, 0xFF, 0xFF, 0xFF, 0x0F}},
	    {INT32_MIN, {0x80, 0x80, 0x80, 0x80, 0x08}},
	};

	for (const auto& [value, bytes] : cases) {
		McPacket packet{};
		packet.write_varint(value);
		EXPECT_EQ(body_of(packet), bytes) << "Encoding " << value;

		McPacket decoded = McPacketAccessor{bytes};
		EXPECT_EQ(decoded.read_varint(), value) << "Decoding " << value;
		EXPECT_TRUE(decoded.eof());
	}
}

TEST(McPacketTest, ReadVarintUnexpectedEnd) {
	McPacket packet{};
	EXPECT_THROW(std::ignore = packet.read_varint(), McPacket::PacketDecodingError);

	packet = McPacketAccessor{{0x80}};
	EXPECT_THROW(std::ignore = packet.read_varint(), McPacket::PacketDecodingError);
}

TEST(McPacketTest, ReadVarintTooBig) {
	McPacket packet = McPacketAccessor{{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x80}};

	EXPECT_THROW(std::ignore = packet.read_varint(), McPacket::PacketDecodingError);
}

TEST(McPacketTest, UtfIsLengthPrefixedUtf8) {
	McPacket packet{};
	packet.write_utf("h\xC3\xA9");

	EXPECT_EQ(body_of(packet), (McPacket::buffer_t{0x03, 'h', 0xC3, 0xA9}));
	EXPECT_EQ(packet.read_utf(), "h\xC3\xA9");
}

TEST(McPacketTest, ReadUtfPastEnd) {
	McPacket packet = McPacketAccessor{{0x05, 'a', 'b'}};

	EXPECT_THROW(std::ignore = packet.read_utf(), McPacket::PacketDecodingError);
}

TEST(McPacketTest, FixedWidthValuesAreBigEndian) {
	McPacket packet{};
	packet.write_ushort(25565);
	packet.write_long(0x0102030405060708LL);
	packet.write_bool(true);

	EXPECT_EQ(body_of(packet),
	          (McPacket::buffer_t{0x63, 0xDD, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x01}));
	EXPECT_EQ(packet.read_ushort(), 25565);
	EXPECT_EQ(packet.read_long(), 0x0102030405060708LL);
	EXPECT_EQ(packet.read_bool(), true);
}

TEST(McPacketTest, FrameIsLengthPrefixed) {
	McPacket empty{};
	EXPECT_EQ(empty.write_to_buffer(), McPacket::buffer_t{0x00});

	McPacket packet = McPacket::read_from_buffer({0x03, 0x01, 0x05, 0x39});
	EXPECT_EQ(packet.read_bool(), true);
	EXPECT_EQ(packet.read_ushort(), 1337);
	EXPECT_TRUE(packet.eof());
}

TEST(McPacketTest, ReadFromBufferShorterThanLength) {
	EXPECT_THROW(std::ignore = McPacket::read_from_buffer({0x05, 0x01, 0x02, 0x03}), McPacket::PacketDecodingError);
}

TEST(McPacketTest, WriteReadUuid) {
	const boost::uuids::uuid uuid = boost::uuids::string_generator{}("069a79f4-44e9-4726-a5be-fca90e38aaf5");

	McPacket packet;
	packet.write_uuid(uuid);

	EXPECT_EQ(packet.size(), 16u);
	EXPECT_EQ(packet.write_to_buffer()[1], 0x06);
	EXPECT_EQ(packet.read_uuid(), uuid);
}

TEST(McPacketTest, WriteToBufferTooBig) {
	McPacket packet{};
	packet.write_utf(std::string(McPacket::MAX_PACKET_SIZE, 'A'));

	EXPECT_THROW(std::ignore = packet.write_to_buffer(), McPacket::PacketEncodingError);
}

// =====================================================================================================================
TEST(McPacketFrameTest, IncompleteFrameStaysPending) {
	McPacket packet{};
	packet.write_varint(0x00);
	packet.write_utf("Hello World");
	const McPacket::buffer_t frame = packet.write_to_buffer();

	McPacket::buffer_t pending{frame.begin(), frame.begin() + 5};
	EXPECT_FALSE(McPacket::take_frame(pending).has_value());
	EXPECT_EQ(pending.size(), 5u);

	pending.insert(pending.end(), frame.begin() + 5, frame.end());
	std::optional<McPacket> taken = McPacket::take_frame(pending);

	ASSERT_TRUE(taken.has_value());
	EXPECT_EQ(taken->read_varint(), 0x00);
	EXPECT_EQ(taken->read_utf(), "Hello World");
	EXPECT_TRUE(pending.empty());
}

TEST(McPacketFrameTest, EmptyPending) {
	McPacket::buffer_t pending;

	EXPECT_FALSE(McPacket::take_frame(pending).has_value());
}

TEST(McPacketFrameTest, TwoFramesInOneBuffer) {
	McPacket first{};
	first.write_varint(0x00);
	McPacket second{};
	second.write_varint(0x01);
	second.write_long(1234567890123LL);

	McPacket::buffer_t pending = first.write_to_buffer();
	const McPacket::buffer_t second_frame = second.write_to_buffer();
	pending.insert(pending.end(), second_frame.begin(), second_frame.end());

	std::optional<McPacket> taken = McPacket::take_frame(pending);
	ASSERT_TRUE(taken.has_value());
	EXPECT_EQ(taken->read_varint(), 0x00);
	EXPECT_TRUE(taken->eof());
	EXPECT_EQ(pending, second_frame);

	taken = McPacket::take_frame(pending);
	ASSERT_TRUE(taken.has_value());
	EXPECT_EQ(taken->read_varint(), 0x01);
	EXPECT_EQ(taken->read_long(), 1234567890123LL);
	EXPECT_TRUE(pending.empty());
}

TEST(McPacketFrameTest, LengthPrefixTooLong) {
	McPacket::buffer_t pending{0xFF, 0xFF, 0xFF, 0x01};

	EXPECT_THROW(std::ignore = McPacket::take_frame(pending), McPacket::PacketDecodingError);
}

// =====================================================================================================================
TEST(McPacketSocketTest, TcpWriteAndRead) {
	boost::asio::io_context io_context;
	boost::asio::ip::tcp::acceptor acceptor(io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), 0));

	auto server_endpoint = acceptor.local_endpoint();

	// Server socket
	boost::asio::ip::tcp::socket server_socket(io_context);

	// Client socket
	boost::asio::ip::tcp::socket client_socket(io_context);
	client_socket.connect(server_endpoint);
	acceptor.accept(server_socket);

	std::optional<McPacket> read_packet;

	boost::asio::co_spawn(
	    io_context,
	    [&]() -> boost::asio::awaitable<void> {
		    McPacket write_packet;
		    write_packet.write_varint(42);
		    write_packet.write_utf("Hello World");

		    co_await write_packet.async_write_to_socket(client_socket);
	    },
	    boost::asio::detached);

	boost::asio::co_spawn(
	    io_context,
	    [&]() -> boost::asio::awaitable<void> {
		    McPacket::buffer_t pending;
		    read_packet = co_await McPacket::async_read_from_socket(server_socket, pending);
	    },
	    boost::asio::detached);

	io_context.run();

	ASSERT_TRUE(read_packet.has_value());
	EXPECT_EQ(read_packet->read_varint(), 42);
	EXPECT_EQ(read_packet->read_utf(), "Hello World");
}

TEST(McPacketSocketTest, TcpReadKeepsFollowingFrame) {
	boost::asio::io_context io_context;
	boost::asio::ip::tcp::acceptor acceptor(io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), 0));

	boost::asio::ip::tcp::socket server_socket(io_context);
	boost::asio::ip::tcp::socket client_socket(io_context);
	client_socket.connect(acceptor.local_endpoint());
	acceptor.accept(server_socket);

	// Both frames go out in a single write
	McPacket first{};
	first.write_varint(1);
	McPacket second{};
	second.write_varint(2);

	McPacket::buffer_t frames = first.write_to_buffer();
	const McPacket::buffer_t second_frame = second.write_to_buffer();
	frames.insert(frames.end(), second_frame.begin(), second_frame.end());
	boost::asio::write(client_socket, boost::asio::buffer(frames));

	std::vector<std::int32_t> ids;

	boost::asio::co_spawn(
	    io_context,
	    [&]() -> boost::asio::awaitable<void> {
		    McPacket::buffer_t pending;
		    for (int i = 0; i < 2; ++i) {
			    McPacket packet = co_await McPacket::async_read_from_socket(server_socket, pending);
			    ids.push_back(packet.read_varint());
		    }
	    },
	    boost::asio::detached);

	io_context.run();

	EXPECT_EQ(ids, (std::vector<std::int32_t>{1, 2}));
}
