#include "mcbalancer/McPacket.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <concepts>
#include <optional>
#include <string>
#include <utility>

namespace mcbalancer {

namespace _impl {

template <std::integral T>
void write_int_be(McPacket::buffer_t& buffer, T value) {
	// Clang-tidy doesn't understand that this is essentially a compile-time check
#pragma clang diagnostic push
#pragma ide diagnostic ignored "Simplify"
	if constexpr (std::endian::native != std::endian::big) {
		value = std::byteswap(value);
	}
#pragma clang diagnostic pop

	constexpr std::size_t bytes = sizeof(T);
	auto* ptr = reinterpret_cast<const std::uint8_t*>(&value);

	buffer.insert(buffer.end(), ptr, ptr + bytes);
}

template <std::integral T>
T read_int_be(const McPacket::buffer_iterator_t& head, McPacket::head_offset_t& head_offset) {
	constexpr std::size_t bytes = sizeof(T);
	T value;
	auto* ptr = reinterpret_cast<std::uint8_t*>(&value);

	std::copy_n(head, bytes, ptr);
	head_offset += bytes;

	// Clang-tidy doesn't understand that this is essentially a compile-time check
#pragma clang diagnostic push
#pragma ide diagnostic ignored "Simplify"
	if constexpr (std::endian::native != std::endian::big) {
		value = std::byteswap(value);
	}
#pragma clang diagnostic pop

	return value;
}

// Protocol varints are little endian groups of 7 bits, the high bit marks that another group follows
constexpr std::size_t MAX_VARINT_BYTES{5};

McPacket::buffer_t encode_varint(std::int32_t value) {
	McPacket::buffer_t bytes;
	auto remaining = static_cast<std::uint32_t>(value);

	while ((remaining & ~0x7Fu) != 0) {
		bytes.push_back(static_cast<std::uint8_t>((remaining & 0x7F) | 0x80));
		remaining >>= 7;
	}
	bytes.push_back(static_cast<std::uint8_t>(remaining));

	return bytes;
}

// Decodes a varint from [`begin`, `end`). Returns the value and its size, std::nullopt if the input ends early.
template <typename It>
std::optional<std::pair<std::uint32_t, std::size_t>> decode_varint(It begin, It end, std::size_t max_bytes) {
	std::uint32_t result = 0;

	for (std::size_t i = 0; i < max_bytes; ++i) {
		if (begin + static_cast<std::ptrdiff_t>(i) == end) {
			return std::nullopt;
		}

		const std::uint8_t part = *(begin + static_cast<std::ptrdiff_t>(i));
		result |= static_cast<std::uint32_t>(part & 0x7F) << (7 * i);

		if ((part & 0x80) == 0) {
			return std::pair{result, i + 1};
		}
	}

	throw McPacket::PacketDecodingError{"Received varint is longer than " + std::to_string(max_bytes) + " bytes"};
}

}  // namespace _impl

McPacket::McPacket(const std::vector<std::uint8_t>& buffer) : buffer{buffer}, head_offset{0} {}

McPacket::McPacket(McPacket::buffer_iterator_t begin, McPacket::buffer_iterator_t end)
    : buffer{begin, end}, head_offset{0} {}

auto McPacket::get_head() -> buffer_iterator_t {
	return buffer.begin() + static_cast<std::ptrdiff_t>(head_offset);
}

auto McPacket::advance_head() -> buffer_iterator_t {
	return buffer.begin() + static_cast<std::ptrdiff_t>(head_offset++);
}

void McPacket::require(std::size_t bytes, std::string_view what) const {
	if (head_offset + bytes > buffer.size()) {
		throw PacketDecodingError{"Unexpected end of buffer while reading " + std::string{what}};
	}
}

McPacket::McPacket() : buffer{}, head_offset{0} {}

void McPacket::reset() {
	head_offset = 0;
}

std::size_t McPacket::size() const {
	return buffer.size();
}

void McPacket::write_varint(std::int32_t value) {
	const buffer_t bytes = _impl::encode_varint(value);
	buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void McPacket::write_utf(std::string_view value) {
	if (value.size() > static_cast<std::size_t>(MAX_PACKET_SIZE)) {
		throw PacketEncodingError{"String of " + std::to_string(value.size()) + " bytes doesn't fit in a packet"};
	}

	// We really don't have a concept of encodings, so we just store the string as-is with a varint length prefix
	write_varint(static_cast<std::int32_t>(value.size()));
	buffer.insert(buffer.end(), value.begin(), value.end());
}

void McPacket::write_ushort(std::uint16_t value) {
	_impl::write_int_be(buffer, value);
}

void McPacket::write_long(std::int64_t value) {
	_impl::write_int_be(buffer, value);
}

void McPacket::write_bool(bool value) {
	buffer.push_back(value ? 1 : 0);
}

void McPacket::write_uuid(const boost::uuids::uuid& value) {
	// boost stores the 16 bytes in network order already, which is what the protocol wants
	buffer.insert(buffer.end(), value.begin(), value.end());
}

auto McPacket::write_to_buffer() const -> buffer_t {
	if (buffer.size() > static_cast<std::size_t>(MAX_PACKET_SIZE)) {
		throw PacketEncodingError{"Packet of " + std::to_string(buffer.size()) + " bytes exceeds the maximum size"};
	}

	McPacket length_packet{};
	length_packet.write_varint(static_cast<std::int32_t>(buffer.size()));

	length_packet.buffer.insert(length_packet.buffer.end(), buffer.begin(), buffer.end());

	return length_packet.buffer;
}

boost::asio::awaitable<void> McPacket::async_write_to_socket(boost::asio::ip::tcp::socket& socket) const {
	const buffer_t frame = write_to_buffer();

	co_await boost::asio::async_write(socket, boost::asio::buffer(frame), boost::asio::use_awaitable);
}

bool McPacket::eof() const {
	return head_offset >= buffer.size();
}

std::int32_t McPacket::read_varint() {
	const auto decoded = _impl::decode_varint(get_head(), buffer.cend(), _impl::MAX_VARINT_BYTES);
	if (!decoded) {
		throw PacketDecodingError{"Unexpected end of buffer while reading varint"};
	}

	head_offset += decoded->second;
	return static_cast<std::int32_t>(decoded->first);
}

std::string McPacket::read_utf() {
	const std::int32_t length = read_varint();

	if (length < 0) {
		throw PacketDecodingError{"Received negative string length " + std::to_string(length)};
	}
	if ((head_offset + static_cast<std::size_t>(length)) > buffer.size()) {
		throw PacketDecodingError{"Received packet is shorter than expected while reading UTF string"};
	}

	std::string res{get_head(), get_head() + length};

	head_offset += static_cast<std::size_t>(length);
	return res;
}

std::uint16_t McPacket::read_ushort() {
	require(sizeof(std::uint16_t), "ushort");
	return _impl::read_int_be<std::uint16_t>(get_head(), head_offset);
}

std::int64_t McPacket::read_long() {
	require(sizeof(std::int64_t), "long");
	return _impl::read_int_be<std::int64_t>(get_head(), head_offset);
}

bool McPacket::read_bool() {
	require(1, "bool");
	return *advance_head() != 0;
}

boost::uuids::uuid McPacket::read_uuid() {
	boost::uuids::uuid value{};

	require(value.size(), "uuid");
	std::copy_n(get_head(), value.size(), value.begin());
	head_offset += value.size();

	return value;
}

McPacket McPacket::read_from_buffer(const buffer_t& buffer) {
	McPacket length_packet{buffer};
	std::int32_t length = length_packet.read_varint();

	if (length < 0 || length > MAX_PACKET_SIZE) {
		throw PacketDecodingError{"Received invalid packet length " + std::to_string(length)};
	}
	if ((length_packet.head_offset + static_cast<std::size_t>(length)) > buffer.size()) {
		throw PacketDecodingError{"Received packet is shorter than expected"};
	}

	return McPacket{length_packet.get_head(), length_packet.get_head() + length};
}

std::optional<McPacket> McPacket::take_frame(buffer_t& pending) {
	// The length prefix of a valid frame never needs more than 3 bytes
	const auto prefix = _impl::decode_varint(pending.cbegin(), pending.cend(), 3);
	if (!prefix) {
		return std::nullopt;
	}

	const auto [length, header] = *prefix;
	if (pending.size() - header < length) {
		return std::nullopt;
	}

	const auto begin = pending.cbegin() + static_cast<std::ptrdiff_t>(header);
	const auto end = begin + static_cast<std::ptrdiff_t>(length);
	McPacket packet{begin, end};

	pending.erase(pending.begin(), end);
	return packet;
}

boost::asio::awaitable<McPacket> McPacket::async_read_from_socket(boost::asio::ip::tcp::socket& socket,
                                                                  buffer_t& pending) {
	std::array<std::uint8_t, 4096> chunk{};

	while (true) {
		if (std::optional<McPacket> packet = take_frame(pending)) {
			co_return std::move(*packet);
		}

		const std::size_t received =
		    co_await socket.async_read_some(boost::asio::buffer(chunk), boost::asio::use_awaitable);
		pending.insert(pending.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(received));
	}
}

}  // namespace mcbalancer
