#ifndef MCBALANCER_MCPACKET_HPP
#define MCBALANCER_MCPACKET_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mcbalancer {

class McPacket {
public:
	using buffer_t = std::vector<std::uint8_t>;
	using buffer_iterator_t = buffer_t::const_iterator;
	using head_offset_t = std::size_t;

	class PacketEncodingError : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};
	class PacketDecodingError : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Largest frame the vanilla protocol allows (3 byte varint length)
	static constexpr std::int32_t MAX_PACKET_SIZE{2097151};

protected:
	buffer_t buffer;
	head_offset_t head_offset;

	explicit McPacket(const std::vector<std::uint8_t>& buffer);

	McPacket(buffer_iterator_t begin, buffer_iterator_t end);

	buffer_iterator_t get_head();
	buffer_iterator_t advance_head();
	void require(std::size_t bytes, std::string_view what) const;

public:
	// Public Constructors
	McPacket();

	// Helpers
	void reset();
	[[nodiscard]] std::size_t size() const;

	// Write Functions
	void write_varint(std::int32_t value);

	void write_utf(std::string_view value);

	void write_ushort(std::uint16_t value);

	void write_long(std::int64_t value);

	void write_bool(bool value);
	void write_uuid(const boost::uuids::uuid& value);

	buffer_t write_to_buffer() const;
	boost::asio::awaitable<void> async_write_to_socket(boost::asio::ip::tcp::socket& socket) const;

	// Read Functions
	[[nodiscard]] bool eof() const;

	[[nodiscard]] std::int32_t read_varint();

	[[nodiscard]] std::string read_utf();

	[[nodiscard]] std::uint16_t read_ushort();

	[[nodiscard]] std::int64_t read_long();

	[[nodiscard]] bool read_bool();
	[[nodiscard]] boost::uuids::uuid read_uuid();

	[[nodiscard]] static McPacket read_from_buffer(const buffer_t& buffer);

	/**
	 * Splits one complete frame off the front of `pending`.
	 *
	 * Returns std::nullopt when `pending` doesn't hold a whole frame yet. Consumed bytes are erased, anything
	 * behind the frame stays in `pending` for the next call.
	 */
	[[nodiscard]] static std::optional<McPacket> take_frame(buffer_t& pending);

	/**
	 * Reads the next frame from the socket. `pending` carries bytes that were received past the end of the
	 * previous frame and must be the same buffer for every read on one connection.
	 */
	[[nodiscard]] static boost::asio::awaitable<McPacket> async_read_from_socket(boost::asio::ip::tcp::socket& socket,
	                                                                             buffer_t& pending);
};

}  // namespace mcbalancer

#endif  // MCBALANCER_MCPACKET_HPP
