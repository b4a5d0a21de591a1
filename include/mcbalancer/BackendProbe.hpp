#ifndef MCBALANCER_BACKENDPROBE_HPP
#define MCBALANCER_BACKENDPROBE_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "BackendServer.hpp"
#include "EndpointResolver.hpp"

namespace mcbalancer {

class BackendProbe {
public:
	using players_t = std::int64_t;

	static constexpr std::chrono::seconds DEFAULT_TIMEOUT{5};

	virtual ~BackendProbe() = default;

	/**
	 * Asks `server` for its online player count.
	 *
	 * Never throws: any failure, including running past `timeout`, is reported as std::nullopt.
	 */
	[[nodiscard]] virtual boost::asio::awaitable<std::optional<players_t>> probe(const BackendServer& server,
	                                                                           std::chrono::milliseconds timeout) = 0;
};

// Queries backends with the status request of the Java Edition protocol
class JavaBackendProbe : public BackendProbe {
public:
	static constexpr std::int32_t PROTOCOL_VERSION{772};

	explicit JavaBackendProbe(std::shared_ptr<const EndpointResolver> resolver);

	[[nodiscard]] boost::asio::awaitable<std::optional<players_t>> probe(const BackendServer& server,
	                                                                   std::chrono::milliseconds timeout) override;

	// Extracts `players.online` from a status response document
	[[nodiscard]] static players_t parse_online_players(std::string_view status_response);

protected:
	std::shared_ptr<const EndpointResolver> resolver;

	[[nodiscard]] boost::asio::awaitable<players_t> query(BackendServer server,
	                                                      std::chrono::milliseconds timeout) const;
	[[nodiscard]] static boost::asio::awaitable<void> handshake(boost::asio::ip::tcp::socket& socket,
	                                                            const ResolvedEndpoint& endpoint);
};

}  // namespace mcbalancer

#endif  // MCBALANCER_BACKENDPROBE_HPP
