#ifndef MCBALANCER_STATUSCACHE_HPP
#define MCBALANCER_STATUSCACHE_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "ServerSelector.hpp"

namespace mcbalancer {

/**
 * Status response payloads shared by all connections.
 *
 * The aggregated player count is refreshed at most once per REFRESH_INTERVAL. While a refresh is running, other
 * callers wait for its result instead of probing the pool themselves.
 */
class StatusCache {
public:
	using players_t = ServerSelector::players_t;
	using steady_clock_t = std::chrono::steady_clock;

	static constexpr std::chrono::seconds REFRESH_INTERVAL{15};
	static constexpr std::string_view VERSION_NAME{"mcbalancer"};
	static constexpr players_t MAX_PLAYERS{1000};

	explicit StatusCache(std::shared_ptr<ServerSelector> selector);
	virtual ~StatusCache() = default;

	[[nodiscard]] boost::asio::awaitable<std::string> get_status(std::string motd, std::int32_t protocol);

	[[nodiscard]] static std::string render(const std::string& motd, std::int32_t protocol, players_t online);

protected:
	[[nodiscard]] virtual steady_clock_t::time_point now() const;

private:
	using key_t = std::tuple<std::string, std::int32_t, players_t>;

	std::shared_ptr<ServerSelector> selector;

	std::mutex mutex{};
	std::map<key_t, std::string> entries{};
	players_t player_count{0};
	std::optional<steady_clock_t::time_point> last_refresh{};
	// Set while a refresh runs, cancelled when it's done
	std::shared_ptr<boost::asio::steady_timer> refresh_done{};

	[[nodiscard]] boost::asio::awaitable<players_t> current_player_count();
};

}  // namespace mcbalancer

#endif  // MCBALANCER_STATUSCACHE_HPP
