#include "mcbalancer/StatusCache.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/json.hpp>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer {

StatusCache::StatusCache(std::shared_ptr<ServerSelector> selector) : selector{std::move(selector)} {}

boost::asio::awaitable<std::string> StatusCache::get_status(std::string motd, std::int32_t protocol) {
	const players_t online = co_await current_player_count();

	const std::lock_guard<std::mutex> lock{mutex};
	key_t key{std::move(motd), protocol, online};

	if (const auto it = entries.find(key); it != entries.end()) {
		co_return it->second;
	}

	std::string payload = render(std::get<0>(key), protocol, online);
	entries.emplace(std::move(key), payload);

	co_return payload;
}

std::string StatusCache::render(const std::string& motd, std::int32_t protocol, players_t online) {
	boost::json::object version;
	version["name"] = boost::json::string_view{VERSION_NAME.data(), VERSION_NAME.size()};
	version["protocol"] = protocol;

	boost::json::object players;
	players["max"] = MAX_PLAYERS;
	players["online"] = online;
	players["sample"] = boost::json::array{};

	boost::json::object status;
	status["version"] = std::move(version);
	status["players"] = std::move(players);
	status["description"] = boost::json::string_view{motd};
	status["enforcesSecureChat"] = false;

	return boost::json::serialize(status);
}

StatusCache::steady_clock_t::time_point StatusCache::now() const {
	return steady_clock_t::now();
}

boost::asio::awaitable<StatusCache::players_t> StatusCache::current_player_count() {
	const auto executor = co_await boost::asio::this_coro::executor;

	while (true) {
		std::shared_ptr<boost::asio::steady_timer> running_refresh;

		{
			const std::lock_guard<std::mutex> lock{mutex};

			if (last_refresh && now() - *last_refresh <= REFRESH_INTERVAL) {
				co_return player_count;
			}

			if (refresh_done) {
				running_refresh = refresh_done;
			} else {
				refresh_done =
				    std::make_shared<boost::asio::steady_timer>(executor, steady_clock_t::time_point::max());
			}
		}

		if (running_refresh) {
			boost::system::error_code ec;
			co_await running_refresh->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
			continue;
		}

		break;
	}

	std::optional<players_t> refreshed;
	try {
		refreshed = co_await selector->get_player_count();
	} catch (const std::exception& e) {
		MCBALANCER_LOG_WARN("Failed to refresh the player count: {}", e.what());
	}

	std::shared_ptr<boost::asio::steady_timer> finished;
	players_t count;
	{
		const std::lock_guard<std::mutex> lock{mutex};

		if (refreshed) {
			player_count = *refreshed;
		}
		last_refresh = now();
		count = player_count;
		finished = std::move(refresh_done);
		refresh_done.reset();
	}

	MCBALANCER_LOG_DEBUG("Player count refreshed: {}", count);
	finished->cancel();

	co_return count;
}

}  // namespace mcbalancer
