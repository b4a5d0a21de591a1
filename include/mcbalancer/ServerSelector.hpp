#ifndef MCBALANCER_SERVERSELECTOR_HPP
#define MCBALANCER_SERVERSELECTOR_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "BackendProbe.hpp"
#include "BackendServer.hpp"
#include "Config.hpp"
#include "GeoCache.hpp"

namespace mcbalancer {

class SelectorError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Picks the backend a client gets transferred to and aggregates the player count shown in the server list.
 *
 * One instance is shared by every connection of the process.
 */
class ServerSelector {
public:
	using players_t = BackendProbe::players_t;

	virtual ~ServerSelector() = default;

	// Sum of the online players over the whole pool, unreachable backends count as 0
	[[nodiscard]] virtual boost::asio::awaitable<players_t> get_player_count() = 0;
	[[nodiscard]] virtual boost::asio::awaitable<BackendServer> find_server(boost::asio::ip::address client) = 0;
};

// Selectors choosing from a fixed, ordered list of backends
class StaticServerSelector : public ServerSelector {
public:
	static constexpr std::size_t PROBE_WINDOW{5};

	StaticServerSelector(std::vector<BackendServer> servers, std::shared_ptr<BackendProbe> prober,
	                     std::chrono::milliseconds timeout = BackendProbe::DEFAULT_TIMEOUT);

	[[nodiscard]] boost::asio::awaitable<players_t> get_player_count() override;

	[[nodiscard]] const std::vector<BackendServer>& get_servers() const;

protected:
	std::vector<BackendServer> servers;
	std::shared_ptr<BackendProbe> prober;
	std::chrono::milliseconds timeout;

	void require_servers() const;
};

class RoundRobinSelector : public StaticServerSelector {
public:
	using StaticServerSelector::StaticServerSelector;

	// Hands out the backends in pool order, starting with the first one
	[[nodiscard]] boost::asio::awaitable<BackendServer> find_server(boost::asio::ip::address client) override;

private:
	std::mutex cursor_mutex{};
	std::size_t cursor{0};
};

class LowestLoadSelector : public StaticServerSelector {
public:
	using StaticServerSelector::StaticServerSelector;

	/**
	 * Probes the whole pool and returns the backend with the fewest players online.
	 *
	 * Backends that fail to answer rank last. Ties go to the backend listed first, so with every probe failing
	 * the first backend is returned.
	 */
	[[nodiscard]] boost::asio::awaitable<BackendServer> find_server(boost::asio::ip::address client) override;
};

class GeoServerSelector : public ServerSelector {
public:
	static constexpr std::size_t PROBE_WINDOW{8};

	GeoServerSelector(std::map<std::string, BackendServer> regions, BackendServer fallback,
	                  std::shared_ptr<GeoCache> geo_cache, std::shared_ptr<BackendProbe> prober,
	                  std::chrono::milliseconds timeout = BackendProbe::DEFAULT_TIMEOUT);

	[[nodiscard]] boost::asio::awaitable<players_t> get_player_count() override;

	// Never throws, geolocation failures fall back to the fallback backend
	[[nodiscard]] boost::asio::awaitable<BackendServer> find_server(boost::asio::ip::address client) override;

	// Region for the record's continent code, else its country code, else the fallback
	[[nodiscard]] const BackendServer& select(const GeoRecord& record) const;

private:
	std::map<std::string, BackendServer> regions;
	BackendServer fallback;
	std::shared_ptr<GeoCache> geo_cache;
	std::shared_ptr<BackendProbe> prober;
	std::chrono::milliseconds timeout;
};

/**
 * Builds the selector for the configured mode. `geo_cache` is only used in geo mode and may be null otherwise.
 *
 * @throws ConfigError for modes without a selector implementation
 */
[[nodiscard]] std::shared_ptr<ServerSelector> make_selector(const Config& config,
                                                            std::shared_ptr<BackendProbe> prober,
                                                            std::shared_ptr<GeoCache> geo_cache);

}  // namespace mcbalancer

#endif  // MCBALANCER_SERVERSELECTOR_HPP
