#include "mcbalancer/ServerSelector.hpp"

#include <limits>

#include "mcbalancer/Logger.hpp"
#include "mcbalancer/impl/ProbeFanOut.hpp"

namespace mcbalancer {

StaticServerSelector::StaticServerSelector(std::vector<BackendServer> servers, std::shared_ptr<BackendProbe> prober,
                                           std::chrono::milliseconds timeout)
    : servers{std::move(servers)}, prober{std::move(prober)}, timeout{timeout} {}

boost::asio::awaitable<ServerSelector::players_t> StaticServerSelector::get_player_count() {
	const _impl::probe_results_t results = co_await _impl::probe_all(prober, servers, PROBE_WINDOW, timeout);

	co_return _impl::sum_players(results);
}

const std::vector<BackendServer>& StaticServerSelector::get_servers() const {
	return servers;
}

void StaticServerSelector::require_servers() const {
	if (servers.empty()) {
		throw SelectorError{"No servers available"};
	}
}

boost::asio::awaitable<BackendServer> RoundRobinSelector::find_server(boost::asio::ip::address client) {
	require_servers();

	std::size_t index;
	{
		const std::lock_guard<std::mutex> lock{cursor_mutex};
		index = cursor;
		cursor = (cursor + 1) % servers.size();
	}

	MCBALANCER_LOG_DEBUG("Round robin picked {} for {}", servers[index].to_string(), client.to_string());
	co_return servers[index];
}

boost::asio::awaitable<BackendServer> LowestLoadSelector::find_server(boost::asio::ip::address client) {
	require_servers();

	const _impl::probe_results_t results = co_await _impl::probe_all(prober, servers, PROBE_WINDOW, timeout);

	std::size_t best = 0;
	players_t best_score = std::numeric_limits<players_t>::max();
	for (std::size_t i = 0; i < results.size(); ++i) {
		const players_t score = results[i].value_or(std::numeric_limits<players_t>::max());

		if (score < best_score) {
			best = i;
			best_score = score;
		}
	}

	MCBALANCER_LOG_DEBUG("Lowest player count picked {} for {}", servers[best].to_string(), client.to_string());
	co_return servers[best];
}

GeoServerSelector::GeoServerSelector(std::map<std::string, BackendServer> regions, BackendServer fallback,
                                     std::shared_ptr<GeoCache> geo_cache, std::shared_ptr<BackendProbe> prober,
                                     std::chrono::milliseconds timeout)
    : regions{std::move(regions)},
      fallback{std::move(fallback)},
      geo_cache{std::move(geo_cache)},
      prober{std::move(prober)},
      timeout{timeout} {}

boost::asio::awaitable<ServerSelector::players_t> GeoServerSelector::get_player_count() {
	std::vector<BackendServer> servers;
	servers.reserve(regions.size() + 1);

	for (const auto& [code, server] : regions) {
		servers.push_back(server);
	}
	servers.push_back(fallback);

	const _impl::probe_results_t results =
	    co_await _impl::probe_all(prober, std::move(servers), PROBE_WINDOW, timeout);

	co_return _impl::sum_players(results);
}

boost::asio::awaitable<BackendServer> GeoServerSelector::find_server(boost::asio::ip::address client) {
	const std::string ip = client.to_string();

	try {
		const GeoRecord record = co_await geo_cache->lookup(ip);
		const BackendServer& server = select(record);

		MCBALANCER_LOG_DEBUG("Geo lookup placed {} in {}/{}, picked {}", ip, record.continent_code,
		                     record.country_code, server.to_string());
		co_return server;
	} catch (const std::exception& e) {
		MCBALANCER_LOG_WARN("Geo lookup for {} failed, using fallback: {}", ip, e.what());
	}

	co_return fallback;
}

const BackendServer& GeoServerSelector::select(const GeoRecord& record) const {
	if (const auto it = regions.find(record.continent_code); !record.continent_code.empty() && it != regions.end()) {
		return it->second;
	}
	if (const auto it = regions.find(record.country_code); !record.country_code.empty() && it != regions.end()) {
		return it->second;
	}

	return fallback;
}

std::shared_ptr<ServerSelector> make_selector(const Config& config, std::shared_ptr<BackendProbe> prober,
                                              std::shared_ptr<GeoCache> geo_cache) {
	const std::chrono::milliseconds timeout = config.timeout;

	switch (config.mode) {
		case Mode::Static:
			if (!config.static_config) {
				throw ConfigError{"mode 'static' requires a 'static' section"};
			}

			switch (config.static_config->algorithm) {
				case Algorithm::RoundRobin:
					return std::make_shared<RoundRobinSelector>(config.static_config->servers, std::move(prober),
					                                            timeout);
				case Algorithm::LowestPlayerCount:
					return std::make_shared<LowestLoadSelector>(config.static_config->servers, std::move(prober),
					                                            timeout);
			}
			break;
		case Mode::Geo:
			if (!config.geo) {
				throw ConfigError{"mode 'geo' requires a 'geo' section"};
			}
			if (!geo_cache) {
				throw ConfigError{"mode 'geo' requires a geolocation cache"};
			}

			return std::make_shared<GeoServerSelector>(config.geo->regions, config.geo->fallback,
			                                           std::move(geo_cache), std::move(prober), timeout);
		case Mode::Http:
			throw ConfigError{"mode 'http' is not supported"};
	}

	throw ConfigError{"Unknown selection mode"};
}

}  // namespace mcbalancer
