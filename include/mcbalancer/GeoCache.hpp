#ifndef MCBALANCER_GEOCACHE_HPP
#define MCBALANCER_GEOCACHE_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "GeoLocator.hpp"
#include "KeyValueStore.hpp"

namespace mcbalancer {

/**
 * Geolocation records fetched at most once per address for the lifetime of the store.
 *
 * Concurrent misses for the same address share one locate() call. The others wait for it to finish and then read
 * the stored record, or locate again themselves if it failed.
 */
class GeoCache {
public:
	GeoCache(std::shared_ptr<KeyValueStore> store, std::shared_ptr<GeoLocator> locator);

	// Returns the stored record, or locates `ip`, stores the result and returns it
	[[nodiscard]] boost::asio::awaitable<GeoRecord> lookup(std::string ip);

private:
	std::shared_ptr<KeyValueStore> store;
	std::shared_ptr<GeoLocator> locator;

	std::mutex mutex{};
	// One timer per address being located, cancelled when the locate is done
	std::map<std::string, std::shared_ptr<boost::asio::steady_timer>> pending{};

	[[nodiscard]] std::optional<GeoRecord> stored(const std::string& ip) const;
	void finish(const std::string& ip);
};

}  // namespace mcbalancer

#endif  // MCBALANCER_GEOCACHE_HPP
