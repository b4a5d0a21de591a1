#include "mcbalancer/GeoCache.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer {

GeoCache::GeoCache(std::shared_ptr<KeyValueStore> store, std::shared_ptr<GeoLocator> locator)
    : store{std::move(store)}, locator{std::move(locator)} {}

boost::asio::awaitable<GeoRecord> GeoCache::lookup(std::string ip) {
	const auto executor = co_await boost::asio::this_coro::executor;

	while (true) {
		if (auto cached = stored(ip)) {
			co_return std::move(*cached);
		}

		std::shared_ptr<boost::asio::steady_timer> running_lookup;

		{
			const std::lock_guard<std::mutex> lock{mutex};

			const auto it = pending.find(ip);
			if (it != pending.end()) {
				running_lookup = it->second;
			} else {
				pending.emplace(ip, std::make_shared<boost::asio::steady_timer>(
				                        executor, boost::asio::steady_timer::time_point::max()));
			}
		}

		if (running_lookup) {
			boost::system::error_code ec;
			co_await running_lookup->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
			continue;
		}

		break;
	}

	// Wakes the waiters however the locate ends
	struct PendingGuard {
		GeoCache& cache;
		const std::string& ip;

		~PendingGuard() {
			cache.finish(ip);
		}
	} const guard{*this, ip};

	const GeoRecord record = co_await locator->locate(ip);
	store->put(ip, record.to_json());

	MCBALANCER_LOG_DEBUG("Located {} in {} / {}", ip, record.continent_code, record.country_code);
	co_return record;
}

std::optional<GeoRecord> GeoCache::stored(const std::string& ip) const {
	const std::optional<std::string> cached = store->get(ip);
	if (!cached) {
		return std::nullopt;
	}

	try {
		return GeoRecord::from_json(*cached);
	} catch (const GeoLookupError& e) {
		MCBALANCER_LOG_WARN("Dropping unreadable cached geolocation of {}: {}", ip, e.what());
		return std::nullopt;
	}
}

void GeoCache::finish(const std::string& ip) {
	std::shared_ptr<boost::asio::steady_timer> finished;

	{
		const std::lock_guard<std::mutex> lock{mutex};

		const auto it = pending.find(ip);
		if (it == pending.end()) {
			return;
		}
		finished = std::move(it->second);
		pending.erase(it);
	}

	finished->cancel();
}

}  // namespace mcbalancer
