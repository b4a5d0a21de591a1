#pragma once

#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "mcbalancer/BackendProbe.hpp"
#include "mcbalancer/GeoLocator.hpp"

namespace test_utils {

// Runs `operation` on `io_context` until everything queued on it is done and returns its result
template <typename T>
T run_sync(boost::asio::io_context& io_context, boost::asio::awaitable<T> operation) {
	std::optional<T> result;
	std::exception_ptr error;

	boost::asio::co_spawn(io_context, std::move(operation), [&](std::exception_ptr e, T value) {
		error = e;
		if (!e) {
			result.emplace(std::move(value));
		}
	});

	io_context.run();
	io_context.restart();

	if (error) {
		std::rethrow_exception(error);
	}

	return std::move(*result);
}

// Answers probes from a table keyed by backend address, unknown backends fail
class ScriptedProbe : public mcbalancer::BackendProbe {
public:
	std::map<std::string, std::optional<players_t>> players;
	std::chrono::milliseconds delay{0};

	int calls = 0;
	int in_flight = 0;
	int max_in_flight = 0;

	boost::asio::awaitable<std::optional<players_t>> probe(const mcbalancer::BackendServer& server,
	                                                        std::chrono::milliseconds) override {
		const std::string address = server.address;

		++calls;
		max_in_flight = std::max(max_in_flight, ++in_flight);

		if (delay.count() > 0) {
			boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor, delay};
			co_await timer.async_wait(boost::asio::use_awaitable);
		}

		--in_flight;

		const auto it = players.find(address);
		co_return it == players.end() ? std::nullopt : it->second;
	}
};

// Locates addresses from a table, unknown addresses fail
class ScriptedLocator : public mcbalancer::GeoLocator {
public:
	std::map<std::string, mcbalancer::GeoRecord> records;
	std::chrono::milliseconds delay{0};
	int calls = 0;

	boost::asio::awaitable<mcbalancer::GeoRecord> locate(std::string ip) override {
		++calls;

		if (delay.count() > 0) {
			boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor, delay};
			co_await timer.async_wait(boost::asio::use_awaitable);
		}

		const auto it = records.find(ip);
		if (it == records.end()) {
			throw mcbalancer::GeoLookupError{"No record for " + ip};
		}

		co_return it->second;
	}
};

inline mcbalancer::GeoRecord geo_record(const std::string& ip, const std::string& country_code,
                                        const std::string& continent_code) {
	mcbalancer::GeoRecord record;
	record.ip = ip;
	record.country_code = country_code;
	record.continent_code = continent_code;
	return record;
}

}  // namespace test_utils
