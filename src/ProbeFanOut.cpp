#include "mcbalancer/impl/ProbeFanOut.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer::_impl {

namespace {

struct FanOut {
	explicit FanOut(const boost::asio::any_io_executor& executor)
	    : finished{executor, boost::asio::steady_timer::time_point::max()} {}

	std::vector<BackendServer> servers{};
	probe_results_t results{};
	std::size_t next{0};
	std::size_t running{0};
	// Cancelled by the last worker to wake up the waiting caller
	boost::asio::steady_timer finished;
};

boost::asio::awaitable<void> probe_worker(std::shared_ptr<FanOut> state, std::shared_ptr<BackendProbe> prober,
                                          std::chrono::milliseconds timeout) {
	while (state->next < state->servers.size()) {
		const std::size_t index = state->next++;

		try {
			state->results[index] = co_await prober->probe(state->servers[index], timeout);
		} catch (const std::exception& e) {
			MCBALANCER_LOG_WARN("Probe of {} threw: {}", state->servers[index].to_string(), e.what());
		}
	}

	if (--state->running == 0) {
		state->finished.cancel();
	}
}

}  // namespace

boost::asio::awaitable<probe_results_t> probe_all(std::shared_ptr<BackendProbe> prober,
                                                  std::vector<BackendServer> servers, std::size_t window,
                                                  std::chrono::milliseconds timeout) {
	if (servers.empty()) {
		co_return probe_results_t{};
	}

	const auto executor = co_await boost::asio::this_coro::executor;
	auto state = std::make_shared<FanOut>(executor);
	state->results.resize(servers.size());
	state->servers = std::move(servers);
	state->running = std::clamp<std::size_t>(window, 1, state->servers.size());

	for (std::size_t i = 0; i < state->running; ++i) {
		boost::asio::co_spawn(executor, probe_worker(state, prober, timeout), boost::asio::detached);
	}

	if (state->running > 0) {
		boost::system::error_code ec;
		co_await state->finished.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
	}

	co_return std::move(state->results);
}

BackendProbe::players_t sum_players(const probe_results_t& results) {
	BackendProbe::players_t total{0};

	for (const auto& result : results) {
		total += result.value_or(0);
	}

	return total;
}

}  // namespace mcbalancer::_impl
