#ifndef MCBALANCER_TIMEOUT_HPP
#define MCBALANCER_TIMEOUT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>

namespace mcbalancer::_impl {

/**
 * Runs `operation` on the current executor and waits at most `timeout` for it.
 *
 * On expiry a `boost::system::system_error` with `timed_out` is thrown and the operation is abandoned: it keeps
 * running until it finishes on its own, its result is dropped. The operation must therefore not reference the
 * caller's frame.
 */
template <typename T>
boost::asio::awaitable<T> with_timeout(boost::asio::awaitable<T> operation,
                                       std::chrono::steady_clock::duration timeout) {
	struct State {
		explicit State(const boost::asio::any_io_executor& executor) : timer{executor} {}

		boost::asio::steady_timer timer;
		std::optional<T> result{};
		std::exception_ptr error{};
		bool done{false};
	};

	const auto executor = co_await boost::asio::this_coro::executor;
	auto state = std::make_shared<State>(executor);
	state->timer.expires_after(timeout);

	boost::asio::co_spawn(executor, std::move(operation), [state](std::exception_ptr error, T result) {
		if (state->done) {
			return;
		}

		state->done = true;
		state->error = error;
		if (!error) {
			state->result.emplace(std::move(result));
		}
		state->timer.cancel();
	});

	// The operation may already be done if it never had to suspend, cancel() then had no wait to abort
	if (!state->done) {
		boost::system::error_code ec;
		co_await state->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
	}

	if (!state->done) {
		state->done = true;
		throw boost::system::system_error{boost::asio::error::timed_out};
	}
	if (state->error) {
		std::rethrow_exception(state->error);
	}

	co_return std::move(*state->result);
}

}  // namespace mcbalancer::_impl

#endif  // MCBALANCER_TIMEOUT_HPP
