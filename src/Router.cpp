#include "mcbalancer/Router.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer {

namespace {

boost::asio::ip::tcp::endpoint make_endpoint(const std::string& bind_address, port_t port) {
	return boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address(bind_address), port};
}

}  // namespace

Router::Router(boost::asio::io_context& io_context, const std::string& bind_address, port_t port,
               std::shared_ptr<const ConnectionContext> context)
    : acceptor{io_context, make_endpoint(bind_address, port)}, retry_timer{io_context}, context{std::move(context)} {
	MCBALANCER_LOG_INFO("Listening on {}:{}", bind_address, local_endpoint().port());
}

boost::asio::awaitable<void> Router::accept_clients() {
	while (acceptor.is_open()) {
		boost::system::error_code ec;
		boost::asio::ip::tcp::socket socket =
		    co_await acceptor.async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

		if (ec == boost::asio::error::operation_aborted) {
			break;
		}
		if (ec.failed()) {
			MCBALANCER_LOG_WARN("Failed to accept a connection: {}", ec.message());

			retry_timer.expires_after(ACCEPT_RETRY_DELAY);
			co_await retry_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
			continue;
		}

		const std::uint64_t id = next_connection_id.fetch_add(1);
		boost::asio::co_spawn(acceptor.get_executor(), handle_incoming(std::move(socket), id), boost::asio::detached);
	}

	MCBALANCER_LOG_INFO("Stopped accepting connections");
}

void Router::stop() {
	boost::system::error_code ec;
	acceptor.close(ec);
	retry_timer.cancel();
}

boost::asio::ip::tcp::endpoint Router::local_endpoint() const {
	return acceptor.local_endpoint();
}

boost::asio::awaitable<void> Router::handle_incoming(boost::asio::ip::tcp::socket socket, std::uint64_t id) {
	Connection connection{std::move(socket), id, context};

	co_await connection.run();
}

}  // namespace mcbalancer
