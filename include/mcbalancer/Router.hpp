#ifndef MCBALANCER_ROUTER_HPP
#define MCBALANCER_ROUTER_HPP

#include <atomic>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "Connection.hpp"
#include "impl/Utils.hpp"

namespace mcbalancer {

// Listens for clients and serves every accepted socket with its own Connection
class Router {
public:
	// Pause after a failed accept, e.g. while the process is out of file descriptors
	static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

	// Binds right away, failures surface as boost::system::system_error
	Router(boost::asio::io_context& io_context, const std::string& bind_address, port_t port,
	       std::shared_ptr<const ConnectionContext> context);

	// Accepts until stop() is called
	boost::asio::awaitable<void> accept_clients();
	void stop();

	[[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
	boost::asio::ip::tcp::acceptor acceptor;
	boost::asio::steady_timer retry_timer;
	std::shared_ptr<const ConnectionContext> context;
	std::atomic<std::uint64_t> next_connection_id{0};

	boost::asio::awaitable<void> handle_incoming(boost::asio::ip::tcp::socket socket, std::uint64_t id);
};

}  // namespace mcbalancer

#endif  // MCBALANCER_ROUTER_HPP
