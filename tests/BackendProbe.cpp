#include "mcbalancer/BackendProbe.hpp"

#include <gtest/gtest.h>

#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>

#include "TestUtils.hpp"
#include "mcbalancer/Packets.hpp"

using namespace mcbalancer;
using boost::asio::ip::tcp;
using test_utils::run_sync;

class BackendProbeTest : public ::testing::Test {
protected:
	boost::asio::io_context io_context;
	tcp::acceptor acceptor{io_context, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
	JavaBackendProbe prober{std::make_shared<const EndpointResolver>()};

	std::optional<packets::Handshake> received_handshake;

	[[nodiscard]] BackendServer local_server() const {
		return BackendServer{"local", "127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()),
		                     BackendServer::DEFAULT_PORT};
	}

	// Accepts one client, reads its handshake and status request and answers with `json_response`
	boost::asio::awaitable<void> serve_status(std::string json_response) {
		tcp::socket socket = co_await acceptor.async_accept(boost::asio::use_awaitable);
		McPacket::buffer_t pending;

		McPacket handshake = co_await McPacket::async_read_from_socket(socket, pending);
		EXPECT_EQ(handshake.read_varint(), packets::Handshake::ID);
		received_handshake = packets::Handshake::read(handshake);

		McPacket request = co_await McPacket::async_read_from_socket(socket, pending);
		EXPECT_EQ(request.read_varint(), packets::StatusRequest::ID);

		McPacket response;
		packets::StatusResponse{std::move(json_response)}.write(response);
		co_await response.async_write_to_socket(socket);
	}

	// Accepts one client and never answers, returns once the client gave up
	boost::asio::awaitable<void> serve_silence() {
		tcp::socket socket = co_await acceptor.async_accept(boost::asio::use_awaitable);
		std::array<std::uint8_t, 256> data{};
		boost::system::error_code ec;

		while (!ec) {
			co_await socket.async_read_some(boost::asio::buffer(data),
			                                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
		}
	}
};

TEST_F(BackendProbeTest, ReportsOnlinePlayers) {
	boost::asio::co_spawn(io_context, serve_status(R"({"version":{"name":"1.21.8","protocol":772},)"
	                                               R"("players":{"max":100,"online":17},"description":"hi"})"),
	                      boost::asio::detached);

	const std::optional<BackendProbe::players_t> online =
	    run_sync(io_context, prober.probe(local_server(), std::chrono::seconds{2}));

	EXPECT_EQ(online, 17);

	ASSERT_TRUE(received_handshake.has_value());
	EXPECT_EQ(received_handshake->protocol_version, JavaBackendProbe::PROTOCOL_VERSION);
	EXPECT_EQ(received_handshake->server_address, "127.0.0.1");
	EXPECT_EQ(received_handshake->server_port, acceptor.local_endpoint().port());
	EXPECT_EQ(received_handshake->next_state, packets::NextState::Status);
}

TEST_F(BackendProbeTest, InvalidResponse) {
	boost::asio::co_spawn(io_context, serve_status("not json"), boost::asio::detached);

	EXPECT_EQ(run_sync(io_context, prober.probe(local_server(), std::chrono::seconds{2})), std::nullopt);
}

TEST_F(BackendProbeTest, MissingPlayers) {
	boost::asio::co_spawn(io_context, serve_status(R"({"description":"hi"})"), boost::asio::detached);

	EXPECT_EQ(run_sync(io_context, prober.probe(local_server(), std::chrono::seconds{2})), std::nullopt);
}

TEST_F(BackendProbeTest, SilentServerTimesOut) {
	boost::asio::co_spawn(io_context, serve_silence(), boost::asio::detached);

	const auto start = std::chrono::steady_clock::now();
	const std::optional<BackendProbe::players_t> online =
	    run_sync(io_context, prober.probe(local_server(), std::chrono::milliseconds{200}));
	const auto elapsed = std::chrono::steady_clock::now() - start;

	EXPECT_EQ(online, std::nullopt);
	EXPECT_GE(elapsed, std::chrono::milliseconds{200});
	EXPECT_LT(elapsed, std::chrono::seconds{3});
}

TEST_F(BackendProbeTest, ClosedPort) {
	const BackendServer server = local_server();
	acceptor.close();

	EXPECT_EQ(run_sync(io_context, prober.probe(server, std::chrono::seconds{2})), std::nullopt);
}

TEST_F(BackendProbeTest, InvalidAddress) {
	const BackendServer server{"broken", "[::1", BackendServer::DEFAULT_PORT};

	EXPECT_EQ(run_sync(io_context, prober.probe(server, std::chrono::seconds{2})), std::nullopt);
}

// =====================================================================================================================
TEST(BackendProbeParseTest, OnlinePlayers) {
	EXPECT_EQ(JavaBackendProbe::parse_online_players(R"({"players":{"max":20,"online":0}})"), 0);
	EXPECT_EQ(JavaBackendProbe::parse_online_players(R"({"players":{"max":20,"online":12,"sample":[]}})"), 12);
	EXPECT_EQ(JavaBackendProbe::parse_online_players(R"({"players":{"online":3000000000}})"), 3000000000);
}

TEST(BackendProbeParseTest, Invalid) {
	EXPECT_THROW(std::ignore = JavaBackendProbe::parse_online_players("[]"), std::runtime_error);
	EXPECT_THROW(std::ignore = JavaBackendProbe::parse_online_players(R"({"players":5})"), std::runtime_error);
	EXPECT_THROW(std::ignore = JavaBackendProbe::parse_online_players(R"({"players":{"max":20}})"),
	             std::runtime_error);
	EXPECT_THROW(std::ignore = JavaBackendProbe::parse_online_players(R"({"players":{"online":-1}})"),
	             std::runtime_error);
	EXPECT_THROW(std::ignore = JavaBackendProbe::parse_online_players(R"({"players":{"online":"12"}})"),
	             std::runtime_error);
	EXPECT_THROW(std::ignore = JavaBackendProbe::parse_online_players(R"({"players":{"online":1.5}})"),
	             std::runtime_error);
}
