#include "mcbalancer/GeoLocator.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer {

namespace {

std::string string_field(const boost::json::object& object, boost::json::string_view key) {
	const auto it = object.find(key);
	if (it == object.end() || !it->value().is_string()) {
		return {};
	}

	return it->value().as_string().c_str();
}

}  // namespace

GeoRecord GeoRecord::from_json(std::string_view json) {
	boost::system::error_code ec;
	const boost::json::value parsed = boost::json::parse(boost::json::string_view{json.data(), json.size()}, ec);

	if (ec.failed()) {
		throw GeoLookupError{"Invalid geolocation response: " + ec.message()};
	}
	if (!parsed.is_object()) {
		throw GeoLookupError{"Geolocation response is not a JSON object"};
	}

	const boost::json::object& object = parsed.as_object();

	GeoRecord record;
	record.ip = string_field(object, "ip");
	record.asn = string_field(object, "asn");
	record.as_name = string_field(object, "as_name");
	record.as_domain = string_field(object, "as_domain");
	record.country_code = string_field(object, "country_code");
	record.country = string_field(object, "country");
	record.continent_code = string_field(object, "continent_code");
	record.continent = string_field(object, "continent");

	return record;
}

std::string GeoRecord::to_json() const {
	boost::json::object object;
	object["ip"] = boost::json::string_view{ip};
	object["asn"] = boost::json::string_view{asn};
	object["as_name"] = boost::json::string_view{as_name};
	object["as_domain"] = boost::json::string_view{as_domain};
	object["country_code"] = boost::json::string_view{country_code};
	object["country"] = boost::json::string_view{country};
	object["continent_code"] = boost::json::string_view{continent_code};
	object["continent"] = boost::json::string_view{continent};

	return boost::json::serialize(object);
}

IpInfoLocator::IpInfoLocator(std::string token, std::chrono::milliseconds timeout)
    : token{std::move(token)}, timeout{timeout}, ssl_context{boost::asio::ssl::context::tls_client} {
	ssl_context.set_default_verify_paths();
	ssl_context.set_verify_mode(boost::asio::ssl::verify_peer);
}

std::string IpInfoLocator::request_target(std::string_view ip) const {
	return "/lite/" + std::string{ip} + "?token=" + token;
}

boost::asio::awaitable<GeoRecord> IpInfoLocator::locate(std::string ip) {
	namespace beast = boost::beast;
	namespace http = beast::http;

	const auto executor = co_await boost::asio::this_coro::executor;
	const std::string host{HOST};

	boost::asio::ip::tcp::resolver resolver{executor};
	beast::ssl_stream<beast::tcp_stream> stream{executor, ssl_context};

	if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
		throw beast::system_error{
		    beast::error_code{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()}};
	}
	stream.set_verify_callback(boost::asio::ssl::host_name_verification{host});

	const auto results = co_await resolver.async_resolve(host, "443", boost::asio::use_awaitable);

	beast::get_lowest_layer(stream).expires_after(timeout);
	co_await beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
	co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

	http::request<http::empty_body> request{http::verb::get, request_target(ip), 11};
	request.set(http::field::host, host);
	request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
	request.set(http::field::accept, "application/json");
	co_await http::async_write(stream, request, boost::asio::use_awaitable);

	beast::flat_buffer buffer;
	http::response<http::string_body> response;
	co_await http::async_read(stream, buffer, response, boost::asio::use_awaitable);

	// Servers commonly drop the connection without a close_notify, the response is complete either way
	beast::error_code shutdown_ec;
	co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, shutdown_ec));
	if (shutdown_ec && shutdown_ec != boost::asio::ssl::error::stream_truncated) {
		MCBALANCER_LOG_DEBUG("TLS shutdown with {} failed: {}", host, shutdown_ec.message());
	}

	if (response.result() != http::status::ok) {
		throw GeoLookupError{"Geolocation lookup of " + ip + " failed with HTTP " +
		                     std::to_string(response.result_int())};
	}

	GeoRecord record = GeoRecord::from_json(response.body());
	if (record.ip.empty()) {
		record.ip = ip;
	}

	co_return record;
}

}  // namespace mcbalancer
