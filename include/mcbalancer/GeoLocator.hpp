#ifndef MCBALANCER_GEOLOCATOR_HPP
#define MCBALANCER_GEOLOCATOR_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mcbalancer {

class GeoLookupError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct GeoRecord {
	std::string ip{};
	std::string asn{};
	std::string as_name{};
	std::string as_domain{};
	std::string country_code{};
	std::string country{};
	std::string continent_code{};
	std::string continent{};

	// Missing fields stay empty, anything that isn't a JSON object throws GeoLookupError
	[[nodiscard]] static GeoRecord from_json(std::string_view json);
	[[nodiscard]] std::string to_json() const;
};

class GeoLocator {
public:
	virtual ~GeoLocator() = default;

	// One outbound lookup, throws on any transport or format error
	[[nodiscard]] virtual boost::asio::awaitable<GeoRecord> locate(std::string ip) = 0;
};

// Looks addresses up with the ipinfo.io Lite API over HTTPS
class IpInfoLocator : public GeoLocator {
public:
	static constexpr std::string_view HOST{"api.ipinfo.io"};
	static constexpr std::chrono::seconds DEFAULT_TIMEOUT{5};

	explicit IpInfoLocator(std::string token, std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

	[[nodiscard]] boost::asio::awaitable<GeoRecord> locate(std::string ip) override;

	[[nodiscard]] std::string request_target(std::string_view ip) const;

private:
	std::string token;
	std::chrono::milliseconds timeout;
	boost::asio::ssl::context ssl_context;
};

}  // namespace mcbalancer

#endif  // MCBALANCER_GEOLOCATOR_HPP
