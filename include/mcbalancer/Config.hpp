#ifndef MCBALANCER_CONFIG_HPP
#define MCBALANCER_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "BackendServer.hpp"
#include "impl/Utils.hpp"

namespace mcbalancer {

class ConfigError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

enum class Mode {
	Static,
	Geo,
	Http,
};

enum class Algorithm {
	RoundRobin,
	LowestPlayerCount,
};

enum class HttpMethod {
	Get,
	Post,
};

struct StaticConfig {
	Algorithm algorithm{Algorithm::RoundRobin};
	std::vector<BackendServer> servers{};
};

struct GeoConfig {
	std::string token{};
	// Keys are continent codes ("EU") or country codes ("US")
	std::map<std::string, BackendServer> regions{};
	BackendServer fallback{};
	std::string cache_path{"cache/geo.json"};
};

struct HttpConfig {
	std::string endpoint{};
	HttpMethod request_method{HttpMethod::Get};
	std::map<std::string, std::string> headers{};
	BackendServer fallback{};
};

struct Config {
	static constexpr port_t DEFAULT_PORT{25565};

	std::string bind_address{"0.0.0.0"};
	port_t port{DEFAULT_PORT};
	std::string motd{"A Minecraft Server"};

	Mode mode{Mode::Static};
	std::optional<StaticConfig> static_config{};
	std::optional<GeoConfig> geo{};
	std::optional<HttpConfig> http{};

	std::chrono::seconds timeout{5};
	std::string log_level{"info"};
	std::string log_file{};

	// Both parse and validate, any problem is reported as ConfigError
	[[nodiscard]] static Config from_json_string(std::string_view json);
	[[nodiscard]] static Config from_json_file(const std::filesystem::path& path);

	void validate() const;

	[[nodiscard]] static std::string_view default_config_string();
};

}  // namespace mcbalancer

#endif  // MCBALANCER_CONFIG_HPP
