#include "mcbalancer/Config.hpp"

#include <algorithm>
#include <boost/json.hpp>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <tuple>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer {

namespace {

const boost::json::object& expect_object(const boost::json::value& value, const std::string& what) {
	if (!value.is_object()) {
		throw ConfigError{"'" + what + "' must be an object"};
	}

	return value.as_object();
}

const boost::json::value* find(const boost::json::object& object, boost::json::string_view key) {
	const auto it = object.find(key);

	return (it == object.end() || it->value().is_null()) ? nullptr : &it->value();
}

std::optional<std::string> optional_string(const boost::json::object& object, boost::json::string_view key,
                                           const std::string& what) {
	const boost::json::value* value = find(object, key);
	if (value == nullptr) {
		return std::nullopt;
	}
	if (!value->is_string()) {
		throw ConfigError{"'" + what + "' must be a string"};
	}

	return value->as_string().c_str();
}

std::string required_string(const boost::json::object& object, boost::json::string_view key, const std::string& what) {
	auto value = optional_string(object, key, what);
	if (!value) {
		throw ConfigError{"'" + what + "' is required"};
	}

	return std::move(*value);
}

std::optional<std::int64_t> optional_integer(const boost::json::object& object, boost::json::string_view key,
                                             const std::string& what) {
	const boost::json::value* value = find(object, key);
	if (value == nullptr) {
		return std::nullopt;
	}
	if (value->is_int64()) {
		return value->as_int64();
	}
	if (value->is_uint64() && value->as_uint64() <= static_cast<std::uint64_t>(INT64_MAX)) {
		return static_cast<std::int64_t>(value->as_uint64());
	}

	throw ConfigError{"'" + what + "' must be an integer"};
}

std::optional<port_t> optional_port(const boost::json::object& object, boost::json::string_view key,
                                    const std::string& what) {
	const auto value = optional_integer(object, key, what);
	if (!value) {
		return std::nullopt;
	}
	if (*value < 1 || *value > 65535) {
		throw ConfigError{"'" + what + "' must be between 1 and 65535"};
	}

	return static_cast<port_t>(*value);
}

BackendServer parse_server(const boost::json::value& value, const std::string& what) {
	const boost::json::object& object = expect_object(value, what);

	BackendServer server;
	server.name = optional_string(object, "name", what + ".name").value_or("");
	server.address = required_string(object, "address", what + ".address");
	server.default_port = optional_port(object, "port", what + ".port").value_or(BackendServer::DEFAULT_PORT);

	if (_impl::trim(server.address).empty()) {
		throw ConfigError{"'" + what + ".address' cannot be empty"};
	}

	return server;
}

Algorithm parse_algorithm(const std::string& text) {
	if (text == "round_robin") return Algorithm::RoundRobin;
	if (text == "lowest_player_count") return Algorithm::LowestPlayerCount;

	throw ConfigError{"Unknown algorithm \"" + text + "\" (expected round_robin or lowest_player_count)"};
}

Mode parse_mode(const std::string& text) {
	if (text == "static") return Mode::Static;
	if (text == "geo") return Mode::Geo;
	if (text == "http") return Mode::Http;

	throw ConfigError{"Unknown mode \"" + text + "\" (expected static, geo or http)"};
}

HttpMethod parse_method(const std::string& text) {
	if (text == "GET") return HttpMethod::Get;
	if (text == "POST") return HttpMethod::Post;

	throw ConfigError{"Unknown request method \"" + text + "\" (expected GET or POST)"};
}

StaticConfig parse_static(const boost::json::value& value) {
	const boost::json::object& object = expect_object(value, "static");

	StaticConfig config;
	config.algorithm = parse_algorithm(required_string(object, "algorithm", "static.algorithm"));

	if (const boost::json::value* servers = find(object, "servers")) {
		if (!servers->is_array()) {
			throw ConfigError{"'static.servers' must be an array"};
		}

		const boost::json::array& entries = servers->as_array();
		for (std::size_t i = 0; i < entries.size(); ++i) {
			config.servers.push_back(parse_server(entries[i], "static.servers[" + std::to_string(i) + "]"));
		}
	}

	return config;
}

GeoConfig parse_geo(const boost::json::value& value) {
	const boost::json::object& object = expect_object(value, "geo");

	GeoConfig config;
	config.token = required_string(object, "token", "geo.token");
	config.cache_path = optional_string(object, "cache_path", "geo.cache_path").value_or(config.cache_path);

	if (const boost::json::value* regions = find(object, "regions")) {
		for (const auto& entry : expect_object(*regions, "geo.regions")) {
			const std::string code{entry.key().data(), entry.key().size()};
			config.regions.emplace(code, parse_server(entry.value(), "geo.regions." + code));
		}
	}

	const boost::json::value* fallback = find(object, "fallback");
	if (fallback == nullptr) {
		throw ConfigError{"'geo.fallback' is required"};
	}
	config.fallback = parse_server(*fallback, "geo.fallback");

	return config;
}

HttpConfig parse_http(const boost::json::value& value) {
	const boost::json::object& object = expect_object(value, "http");

	HttpConfig config;
	config.endpoint = required_string(object, "endpoint", "http.endpoint");
	config.request_method =
	    parse_method(optional_string(object, "request_method", "http.request_method").value_or("GET"));

	if (const boost::json::value* headers = find(object, "headers")) {
		for (const auto& entry : expect_object(*headers, "http.headers")) {
			const std::string name{entry.key().data(), entry.key().size()};
			if (!entry.value().is_string()) {
				throw ConfigError{"'http.headers." + name + "' must be a string"};
			}
			config.headers.emplace(name, entry.value().as_string().c_str());
		}
	}

	const boost::json::value* fallback = find(object, "fallback");
	if (fallback == nullptr) {
		throw ConfigError{"'http.fallback' is required"};
	}
	config.fallback = parse_server(*fallback, "http.fallback");

	return config;
}

}  // namespace

Config Config::from_json_string(std::string_view json) {
	boost::system::error_code ec;
	const boost::json::value parsed = boost::json::parse(boost::json::string_view{json.data(), json.size()}, ec);

	if (ec.failed()) {
		throw ConfigError{"Invalid JSON: " + ec.message()};
	}

	const boost::json::object& root = expect_object(parsed, "<root>");

	Config config;
	config.mode = parse_mode(required_string(root, "mode", "mode"));
	config.bind_address = optional_string(root, "bind_address", "bind_address").value_or(config.bind_address);
	config.port = optional_port(root, "port", "port").value_or(config.port);
	config.motd = optional_string(root, "motd", "motd").value_or(config.motd);
	config.log_level = optional_string(root, "log_level", "log_level").value_or(config.log_level);
	config.log_file = optional_string(root, "log_file", "log_file").value_or(config.log_file);

	if (const auto timeout = optional_integer(root, "timeout_seconds", "timeout_seconds")) {
		if (*timeout < 1) {
			throw ConfigError{"'timeout_seconds' must be positive"};
		}
		config.timeout = std::chrono::seconds{*timeout};
	}

	if (const boost::json::value* section = find(root, "static")) {
		config.static_config = parse_static(*section);
	}
	if (const boost::json::value* section = find(root, "geo")) {
		config.geo = parse_geo(*section);
	}
	if (const boost::json::value* section = find(root, "http")) {
		config.http = parse_http(*section);
	}

	config.validate();
	return config;
}

Config Config::from_json_file(const std::filesystem::path& path) {
	std::ifstream file{path};
	if (!file) {
		throw ConfigError{"Failed to open config file " + path.string()};
	}

	std::ostringstream contents;
	contents << file.rdbuf();

	return from_json_string(contents.str());
}

void Config::validate() const {
	try {
		std::ignore = Logger::parse_level(log_level);
	} catch (const std::invalid_argument& e) {
		throw ConfigError{e.what()};
	}

	switch (mode) {
		case Mode::Static:
			if (!static_config) {
				throw ConfigError{"mode 'static' requires a 'static' section"};
			}
			if (static_config->servers.empty()) {
				throw ConfigError{"static.servers must contain at least one server"};
			}
			break;
		case Mode::Geo:
			if (!geo) {
				throw ConfigError{"mode 'geo' requires a 'geo' section"};
			}
			if (geo->regions.empty()) {
				throw ConfigError{"geo.regions must contain at least one region entry"};
			}
			if (_impl::trim(geo->token).empty()) {
				throw ConfigError{"geo.token cannot be empty"};
			}
			break;
		case Mode::Http:
			if (!http) {
				throw ConfigError{"mode 'http' requires an 'http' section"};
			}
			if (_impl::trim(http->endpoint).empty()) {
				throw ConfigError{"http.endpoint cannot be empty"};
			}
			break;
	}
}

std::string_view Config::default_config_string() {
	return R"({
  "bind_address": "0.0.0.0",
  "port": 25565,
  "motd": "A Minecraft Server",

  "mode": "static",

  "static": {
    "algorithm": "round_robin",
    "servers": [
      { "name": "US-East", "address": "useast.example.com", "port": 25565 },
      { "name": "EU-West", "address": "euwest.example.com", "port": 25565 },
      { "name": "Asia", "address": "asia.example.com", "port": 25565 }
    ]
  },

  "geo": {
    "token": "YOUR-TOKEN",
    "regions": {
      "NA": { "address": "us.example.com" },
      "EU": { "address": "eu.example.com" },
      "AS": { "address": "asia.example.com" }
    },
    "fallback": { "address": "fallback.example.com" },
    "cache_path": "cache/geo.json"
  },

  "http": {
    "endpoint": "https://serverselector.example.com/getserver",
    "request_method": "GET",
    "headers": { "Authorization": "Bearer YOUR_API_TOKEN" },
    "fallback": { "address": "fallback.example.com" }
  },

  "timeout_seconds": 5,
  "log_level": "info"
}
)";
}

}  // namespace mcbalancer
