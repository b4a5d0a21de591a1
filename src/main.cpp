#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "mcbalancer/BackendProbe.hpp"
#include "mcbalancer/Config.hpp"
#include "mcbalancer/EndpointResolver.hpp"
#include "mcbalancer/GeoCache.hpp"
#include "mcbalancer/GeoLocator.hpp"
#include "mcbalancer/KeyValueStore.hpp"
#include "mcbalancer/Logger.hpp"
#include "mcbalancer/Router.hpp"
#include "mcbalancer/ServerSelector.hpp"
#include "mcbalancer/StatusCache.hpp"

namespace {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";
constexpr std::size_t BLOCKING_THREADS = 4;

void print_usage(const char* program) {
	std::cout << "Minecraft connection balancer\n";
	std::cout << "Usage: " << program << " [options]\n\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>       Load configuration from file (default: " << DEFAULT_CONFIG_FILE << ")\n";
	std::cout << "  --print-default-config    Print a sample configuration and exit\n";
	std::cout << "  -h, --help                Show this help message\n";
}

std::shared_ptr<mcbalancer::GeoCache> make_geo_cache(const mcbalancer::Config& config) {
	if (config.mode != mcbalancer::Mode::Geo || !config.geo) {
		return nullptr;
	}

	auto store = std::make_shared<mcbalancer::JsonFileStore>(config.geo->cache_path);
	auto locator = std::make_shared<mcbalancer::IpInfoLocator>(config.geo->token, config.timeout);

	return std::make_shared<mcbalancer::GeoCache>(std::move(store), std::move(locator));
}

}  // namespace

int main(int argc, char* argv[]) {
	std::string config_file{DEFAULT_CONFIG_FILE};

	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];

		if (arg == "-h" || arg == "--help") {
			print_usage(argv[0]);
			return 0;
		} else if (arg == "--print-default-config") {
			std::cout << mcbalancer::Config::default_config_string();
			return 0;
		} else if (arg == "-c" || arg == "--config") {
			if (i + 1 >= argc) {
				std::cerr << "Error: " << arg << " requires a filename\n";
				return 1;
			}
			config_file = argv[++i];
		} else {
			std::cerr << "Error: unknown option " << arg << "\n";
			print_usage(argv[0]);
			return 1;
		}
	}

	mcbalancer::Config config;
	try {
		config = mcbalancer::Config::from_json_file(config_file);
	} catch (const mcbalancer::ConfigError& e) {
		std::cerr << "Error: invalid configuration in " << config_file << ": " << e.what() << "\n";
		return 1;
	}

	mcbalancer::Logger::init(mcbalancer::Logger::parse_level(config.log_level), config.log_file);
	MCBALANCER_LOG_INFO("Loaded configuration from {}", config_file);

	boost::asio::io_context io_context;
	boost::asio::thread_pool blocking_pool{BLOCKING_THREADS};

	auto resolver = std::make_shared<const mcbalancer::EndpointResolver>(blocking_pool.get_executor());
	auto prober = std::make_shared<mcbalancer::JavaBackendProbe>(resolver);

	std::shared_ptr<mcbalancer::ServerSelector> selector;
	try {
		selector = mcbalancer::make_selector(config, prober, make_geo_cache(config));
	} catch (const std::runtime_error& e) {
		MCBALANCER_LOG_ERROR("Failed to set up server selection: {}", e.what());
		mcbalancer::Logger::shutdown();
		return 1;
	}

	auto context = std::make_shared<const mcbalancer::ConnectionContext>(mcbalancer::ConnectionContext{
	    config.motd, selector, std::make_shared<mcbalancer::StatusCache>(selector), resolver});

	std::unique_ptr<mcbalancer::Router> router;
	try {
		router = std::make_unique<mcbalancer::Router>(io_context, config.bind_address, config.port, context);
	} catch (const boost::system::system_error& e) {
		MCBALANCER_LOG_ERROR("Failed to listen on {}:{}: {}", config.bind_address, config.port, e.what());
		mcbalancer::Logger::shutdown();
		return 1;
	}

	boost::asio::signal_set signals{io_context, SIGINT, SIGTERM};
	signals.async_wait([&](const boost::system::error_code& ec, int signal) {
		if (ec) {
			return;
		}

		MCBALANCER_LOG_INFO("Received signal {}, shutting down", signal);
		router->stop();
		io_context.stop();
	});

	boost::asio::co_spawn(io_context, router->accept_clients(), boost::asio::detached);
	io_context.run();

	blocking_pool.stop();
	blocking_pool.join();

	MCBALANCER_LOG_INFO("Shutdown complete");
	mcbalancer::Logger::shutdown();

	return 0;
}
