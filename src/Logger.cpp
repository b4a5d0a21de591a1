#include "mcbalancer/Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <stdexcept>
#include <vector>

namespace mcbalancer {

std::shared_ptr<spdlog::logger> Logger::s_logger;

void Logger::init(spdlog::level::level_enum level, const std::string& log_file) {
	try {
		std::vector<spdlog::sink_ptr> sinks;

		auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
		sinks.push_back(console_sink);

		if (!log_file.empty()) {
			auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, 1024 * 1024 * 5,
			                                                                        3);  // 5MB, 3 files
			file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
			sinks.push_back(file_sink);
		}

		s_logger = std::make_shared<spdlog::logger>("mcbalancer", sinks.begin(), sinks.end());
		s_logger->set_level(level);
		s_logger->flush_on(spdlog::level::warn);

		spdlog::register_logger(s_logger);
		spdlog::set_default_logger(s_logger);
	} catch (const spdlog::spdlog_ex& ex) {
		std::fprintf(stderr, "Logger init failed: %s\n", ex.what());
	}
}

void Logger::shutdown() {
	if (s_logger) {
		s_logger->flush();
	}
	s_logger.reset();
	spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Logger::get() {
	return s_logger ? s_logger : spdlog::default_logger();
}

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
	if (level == "trace") return spdlog::level::trace;
	if (level == "debug") return spdlog::level::debug;
	if (level == "info") return spdlog::level::info;
	if (level == "warn") return spdlog::level::warn;
	if (level == "error") return spdlog::level::err;

	throw std::invalid_argument("Unknown log level \"" + level + "\"");
}

}  // namespace mcbalancer
