#ifndef MCBALANCER_LOGGER_HPP
#define MCBALANCER_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>

namespace mcbalancer {

/**
 * Process wide logger backed by spdlog.
 *
 * Until init() is called every message goes to spdlog's default logger, so the library can log from tests
 * without any setup.
 */
class Logger {
public:
	// `log_file` may be empty to only log to the console
	static void init(spdlog::level::level_enum level, const std::string& log_file = {});
	static void shutdown();

	[[nodiscard]] static std::shared_ptr<spdlog::logger> get();

	// Accepts trace, debug, info, warn and error
	[[nodiscard]] static spdlog::level::level_enum parse_level(const std::string& level);

	template <typename... Args>
	static void trace(fmt::format_string<Args...> fmt, Args&&... args) {
		get()->trace(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
		get()->debug(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	static void info(fmt::format_string<Args...> fmt, Args&&... args) {
		get()->info(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
		get()->warn(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	static void error(fmt::format_string<Args...> fmt, Args&&... args) {
		get()->error(fmt, std::forward<Args>(args)...);
	}

private:
	static std::shared_ptr<spdlog::logger> s_logger;
};

#define MCBALANCER_LOG_TRACE(...) ::mcbalancer::Logger::trace(__VA_ARGS__)
#define MCBALANCER_LOG_DEBUG(...) ::mcbalancer::Logger::debug(__VA_ARGS__)
#define MCBALANCER_LOG_INFO(...) ::mcbalancer::Logger::info(__VA_ARGS__)
#define MCBALANCER_LOG_WARN(...) ::mcbalancer::Logger::warn(__VA_ARGS__)
#define MCBALANCER_LOG_ERROR(...) ::mcbalancer::Logger::error(__VA_ARGS__)

}  // namespace mcbalancer

#endif  // MCBALANCER_LOGGER_HPP
