#include "mcbalancer/impl/Utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace mcbalancer::_impl {

std::optional<port_t> parse_port(std::string_view port_str) {
	port_t port_value{};

	const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port_value);

	if (ec != std::errc() || ptr != port_str.data() + port_str.size()) {
		return std::nullopt;
	}

	return port_value;
}

bool contains_alpha(std::string_view text) {
	return std::any_of(text.begin(), text.end(),
	                   [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
}

std::string_view strip_leading_underscores(std::string_view text) {
	const auto start = text.find_first_not_of('_');

	return (start == std::string_view::npos) ? std::string_view{} : text.substr(start);
}

std::string_view strip_trailing_dot(std::string_view text) {
	if (!text.empty() && text.back() == '.') {
		text.remove_suffix(1);
	}

	return text;
}

std::string_view trim(std::string_view text) {
	constexpr std::string_view whitespace{" \t\r\n"};

	const auto start = text.find_first_not_of(whitespace);
	if (start == std::string_view::npos) {
		return {};
	}

	const auto end = text.find_last_not_of(whitespace);
	return text.substr(start, end - start + 1);
}

}  // namespace mcbalancer::_impl
