#ifndef MCBALANCER_UTILS_HPP
#define MCBALANCER_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace mcbalancer {

using port_t = std::uint16_t;

namespace _impl {

// Whole string must be a decimal number in [0, 65535], anything else yields std::nullopt
std::optional<port_t> parse_port(std::string_view port_string);

bool contains_alpha(std::string_view text);

std::string_view strip_leading_underscores(std::string_view text);
std::string_view strip_trailing_dot(std::string_view text);
std::string_view trim(std::string_view text);

}  // namespace _impl

}  // namespace mcbalancer

#endif  // MCBALANCER_UTILS_HPP
