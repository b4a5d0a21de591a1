#include "mcbalancer/impl/Utils.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace mcbalancer::_impl;

// Test valid port numbers
TEST(ParsePortTest, ValidPortNumbers) {
	// Test common valid ports
	EXPECT_EQ(parse_port("80"), 80);
	EXPECT_EQ(parse_port("443"), 443);
	EXPECT_EQ(parse_port("25565"), 25565);  // Minecraft default
	EXPECT_EQ(parse_port("8080"), 8080);

	// Test edge cases for valid ports
	EXPECT_EQ(parse_port("1"), 1);          // Minimum valid port
	EXPECT_EQ(parse_port("65535"), 65535);  // Maximum valid port
}

// Test invalid port numbers - empty and non-numeric
TEST(ParsePortTest, InvalidInputs) {
	// Test empty string
	EXPECT_EQ(parse_port(""), std::nullopt);

	// Test non-numeric strings
	EXPECT_EQ(parse_port("abc"), std::nullopt);
	EXPECT_EQ(parse_port("port"), std::nullopt);
	EXPECT_EQ(parse_port("http"), std::nullopt);

	// Test strings starting with non-digit
	EXPECT_EQ(parse_port("-80"), std::nullopt);  // Negative number
	EXPECT_EQ(parse_port("+80"), std::nullopt);  // Plus sign
	EXPECT_EQ(parse_port(" 80"), std::nullopt);  // Leading space
}

// Test boundary conditions
TEST(ParsePortTest, BoundaryConditions) {
	EXPECT_EQ(parse_port("0"), 0);

	// Test numbers beyond valid port range
	EXPECT_EQ(parse_port("65536"), std::nullopt);       // Just above max port
	EXPECT_EQ(parse_port("99999"), std::nullopt);       // Way above max port
	EXPECT_EQ(parse_port("4294967295"), std::nullopt);  // Max uint32
}

// Anything behind the digits makes the whole string invalid
TEST(ParsePortTest, TrailingCharacters) {
	EXPECT_EQ(parse_port("80abc"), std::nullopt);
	EXPECT_EQ(parse_port("8080xyz"), std::nullopt);
	EXPECT_EQ(parse_port("443.5"), std::nullopt);
	EXPECT_EQ(parse_port("25565 "), std::nullopt);
	EXPECT_EQ(parse_port("8a0"), std::nullopt);
}

// Test string_view functionality
TEST(ParsePortTest, StringViewSupport) {
	std::string port_str = "25565";
	std::string_view port_sv = port_str;
	EXPECT_EQ(parse_port(port_sv), 25565);

	// Test with substring extraction
	std::string full_address = "server:25565:extra";
	std::string_view port_part = std::string_view(full_address).substr(7, 5);
	EXPECT_EQ(parse_port(port_part), 25565);
}

// Test leading zeros handling
TEST(ParsePortTest, LeadingZeros) {
	EXPECT_EQ(parse_port("0080"), 80);
	EXPECT_EQ(parse_port("00443"), 443);
	EXPECT_EQ(parse_port("000000000025565"), 25565);
}

// =====================================================================================================================
TEST(StringHelpersTest, ContainsAlpha) {
	EXPECT_TRUE(contains_alpha("example.com"));
	EXPECT_TRUE(contains_alpha("2001:db8::a"));
	EXPECT_FALSE(contains_alpha("203.0.113.5"));
	EXPECT_FALSE(contains_alpha("1234"));
	EXPECT_FALSE(contains_alpha(""));
}

TEST(StringHelpersTest, StripLeadingUnderscores) {
	EXPECT_EQ(strip_leading_underscores("_minecraft"), "minecraft");
	EXPECT_EQ(strip_leading_underscores("__tcp"), "tcp");
	EXPECT_EQ(strip_leading_underscores("tcp"), "tcp");
	EXPECT_EQ(strip_leading_underscores("___"), "");
}

TEST(StringHelpersTest, StripTrailingDot) {
	EXPECT_EQ(strip_trailing_dot("mc.example.com."), "mc.example.com");
	EXPECT_EQ(strip_trailing_dot("mc.example.com"), "mc.example.com");
	// Only one dot is removed
	EXPECT_EQ(strip_trailing_dot("example.."), "example.");
	EXPECT_EQ(strip_trailing_dot(""), "");
}

TEST(StringHelpersTest, Trim) {
	EXPECT_EQ(trim("  example.com\t\n"), "example.com");
	EXPECT_EQ(trim("example.com"), "example.com");
	EXPECT_EQ(trim(" \t "), "");
}
