#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "cmdl/string/RegEx.hpp"

TEST_CASE("Test regular expression matching", "[RegEx]")
{
	cmdl::string::RegEx regex("^([a-z]+)=([0-9]+)$");
	CHECK(regex.pattern() == "^([a-z]+)=([0-9]+)$");

	cmdl::string::RegExResult result = regex.match("foo=42");
	REQUIRE(result.matched);
	const std::vector<std::string> EXPECTED{"foo=42", "foo", "42"};
	CHECK(result.matches == EXPECTED);

	CHECK_FALSE(regex.match("FOO=42").matched);
	CHECK_FALSE(regex.match("foo=bar").matched);
}

TEST_CASE("Test case-insensitive regular expression", "[RegEx]")
{
	cmdl::string::RegExOptions options;
	options.caseSensitive = false;
	cmdl::string::RegEx regex("^abc", options);

	CHECK(regex.match("ABCdef").matched);
	CHECK_FALSE(regex.match("xabc").matched);
}

TEST_CASE("Test regular expression copying", "[RegEx]")
{
	cmdl::string::RegEx a("b+");
	cmdl::string::RegEx b(a);
	cmdl::string::RegEx c("x");
	c = a;

	CHECK(b.match("abbbc").matched);
	CHECK(c.pattern() == "b+");
	CHECK(c.match("abc").matches.front() == "b");
}

TEST_CASE("Test invalid regular expression", "[RegEx]")
{
	REQUIRE_THROWS_AS(cmdl::string::RegEx("(unbalanced"),
	                  std::runtime_error);
}
