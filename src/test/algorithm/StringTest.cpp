#include <catch2/catch.hpp>

#include <string>
#include <utility>
#include <vector>

#include "cmdl/algorithm/String.hpp"

TEST_CASE("Test case-aware string comparison", "[String]")
{
	CHECK(cmdl::algorithm::string::compare("Foo", "foo", false) == 0);
	CHECK(cmdl::algorithm::string::compare("Foo", "foo", true) != 0);
	CHECK(cmdl::algorithm::string::compare("abc", "ABD", false) < 0);
	CHECK(cmdl::algorithm::string::compare("abcd", "ABC", false) > 0);
	CHECK(cmdl::algorithm::string::compare("", "", false) == 0);
	CHECK(cmdl::algorithm::string::compare("", "a", false) < 0);
}

TEST_CASE("Test string prefix matching", "[String]")
{
	CHECK(cmdl::algorithm::string::startsWith("--verbose", "--"));
	CHECK(cmdl::algorithm::string::startsWith("foo", ""));
	CHECK_FALSE(cmdl::algorithm::string::startsWith("-", "--"));
	CHECK_FALSE(cmdl::algorithm::string::startsWith("VERBOSE", "verb"));
	CHECK(cmdl::algorithm::string::startsWith("VERBOSE", "verb", false));
}

TEST_CASE("Test string split algorithm", "[String]")
{
	const std::string TEST_DELIMITER = ",";
	const std::vector<std::pair<std::string, std::vector<std::string>>>
	        TEST_DATA = {{"", {}},
	                     {",,,,,,,,", {}},
	                     {"foobar", {"foobar"}},
	                     {",,foobar", {"foobar"}},
	                     {"foobar,,", {"foobar"}},
	                     {",,,,foobar,,,,", {"foobar"}},
	                     {",,,,foo,,,,bar,,,,", {"foo", "bar"}},
	                     {"f,o,o,b,a,r", {"f", "o", "o", "b", "a", "r"}}};

	for(auto const &test : TEST_DATA)
	{
		auto output = cmdl::algorithm::string::split(test.first,
		                                             TEST_DELIMITER);
		CHECK(test.second == output);
	}
}

TEST_CASE("Test string split algorithm keeping empty components", "[String]")
{
	const std::vector<std::pair<std::string, std::vector<std::string>>>
	        TEST_DATA = {{"", {""}},
	                     {"a,,b", {"a", "", "b"}},
	                     {",a", {"", "a"}},
	                     {"a::b::c", {"a::b::c"}}};

	for(auto const &test : TEST_DATA)
	{
		auto output =
		        cmdl::algorithm::string::split(test.first, ",", true);
		CHECK(test.second == output);
	}

	std::vector<std::string> expected{"a", "b", "c"};
	CHECK(expected == cmdl::algorithm::string::split("a::b::c", "::"));
}

namespace
{
struct JoinTestCase
{
	std::vector<std::string> input;
	std::string delimiter;
	std::string expected;

	JoinTestCase(std::vector<std::string> const &i, std::string const &d,
	             std::string const &e)
	        : input(i), delimiter(d), expected(e)
	{
	}
};
}

TEST_CASE("Test string join algorithm", "[String]")
{
	const std::vector<JoinTestCase> TEST_CASES{
	        {{"foo", "bar", "baz"}, " ", "foo bar baz"},
	        {{}, "foobar", ""},
	        {{"", "", ""}, ",", ",,"},
	        {{"foo", "bar", "baz"}, "", "foobarbaz"}};

	for(auto const &test : TEST_CASES)
	{
		std::string output = cmdl::algorithm::string::join(
		        test.input.begin(), test.input.end(), test.delimiter);
		CHECK(test.expected == output);
	}
}

TEST_CASE("Test white space detection", "[String]")
{
	CHECK(cmdl::algorithm::string::isWhiteSpace(""));
	CHECK(cmdl::algorithm::string::isWhiteSpace(" \t\n"));
	CHECK_FALSE(cmdl::algorithm::string::isWhiteSpace(" a "));
}
