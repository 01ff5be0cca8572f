#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include <boost/variant/get.hpp>

#include "cmdl/params/Argument.hpp"
#include "cmdl/params/Converter.hpp"
#include "cmdl/params/ParseError.hpp"
#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/Schema.hpp"
#include "cmdl/params/Validator.hpp"

namespace
{
std::vector<std::string>
argumentNames(cmdl::params::Schema const &schema)
{
	std::vector<std::string> names;
	for(auto const &argument : schema.arguments())
		names.push_back(argument.name);
	return names;
}

cmdl::params::SchemaOptions noHelpOptions()
{
	cmdl::params::SchemaOptions options;
	options.argumentNamePrefixes = {"-"};
	options.autoHelpArgument = false;
	return options;
}
}

TEST_CASE("Test schema argument ordering", "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	description.constructors.emplace_back(std::vector<cmdl::params::Argument>(
	        {cmdl::params::Argument::required("First"),
	         cmdl::params::Argument::required("Second")}));
	description.arguments = {
	        cmdl::params::Argument::optional("Named"),
	        cmdl::params::Argument::positional("Late", 10, false),
	        cmdl::params::Argument::required("RequiredNamed"),
	        cmdl::params::Argument::positional("Early", 3, true)};

	cmdl::params::Schema schema(description, noHelpOptions());

	const std::vector<std::string> EXPECTED{
	        "First", "Second", "Early", "Late", "RequiredNamed", "Named"};
	CHECK(argumentNames(schema) == EXPECTED);
	CHECK(schema.positionalCount() == 4);
	CHECK(schema.constructorArgumentCount() == 2);
	REQUIRE(!!schema.constructorIndex());
	CHECK(*schema.constructorIndex() == 0);

	// Positions are the arguments' indices in the schema.
	for(std::size_t i = 0; i < schema.positionalCount(); ++i)
	{
		REQUIRE(!!schema.argument(i).position);
		CHECK(*schema.argument(i).position == i);
	}
	CHECK(!schema.argument(4).position);
}

TEST_CASE("Test schema construction is repeatable", "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	description.arguments = {
	        cmdl::params::Argument::positional("Source", 0, true),
	        cmdl::params::Argument::optional(
	                "Count", std::make_shared<cmdl::params::IntegerConverter>(),
	                "", std::string("3")),
	        cmdl::params::Argument::flag("Force")};

	cmdl::params::Schema a(description);
	cmdl::params::Schema b(description);
	CHECK(a == b);
	CHECK(argumentNames(a) == argumentNames(b));
}

TEST_CASE("Test schema construction with automatic help is repeatable",
          "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	description.arguments = {cmdl::params::Argument::flag("Force")};

	cmdl::params::SchemaOptions options;
	options.argumentNamePrefixes = {"-"};
	REQUIRE(options.autoHelpArgument);

	cmdl::params::Schema a(description, options);
	cmdl::params::Schema b(description, options);
	REQUIRE(!!a.helpArgument());
	CHECK(a.argument(*a.helpArgument()) == b.argument(*b.helpArgument()));
	CHECK(a == b);

	options.mode = cmdl::params::ParsingMode::LongShort;
	CHECK(cmdl::params::Schema(description, options) ==
	      cmdl::params::Schema(description, options));
}

TEST_CASE("Test automatic help argument", "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	description.arguments = {cmdl::params::Argument::flag("hidden")};
	description.arguments.front().aliases.push_back("h");

	cmdl::params::SchemaOptions options;
	options.argumentNamePrefixes = {"-"};
	cmdl::params::Schema schema(description, options);

	REQUIRE(!!schema.helpArgument());
	cmdl::params::Argument const &help =
	        schema.argument(*schema.helpArgument());
	CHECK(help.name == cmdl::params::Schema::HELP_ARGUMENT_NAME);
	CHECK(help.isSwitch);
	CHECK(help.cancelMode == cmdl::params::CancelMode::AbortFailure);

	// The "h" alias is taken, so only "?" is added.
	const std::vector<std::string> EXPECTED_ALIASES{"?"};
	CHECK(help.aliases == EXPECTED_ALIASES);
	CHECK(*schema.find("?") == *schema.helpArgument());
	CHECK(*schema.find("help") == *schema.helpArgument());
	CHECK(*schema.find("h") != *schema.helpArgument());

	options.autoHelpArgument = false;
	CHECK(!cmdl::params::Schema(description, options).helpArgument());
}

TEST_CASE("Test automatic help argument in long/short mode", "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	cmdl::params::SchemaOptions options;
	options.mode = cmdl::params::ParsingMode::LongShort;
	options.argumentNamePrefixes = {"-"};
	cmdl::params::Schema schema(description, options);

	REQUIRE(!!schema.helpArgument());
	CHECK(*schema.findShort('?') == *schema.helpArgument());
	CHECK(*schema.findShort('h') == *schema.helpArgument());
	CHECK(*schema.find("Help") == *schema.helpArgument());
}

TEST_CASE("Test schema name lookup", "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	cmdl::params::Argument verbose = cmdl::params::Argument::flag("Verbose");
	verbose.aliases = {"v"};
	verbose.shortName = 'v';
	cmdl::params::Argument value = cmdl::params::Argument::optional("Value");
	value.hasLongName = false;
	value.shortName = 'x';
	description.arguments = {verbose, value,
	                         cmdl::params::Argument::optional("Verify")};

	cmdl::params::SchemaOptions options = noHelpOptions();
	cmdl::params::Schema schema(description, options);
	CHECK(*schema.find("verbose") == 0);
	CHECK(*schema.find("V") == 0);
	CHECK(*schema.find("Value") == 1);
	CHECK(!schema.findShort('v'));
	CHECK(schema.findByPrefix("ver").size() == 2);
	CHECK(schema.findByPrefix("verb").size() == 1);

	options.mode = cmdl::params::ParsingMode::LongShort;
	options.caseSensitive = true;
	schema = cmdl::params::Schema(description, options);
	CHECK(!!schema.find("Verbose"));
	CHECK(!schema.find("verbose"));
	CHECK(!schema.find("Value"));
	CHECK(*schema.indexOf("Value") == 1);
	CHECK(*schema.findShort('x') == 1);
	CHECK(!schema.findShort('X'));
}

TEST_CASE("Test default value conversion", "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	description.arguments = {cmdl::params::Argument::optional(
	        "Count", std::make_shared<cmdl::params::IntegerConverter>(), "",
	        std::string("42"))};

	cmdl::params::Schema schema(description, noHelpOptions());
	auto const &dv = schema.argument(0).defaultValue;
	REQUIRE(!!dv);
	CHECK(dv->isDefault);
	CHECK(boost::get<cmdl::params::IntegerType>(dv->scalar()) == 42);

	description.arguments.front().defaultText = std::string("forty two");
	CHECK_THROWS_AS(cmdl::params::Schema(description, noHelpOptions()),
	                cmdl::params::SchemaError);
}

TEST_CASE("Test invalid schema definitions", "[Parameters]")
{
	SECTION("Duplicate names")
	{
		cmdl::params::ArgumentSetDescription description("test");
		cmdl::params::Argument b = cmdl::params::Argument::optional("b");
		b.aliases = {"A"};
		description.arguments = {cmdl::params::Argument::optional("a"),
		                         b};
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);
	}

	SECTION("Duplicate positions")
	{
		cmdl::params::ArgumentSetDescription description("test");
		description.arguments = {
		        cmdl::params::Argument::positional("a", 1, false),
		        cmdl::params::Argument::positional("b", 1, false)};
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);
	}

	SECTION("Multi-value positional argument isn't last")
	{
		cmdl::params::ArgumentSetDescription description("test");
		cmdl::params::Argument a =
		        cmdl::params::Argument::positional("a", 0, false);
		a.isMultiValue = true;
		description.arguments = {
		        a, cmdl::params::Argument::positional("b", 1, false)};
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);
	}

	SECTION("Required positional argument follows an optional one")
	{
		cmdl::params::ArgumentSetDescription description("test");
		description.arguments = {
		        cmdl::params::Argument::positional("a", 0, false),
		        cmdl::params::Argument::positional("b", 1, true)};
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);
	}

	SECTION("Invalid names")
	{
		for(std::string const &name : {"", "a b", "a=b", "a:b"})
		{
			cmdl::params::ArgumentSetDescription description("test");
			description.arguments = {
			        cmdl::params::Argument::optional(name)};
			CHECK_THROWS_AS(cmdl::params::Schema(description),
			                cmdl::params::SchemaError);
		}
	}

	SECTION("Switch without a boolean type")
	{
		cmdl::params::ArgumentSetDescription description("test");
		cmdl::params::Argument a = cmdl::params::Argument::optional("a");
		a.isSwitch = true;
		description.arguments = {a};
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);
	}

	SECTION("Separator on a single-value argument")
	{
		cmdl::params::ArgumentSetDescription description("test");
		cmdl::params::Argument a = cmdl::params::Argument::optional("a");
		a.multiValueSeparator = std::string(",");
		description.arguments = {a};
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);
	}

	SECTION("No usable name in long/short mode")
	{
		cmdl::params::ArgumentSetDescription description("test");
		cmdl::params::Argument a = cmdl::params::Argument::optional("a");
		a.hasLongName = false;
		description.arguments = {a};
		cmdl::params::SchemaOptions options;
		options.mode = cmdl::params::ParsingMode::LongShort;
		CHECK_THROWS_AS(cmdl::params::Schema(description, options),
		                cmdl::params::SchemaError);
	}

	SECTION("Unknown dependency")
	{
		cmdl::params::ArgumentSetDescription description("test");
		cmdl::params::Argument a = cmdl::params::Argument::optional("a");
		a.validators.push_back(std::make_shared<cmdl::params::Requires>(
		        std::vector<std::string>({"b"})));
		description.arguments = {a};
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);
	}

	SECTION("Several constructors without a designated one")
	{
		cmdl::params::ArgumentSetDescription description("test");
		description.constructors.emplace_back();
		description.constructors.emplace_back();
		CHECK_THROWS_AS(cmdl::params::Schema(description),
		                cmdl::params::SchemaError);

		description.constructors.back().designated = true;
		CHECK_NOTHROW(cmdl::params::Schema(description));
	}
}
