#include <catch2/catch.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/Argument.hpp"
#include "cmdl/params/Converter.hpp"
#include "cmdl/params/ParseError.hpp"
#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/Schema.hpp"
#include "cmdl/params/StringProvider.hpp"
#include "cmdl/params/Validator.hpp"
#include "cmdl/params/parse.hpp"

namespace
{
cmdl::params::ParseOptions testOptions()
{
	cmdl::params::ParseOptions options;
	options.argumentNamePrefixes = {"-"};
	return options;
}

cmdl::params::ArgumentSetDescription
singleArgument(cmdl::params::Argument const &argument,
               std::shared_ptr<cmdl::params::ArgumentValidator const> const
                       &validator)
{
	cmdl::params::ArgumentSetDescription description("test");
	description.arguments = {argument};
	description.arguments.front().validators.push_back(validator);
	return description;
}

boost::optional<cmdl::params::ErrorCategory>
failure(cmdl::params::ArgumentSetDescription const &description,
        std::vector<std::string> const &args)
{
	try
	{
		cmdl::params::parse(description, args, 0, testOptions());
	}
	catch(cmdl::params::ParseError const &e)
	{
		return e.category();
	}
	return boost::none;
}

class TerseStrings : public cmdl::params::StringProvider
{
public:
	virtual ~TerseStrings() = default;

	virtual std::string validateNotEmpty(std::string const &name) const
	{
		return "EMPTY " + name;
	}
};
}

TEST_CASE("Test not empty validation", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional("Name"),
	        std::make_shared<cmdl::params::ValidateNotEmpty>());

	CHECK(!failure(description, {"-Name", "x"}));
	CHECK(!failure(description, {}));
	CHECK(*failure(description, {"-Name:"}) ==
	      cmdl::params::ErrorCategory::ValidationFailed);
}

TEST_CASE("Test not white space validation", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional("Name"),
	        std::make_shared<cmdl::params::ValidateNotWhiteSpace>());

	CHECK(!failure(description, {"-Name", " x "}));
	CHECK(!!failure(description, {"-Name", " \t"}));
	CHECK(!!failure(description, {"-Name:"}));
}

TEST_CASE("Test pattern validation", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional("Id"),
	        std::make_shared<cmdl::params::ValidatePattern>("^[a-z]+[0-9]$"));

	CHECK(!failure(description, {"-Id", "abc1"}));
	CHECK(!!failure(description, {"-Id", "ABC1"}));

	description.arguments.front().validators = {
	        std::make_shared<cmdl::params::ValidatePattern>(
	                "^[a-z]+[0-9]$", false, std::string("Bad id."))};
	CHECK(!failure(description, {"-Id", "ABC1"}));

	try
	{
		cmdl::params::parse(description, {"-Id", "1"}, 0, testOptions());
		FAIL("Expected a parse error.");
	}
	catch(cmdl::params::ParseError const &e)
	{
		CHECK(std::string(e.what()) == "Bad id.");
		CHECK(*e.argumentName() == "Id");
	}
}

TEST_CASE("Test string length validation", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional("Code"),
	        std::make_shared<cmdl::params::ValidateStringLength>(2, 4));

	CHECK(!failure(description, {"-Code", "ab"}));
	CHECK(!failure(description, {"-Code", "abcd"}));
	CHECK(!!failure(description, {"-Code", "a"}));
	CHECK(!!failure(description, {"-Code", "abcde"}));

	CHECK_THROWS_AS(cmdl::params::ValidateStringLength(5, 4),
	                std::invalid_argument);
}

TEST_CASE("Test range validation", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional(
	                "Port", std::make_shared<cmdl::params::IntegerConverter>()),
	        std::make_shared<cmdl::params::ValidateRange>(
	                cmdl::params::ScalarValue(cmdl::params::IntegerType(1)),
	                cmdl::params::ScalarValue(
	                        cmdl::params::IntegerType(65535))));

	CHECK(!failure(description, {"-Port", "80"}));
	CHECK(*failure(description, {"-Port", "0"}) ==
	      cmdl::params::ErrorCategory::ValidationFailed);
	CHECK(!!failure(description, {"-Port", "65536"}));
}

TEST_CASE("Test range validation with mixed numeric types", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional(
	                "Ratio", std::make_shared<cmdl::params::FloatConverter>()),
	        std::make_shared<cmdl::params::ValidateRange>(
	                cmdl::params::ScalarValue(cmdl::params::IntegerType(0)),
	                boost::none));

	CHECK(!failure(description, {"-Ratio", "0.5"}));
	CHECK(!failure(description, {"-Ratio", "0"}));
	CHECK(!!failure(description, {"-Ratio", "-0.5"}));

	CHECK_THROWS_AS(cmdl::params::ValidateRange(boost::none, boost::none),
	                std::invalid_argument);
}

TEST_CASE("Test enumeration value validation", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional(
	                "Color", std::make_shared<cmdl::params::EnumConverter>(
	                                 std::vector<cmdl::params::EnumValue>(
	                                         {{"Red", 1}, {"Green", 2}}))),
	        std::make_shared<cmdl::params::ValidateEnumValue>());

	CHECK(!failure(description, {"-Color", "red"}));
	CHECK(!failure(description, {"-Color", "2"}));
	CHECK(!!failure(description, {"-Color", "3"}));
}

TEST_CASE("Test count validation", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::multiValue("Item"),
	        std::make_shared<cmdl::params::ValidateCount>(2, 3));

	CHECK(!failure(description, {}));
	CHECK(!failure(description, {"-Item", "a", "-Item", "b"}));
	CHECK(!!failure(description, {"-Item", "a"}));
	CHECK(!!failure(description,
	                {"-Item", "a", "-Item", "b", "-Item", "c", "-Item", "d"}));
}

TEST_CASE("Test requires dependency validation", "[Validator]")
{
	cmdl::params::ArgumentSetDescription description("test");
	cmdl::params::Argument port = cmdl::params::Argument::optional(
	        "Port", std::make_shared<cmdl::params::IntegerConverter>());
	port.validators.push_back(std::make_shared<cmdl::params::Requires>(
	        std::vector<std::string>({"Ip"})));
	description.arguments = {cmdl::params::Argument::optional("Ip"), port};

	try
	{
		cmdl::params::parse(description, {"-Port", "80"}, 0,
		                    testOptions());
		FAIL("Expected a parse error.");
	}
	catch(cmdl::params::ParseError const &e)
	{
		CHECK(e.category() ==
		      cmdl::params::ErrorCategory::DependencyFailed);
		CHECK(*e.argumentName() == "Port");
	}

	CHECK(!failure(description, {"-Port", "80", "-Ip", "127.0.0.1"}));
	CHECK(!failure(description, {"-Ip", "127.0.0.1"}));
	CHECK(!failure(description, {}));
}

TEST_CASE("Test dependencies ignore default values", "[Validator]")
{
	cmdl::params::ArgumentSetDescription description("test");
	cmdl::params::Argument port = cmdl::params::Argument::optional(
	        "Port", std::make_shared<cmdl::params::IntegerConverter>(), "",
	        std::string("80"));
	port.validators.push_back(std::make_shared<cmdl::params::Requires>(
	        std::vector<std::string>({"Ip"})));
	cmdl::params::Argument ip = cmdl::params::Argument::optional(
	        "Ip", std::make_shared<cmdl::params::StringConverter>(), "",
	        std::string("localhost"));
	description.arguments = {ip, port};

	// Port only has its default value, so its dependency doesn't apply.
	CHECK(!failure(description, {}));
	// Ip's default value doesn't satisfy the dependency.
	CHECK(*failure(description, {"-Port", "81"}) ==
	      cmdl::params::ErrorCategory::DependencyFailed);
}

TEST_CASE("Test prohibits dependency validation", "[Validator]")
{
	cmdl::params::ArgumentSetDescription description("test");
	cmdl::params::Argument quiet = cmdl::params::Argument::flag("Quiet");
	quiet.validators.push_back(std::make_shared<cmdl::params::Prohibits>(
	        std::vector<std::string>({"Verbose"})));
	description.arguments = {quiet, cmdl::params::Argument::flag("Verbose")};

	CHECK(!failure(description, {"-Quiet"}));
	CHECK(!failure(description, {"-Verbose"}));
	CHECK(*failure(description, {"-Quiet", "-Verbose"}) ==
	      cmdl::params::ErrorCategory::DependencyFailed);
}

TEST_CASE("Test requires any validation", "[Validator]")
{
	cmdl::params::ArgumentSetDescription description("test");
	description.arguments = {cmdl::params::Argument::optional("File"),
	                         cmdl::params::Argument::optional("Url")};
	description.validators.push_back(
	        std::make_shared<cmdl::params::RequiresAny>(
	                std::vector<std::string>({"File", "Url"})));

	CHECK(!failure(description, {"-Url", "x"}));
	CHECK(*failure(description, {}) ==
	      cmdl::params::ErrorCategory::DependencyFailed);

	description.validators.push_back(
	        std::make_shared<cmdl::params::RequiresAny>(
	                std::vector<std::string>({"Nope"})));
	CHECK_THROWS_AS(cmdl::params::Schema(description),
	                cmdl::params::SchemaError);
}

TEST_CASE("Test custom validation messages", "[Validator]")
{
	auto description = singleArgument(
	        cmdl::params::Argument::optional("Name"),
	        std::make_shared<cmdl::params::ValidateNotEmpty>());

	cmdl::params::ParseOptions options = testOptions();
	options.stringProvider = std::make_shared<TerseStrings>();
	try
	{
		cmdl::params::parse(description, {"-Name:"}, 0, options);
		FAIL("Expected a parse error.");
	}
	catch(cmdl::params::ParseError const &e)
	{
		CHECK(std::string(e.what()) == "EMPTY Name");
	}
}
