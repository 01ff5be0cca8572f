#include <catch2/catch.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cmdl/params/Argument.hpp"
#include "cmdl/params/Command.hpp"
#include "cmdl/params/Converter.hpp"
#include "cmdl/params/Help.hpp"
#include "cmdl/params/Schema.hpp"
#include "cmdl/params/Validator.hpp"

namespace
{
cmdl::params::Schema helpSchema()
{
	cmdl::params::ArgumentSetDescription description("run", "Does things.");

	cmdl::params::Argument extra = cmdl::params::Argument::positional(
	        "Extra", 1, false);
	extra.isMultiValue = true;

	cmdl::params::Argument count = cmdl::params::Argument::optional(
	        "Count", std::make_shared<cmdl::params::IntegerConverter>(),
	        "How many.", std::string("3"));
	count.validators.push_back(std::make_shared<cmdl::params::ValidateRange>(
	        cmdl::params::ScalarValue(cmdl::params::IntegerType(1)),
	        cmdl::params::ScalarValue(cmdl::params::IntegerType(5))));

	cmdl::params::Argument verbose =
	        cmdl::params::Argument::flag("Verbose", "Be chatty.");
	verbose.aliases = {"v"};

	cmdl::params::Argument secret = cmdl::params::Argument::optional("Secret");
	secret.isHidden = true;

	description.arguments = {
	        cmdl::params::Argument::positional(
	                "Input", 0, true,
	                std::make_shared<cmdl::params::StringConverter>(),
	                "The input file."),
	        extra, count, verbose, secret};

	cmdl::params::SchemaOptions options;
	options.argumentNamePrefixes = {"-"};
	options.autoHelpArgument = false;
	return cmdl::params::Schema(description, options);
}
}

TEST_CASE("Test usage help", "[Parameters]")
{
	std::ostringstream out;
	cmdl::params::writeUsage(out, "prog", helpSchema(), std::string("run"));
	std::string const usage = out.str();

	CHECK(usage.find("Usage: prog run <Input> [<Extra>...] "
	                 "[-Count <Integer>] [-Verbose]\n") == 0);
	CHECK(usage.find("\nDoes things.\n") != std::string::npos);
	CHECK(usage.find("\nPositional arguments:\n"
	                 "\tInput <String> - The input file. [Required]\n"
	                 "\tExtra <String>...\n") != std::string::npos);
	CHECK(usage.find("\nOptions:\n"
	                 "\t-Count <Integer> - How many. [Default: 3] "
	                 "Must be between 1 and 5.\n") != std::string::npos);
	CHECK(usage.find("\t-Verbose, -v - Be chatty.") != std::string::npos);
	CHECK(usage.find("Secret") == std::string::npos);
}

TEST_CASE("Test usage help without a command name", "[Parameters]")
{
	std::ostringstream out;
	cmdl::params::writeUsage(out, "prog", helpSchema());
	CHECK(out.str().find("Usage: prog <Input>") == 0);
}

TEST_CASE("Test formatting names in long/short mode", "[Parameters]")
{
	cmdl::params::ArgumentSetDescription description("test");
	cmdl::params::Argument verbose = cmdl::params::Argument::flag("Verbose");
	verbose.shortName = 'v';
	cmdl::params::Argument value = cmdl::params::Argument::optional("Value");
	value.hasLongName = false;
	value.shortName = 'x';
	description.arguments = {verbose, value};

	cmdl::params::SchemaOptions options;
	options.mode = cmdl::params::ParsingMode::LongShort;
	options.argumentNamePrefixes = {"-"};
	options.autoHelpArgument = false;
	cmdl::params::Schema schema(description, options);

	CHECK(cmdl::params::formatNames(schema, schema.arguments()[0]) ==
	      "--Verbose, -v");
	CHECK(cmdl::params::formatNames(schema, schema.arguments()[1]) == "-x");

	std::ostringstream out;
	cmdl::params::writeUsage(out, "prog", schema);
	CHECK(out.str().find("Usage: prog [--Verbose] [-x <String>]\n") == 0);
}

TEST_CASE("Test command list help", "[Parameters]")
{
	auto schema = [](cmdl::params::ParseOptions const &)
	{
		return std::shared_ptr<cmdl::params::Schema const>();
	};
	cmdl::params::Command build("build", "Build the project.", schema,
	                            cmdl::params::CommandFunction());
	cmdl::params::Command clean("clean", "Remove build output.", schema,
	                            cmdl::params::CommandFunction());

	std::ostringstream out;
	cmdl::params::writeCommandList(out, "prog", {&build, &clean});
	CHECK(out.str() ==
	      "Usage: prog command [options ...] [arguments ...]\n"
	      "Available commands:\n"
	      "\tbuild - Build the project.\n"
	      "\tclean - Remove build output.\n");
}
