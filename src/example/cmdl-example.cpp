#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cmdl/params/ArgumentSet.hpp"
#include "cmdl/params/Command.hpp"
#include "cmdl/params/CommandSet.hpp"
#include "cmdl/params/Validator.hpp"
#include "cmdl/params/parseAndExecuteCommand.hpp"

namespace
{
struct EchoArguments
{
	std::vector<std::string> text;
	bool upper;
	int repeat;
	bool stdinInput;

	EchoArguments() : text(), upper(false), repeat(1), stdinInput(false)
	{
	}
};

struct SumArguments
{
	std::vector<double> values;
	double offset;

	SumArguments() : values(), offset(0.0)
	{
	}
};

cmdl::params::ArgumentSet<EchoArguments> echoArguments()
{
	cmdl::params::ArgumentSet<EchoArguments> set(
	        "echo", "Echo the given text to stdout.");
	set.addPositional("Text", &EchoArguments::text, 0)
	        .help("The text to echo.");
	set.add("Upper", &EchoArguments::upper)
	        .alias("u")
	        .help("Convert the text to upper case.");
	set.add("Repeat", &EchoArguments::repeat)
	        .alias("r")
	        .defaultValue(cmdl::params::IntegerType(1))
	        .help("The number of times to echo the text.")
	        .validate(std::make_shared<cmdl::params::ValidateRange>(
	                cmdl::params::ScalarValue(cmdl::params::IntegerType(1)),
	                cmdl::params::ScalarValue(
	                        cmdl::params::IntegerType(10))));
	set.add("Stdin", &EchoArguments::stdinInput)
	        .help("Echo stdin instead of the given text.")
	        .validate(std::make_shared<cmdl::params::Prohibits>(
	                std::vector<std::string>({"Text"})));
	return set;
}

cmdl::params::ArgumentSet<SumArguments> sumArguments()
{
	cmdl::params::ArgumentSet<SumArguments> set(
	        "sum", "Print the sum of the given values.");
	set.add("Values", &SumArguments::values)
	        .required()
	        .multiValueSeparator(",")
	        .help("The values to add up.");
	set.add("Offset", &SumArguments::offset)
	        .defaultText("0")
	        .help("A value added to the sum.");
	return set;
}

int echo(EchoArguments const &arguments)
{
	std::string text;
	if(arguments.stdinInput)
	{
		std::ostringstream oss;
		oss << std::cin.rdbuf();
		text = oss.str();
	}
	else
	{
		for(auto const &t : arguments.text)
		{
			if(!text.empty())
				text += " ";
			text += t;
		}
		text += "\n";
	}

	if(arguments.upper)
	{
		std::transform(text.begin(), text.end(), text.begin(),
		               [](char c) -> char
		               {
			               return static_cast<char>(std::toupper(c));
			       });
	}

	for(int i = 0; i < arguments.repeat; ++i)
		std::cout << text;
	return 0;
}

int sum(SumArguments const &arguments)
{
	double total = arguments.offset;
	for(double value : arguments.values)
		total += value;
	std::cout << total << "\n";
	return 0;
}
}

int main(int argc, char **argv)
{
	cmdl::params::CommandSet commands(
	        {cmdl::params::makeCommand<EchoArguments>(
	                 "echo", "Echo text to stdout", echoArguments(), echo),
	         cmdl::params::makeCommand<SumArguments>(
	                 "sum", "Add up a list of values", sumArguments(),
	                 sum)});

	return cmdl::params::parseAndExecuteCommand(argc, argv, commands);
}
