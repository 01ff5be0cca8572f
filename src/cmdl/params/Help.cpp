#include "Help.hpp"

#include <memory>

#include "cmdl/algorithm/String.hpp"
#include "cmdl/params/Validator.hpp"

namespace cmdl
{
namespace params
{
namespace
{
std::string shortPrefix(SchemaOptions const &options)
{
	if(options.argumentNamePrefixes.empty())
		return "-";
	return options.argumentNamePrefixes.front();
}

std::string longPrefix(SchemaOptions const &options)
{
	if(options.mode == ParsingMode::LongShort)
		return options.longArgumentNamePrefix;
	return shortPrefix(options);
}

std::string primaryName(Schema const &schema, Argument const &argument)
{
	SchemaOptions const &options = schema.options();
	if((options.mode == ParsingMode::LongShort) && !argument.hasLongName &&
	   !!argument.shortName)
	{
		return shortPrefix(options) + std::string(1, *argument.shortName);
	}
	return longPrefix(options) + argument.name;
}

std::string valuePlaceholder(Argument const &argument)
{
	std::string ret = "<" + argument.displayValueDescription() + ">";
	if(argument.isMultiValue)
		ret += "...";
	return ret;
}

std::string usageFragment(Schema const &schema, Argument const &argument)
{
	std::string ret;
	if(argument.isPositional())
	{
		ret = "<" + argument.name + ">";
		if(argument.isMultiValue)
			ret += "...";
	}
	else
	{
		ret = primaryName(schema, argument);
		if(!argument.isSwitch)
			ret += " " + valuePlaceholder(argument);
	}

	if(!argument.isRequired)
		ret = "[" + ret + "]";
	return ret;
}

std::string defaultText(Argument const &argument)
{
	if(!!argument.defaultText)
		return *argument.defaultText;
	std::vector<std::string> items;
	if(!!argument.defaultValue)
	{
		for(auto const &item : argument.defaultValue->items)
			items.push_back(format(item));
	}
	return algorithm::string::join(items.begin(), items.end(), ", ");
}

void writeArgument(std::ostream &out, Schema const &schema,
                   Argument const &argument, StringProvider const &strings)
{
	out << "\t";
	if(argument.isPositional())
		out << argument.name;
	else
		out << formatNames(schema, argument);
	if(!argument.isSwitch)
		out << " " << valuePlaceholder(argument);
	if(!argument.help.empty())
		out << " - " << argument.help;

	if(argument.isRequired)
		out << " [Required]";
	std::string dv = defaultText(argument);
	if(!dv.empty())
		out << " [Default: " << dv << "]";
	for(auto const &validator : argument.validators)
	{
		boost::optional<std::string> help = validator->usageHelp(strings);
		if(!!help)
			out << " " << *help;
	}
	out << "\n";
}
}

void writeCommandList(std::ostream &out, std::string const &program,
                      std::vector<Command const *> const &commands)
{
	out << "Usage: " << program
	    << " command [options ...] [arguments ...]\n";
	out << "Available commands:\n";
	for(auto const &command : commands)
		out << "\t" << command->name << " - " << command->help << "\n";
}

void writeUsage(std::ostream &out, std::string const &program,
                Schema const &schema,
                boost::optional<std::string> const &command,
                StringProvider const &strings)
{
	std::vector<Argument const *> positionals;
	std::vector<Argument const *> named;
	for(auto const &argument : schema.arguments())
	{
		if(argument.isHidden)
			continue;
		if(argument.isPositional())
			positionals.push_back(&argument);
		else
			named.push_back(&argument);
	}

	out << "Usage: " << program;
	if(!!command)
		out << " " << *command;
	for(auto const &argument : positionals)
		out << " " << usageFragment(schema, *argument);
	for(auto const &argument : named)
		out << " " << usageFragment(schema, *argument);
	out << "\n";

	if(!schema.description().empty())
		out << "\n" << schema.description() << "\n";

	if(!positionals.empty())
	{
		out << "\nPositional arguments:\n";
		for(auto const &argument : positionals)
			writeArgument(out, schema, *argument, strings);
	}

	if(!named.empty())
	{
		out << "\nOptions:\n";
		for(auto const &argument : named)
			writeArgument(out, schema, *argument, strings);
	}
}

std::string formatNames(Schema const &schema, Argument const &argument)
{
	SchemaOptions const &options = schema.options();
	std::vector<std::string> names;
	bool longShort = options.mode == ParsingMode::LongShort;

	if(!longShort || argument.hasLongName)
	{
		names.push_back(longPrefix(options) + argument.name);
		for(auto const &alias : argument.aliases)
			names.push_back(longPrefix(options) + alias);
	}

	if(longShort)
	{
		if(!!argument.shortName)
		{
			names.push_back(shortPrefix(options) +
			                std::string(1, *argument.shortName));
		}
		for(char alias : argument.shortAliases)
			names.push_back(shortPrefix(options) + std::string(1, alias));
	}

	return algorithm::string::join(names.begin(), names.end(), ", ");
}
}
}
