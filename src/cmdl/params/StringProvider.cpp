#include "StringProvider.hpp"

#include <sstream>

namespace
{
std::string quotedList(std::vector<std::string> const &names,
                       std::string const &conjunction)
{
	std::ostringstream oss;
	for(std::size_t i = 0; i < names.size(); ++i)
	{
		if(i > 0)
		{
			if(i + 1 == names.size())
				oss << " " << conjunction << " ";
			else
				oss << ", ";
		}
		oss << "'" << names[i] << "'";
	}
	return oss.str();
}
}

namespace cmdl
{
namespace params
{
std::string StringProvider::unknownArgument(std::string const &name) const
{
	return "Unknown argument name '" + name + "'.";
}

std::string StringProvider::unknownCommand(std::string const &name) const
{
	return "Unknown command '" + name + "'.";
}

std::string StringProvider::noCommandSpecified() const
{
	return "No command specified.";
}

std::string
StringProvider::missingNamedArgumentValue(std::string const &name) const
{
	return "No value was supplied for the argument '" + name + "'.";
}

std::string StringProvider::duplicateArgument(std::string const &name) const
{
	return "The argument '" + name + "' was supplied more than once.";
}

std::string
StringProvider::duplicateArgumentWarning(std::string const &name) const
{
	return "The argument '" + name +
	       "' was supplied more than once; only the last value is used.";
}

std::string StringProvider::tooManyArguments() const
{
	return "Too many arguments were supplied.";
}

std::string StringProvider::missingRequiredArguments(
        std::vector<std::string> const &names) const
{
	if(names.size() == 1)
		return "The required argument '" + names.front() +
		       "' was not supplied.";
	return "The required arguments " + quotedList(names, "and") +
	       " were not supplied.";
}

std::string StringProvider::argumentValueConversion(
        std::string const &name, std::string const &value,
        std::string const &valueDescription, std::string const &detail) const
{
	std::string message = "The value '" + value +
	                      "' is not valid for the argument '" + name +
	                      "', which expects a value of type " +
	                      valueDescription + ".";
	if(!detail.empty())
		message += " " + detail;
	return message;
}

std::string StringProvider::invalidDictionaryValue(std::string const &name,
                                                   std::string const &value,
                                                   std::string const &key) const
{
	return "The value '" + value + "' for the argument '" + name +
	       "' uses the key '" + key + "', which was already supplied.";
}

std::string
StringProvider::combinedShortNameNonSwitch(std::string const &name) const
{
	return "The combined short argument '" + name +
	       "' contains an argument which is not a switch.";
}

std::string StringProvider::validationFailed(std::string const &name) const
{
	return "The value for the argument '" + name + "' is not valid.";
}

std::string StringProvider::validateNotEmpty(std::string const &name) const
{
	return "The value for the argument '" + name + "' must not be empty.";
}

std::string
StringProvider::validateNotWhiteSpace(std::string const &name) const
{
	return "The value for the argument '" + name +
	       "' must not be empty or consist only of white space.";
}

std::string StringProvider::validatePattern(std::string const &name,
                                            std::string const &value,
                                            std::string const &pattern) const
{
	return "The value '" + value + "' for the argument '" + name +
	       "' does not match the pattern '" + pattern + "'.";
}

std::string StringProvider::validateStringLength(
        std::string const &name, std::size_t minimum,
        boost::optional<std::size_t> const &maximum) const
{
	std::ostringstream oss;
	oss << "The value for the argument '" << name << "' must be ";
	if(!!maximum)
		oss << "between " << minimum << " and " << *maximum;
	else
		oss << "at least " << minimum;
	oss << " characters long.";
	return oss.str();
}

std::string
StringProvider::validateRange(std::string const &name,
                              boost::optional<std::string> const &minimum,
                              boost::optional<std::string> const &maximum) const
{
	std::string message = "The value for the argument '" + name + "' must ";
	if(!!minimum && !!maximum)
		message += "be between " + *minimum + " and " + *maximum;
	else if(!!minimum)
		message += "be at least " + *minimum;
	else if(!!maximum)
		message += "be at most " + *maximum;
	else
		message += "be valid";
	return message + ".";
}

std::string StringProvider::validateEnumValue(std::string const &name,
                                              std::string const &value) const
{
	return "The value '" + value + "' for the argument '" + name +
	       "' is not a defined value.";
}

std::string StringProvider::validateCount(
        std::string const &name, std::size_t minimum,
        boost::optional<std::size_t> const &maximum) const
{
	std::ostringstream oss;
	oss << "The argument '" << name << "' must have ";
	if(!!maximum)
		oss << "between " << minimum << " and " << *maximum;
	else
		oss << "at least " << minimum;
	oss << " items.";
	return oss.str();
}

std::string
StringProvider::requiresArguments(std::string const &name,
                         std::vector<std::string> const &dependencies) const
{
	return "The argument '" + name + "' must be used together with " +
	       quotedList(dependencies, "and") + ".";
}

std::string
StringProvider::prohibitsArguments(std::string const &name,
                          std::vector<std::string> const &dependencies) const
{
	return "The argument '" + name + "' cannot be used together with " +
	       quotedList(dependencies, "or") + ".";
}

std::string
StringProvider::requiresAny(std::vector<std::string> const &names) const
{
	return "You must use at least one of " + quotedList(names, "or") + ".";
}

std::string StringProvider::requiresUsageHelp(
        std::vector<std::string> const &dependencies) const
{
	return "Must be used with " + quotedList(dependencies, "and") + ".";
}

std::string StringProvider::prohibitsUsageHelp(
        std::vector<std::string> const &dependencies) const
{
	return "Cannot be used with " + quotedList(dependencies, "or") + ".";
}

std::string
StringProvider::rangeUsageHelp(boost::optional<std::string> const &minimum,
                               boost::optional<std::string> const &maximum) const
{
	if(!!minimum && !!maximum)
		return "Must be between " + *minimum + " and " + *maximum + ".";
	if(!!minimum)
		return "Must be at least " + *minimum + ".";
	if(!!maximum)
		return "Must be at most " + *maximum + ".";
	return "";
}
}
}
