#include "ParseError.hpp"

namespace cmdl
{
namespace params
{
std::string toString(ErrorCategory category)
{
	switch(category)
	{
	case ErrorCategory::Unspecified:
		return "Unspecified";
	case ErrorCategory::ArgumentValueConversion:
		return "ArgumentValueConversion";
	case ErrorCategory::UnknownArgument:
		return "UnknownArgument";
	case ErrorCategory::UnknownCommand:
		return "UnknownCommand";
	case ErrorCategory::MissingNamedArgumentValue:
		return "MissingNamedArgumentValue";
	case ErrorCategory::DuplicateArgument:
		return "DuplicateArgument";
	case ErrorCategory::TooManyArguments:
		return "TooManyArguments";
	case ErrorCategory::MissingRequiredArgument:
		return "MissingRequiredArgument";
	case ErrorCategory::ValidationFailed:
		return "ValidationFailed";
	case ErrorCategory::DependencyFailed:
		return "DependencyFailed";
	case ErrorCategory::InvalidDictionaryValue:
		return "InvalidDictionaryValue";
	case ErrorCategory::CombinedShortNameNonSwitch:
		return "CombinedShortNameNonSwitch";
	}
	return "Unspecified";
}

ParseError::ParseError(ErrorCategory c, std::string const &message,
                       boost::optional<std::string> const &n)
        : std::runtime_error(message), errorCategory(c), name(n), missing()
{
}

ErrorCategory ParseError::category() const
{
	return errorCategory;
}

boost::optional<std::string> const &ParseError::argumentName() const
{
	return name;
}

std::vector<std::string> const &ParseError::missingArguments() const
{
	return missing;
}

void ParseError::setMissingArguments(std::vector<std::string> const &m)
{
	missing = m;
}

SchemaError::SchemaError(std::string const &message)
        : std::logic_error(message)
{
}
}
}
