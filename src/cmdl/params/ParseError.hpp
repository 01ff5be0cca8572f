#ifndef cmdl_params_ParseError_HPP
#define cmdl_params_ParseError_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

namespace cmdl
{
namespace params
{
enum class ErrorCategory
{
	Unspecified,
	ArgumentValueConversion,
	UnknownArgument,
	UnknownCommand,
	MissingNamedArgumentValue,
	DuplicateArgument,
	TooManyArguments,
	MissingRequiredArgument,
	ValidationFailed,
	DependencyFailed,
	InvalidDictionaryValue,
	CombinedShortNameNonSwitch
};

std::string toString(ErrorCategory category);

/*!
 * A ParseError is thrown whenever the user-provided command line cannot be
 * parsed against an argument set. It identifies the kind of failure, the
 * argument it relates to (if any), and carries a human-readable message
 * suitable for display to the user.
 */
class ParseError : public std::runtime_error
{
public:
	ParseError(ErrorCategory c, std::string const &message,
	           boost::optional<std::string> const &n = boost::none);

	ParseError(ParseError const &) = default;
	ParseError &operator=(ParseError const &) = default;

	virtual ~ParseError() = default;

	ErrorCategory category() const;
	boost::optional<std::string> const &argumentName() const;

	/*!
	 * For MissingRequiredArgument errors, this lists the name of every
	 * required argument which had no value, in schema order. For other
	 * categories, it is empty.
	 */
	std::vector<std::string> const &missingArguments() const;
	void setMissingArguments(std::vector<std::string> const &missing);

private:
	ErrorCategory errorCategory;
	boost::optional<std::string> name;
	std::vector<std::string> missing;
};

/*!
 * A SchemaError indicates that an argument set definition is itself invalid
 * (for example, two arguments share a name). This is a programming error in
 * the application, as opposed to a user input error.
 */
class SchemaError : public std::logic_error
{
public:
	explicit SchemaError(std::string const &message);
	virtual ~SchemaError() = default;
};
}
}

#endif
