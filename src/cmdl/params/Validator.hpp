#ifndef cmdl_params_Validator_HPP
#define cmdl_params_Validator_HPP

#include <cstddef>
#include <locale>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/ParseError.hpp"
#include "cmdl/params/Value.hpp"
#include "cmdl/string/RegEx.hpp"

namespace cmdl
{
namespace params
{
struct Argument;
class StringProvider;

enum class ValidationMode
{
	// Run on the raw string, right after it is read from the command line.
	BeforeConversion,
	// Run on each converted value.
	AfterConversion,
	// Run once per argument, after every token has been consumed.
	AfterParsing
};

/*!
 * A read-only view of the argument values of an in-progress parse, used by
 * validators which need to look at arguments other than their own.
 */
class ArgumentStateView
{
public:
	virtual ~ArgumentStateView() = default;

	/*!
	 * \param name The name or alias of an argument.
	 * \return The argument's current value (which may be a default), or
	 *         nullptr if it has none. Throws std::out_of_range if there
	 *         is no such argument.
	 */
	virtual Value const *value(std::string const &name) const = 0;

	/*!
	 * \param name The name or alias of an argument.
	 * \return Whether the argument was supplied on the command line.
	 */
	virtual bool isSupplied(std::string const &name) const = 0;
};

struct ValidationContext
{
	Argument const &argument;
	ValidationMode mode;

	// Set for BeforeConversion validation.
	boost::optional<std::string> rawValue;

	// Set for AfterConversion validation.
	boost::optional<ScalarValue> convertedValue;

	// The argument's full value so far; nullptr if it has none.
	Value const *value;

	ArgumentStateView const &arguments;
	StringProvider const &strings;
	std::locale culture;

	ValidationContext(Argument const &a, ValidationMode m,
	                  ArgumentStateView const &as, StringProvider const &s,
	                  std::locale const &c);
};

/*!
 * A validator checks one argument at one point of the parse. If isValid
 * returns false, the parse fails with a ParseError whose category is
 * errorCategory() and whose message is errorMessage().
 */
class ArgumentValidator
{
public:
	virtual ~ArgumentValidator() = default;

	virtual ValidationMode mode() const = 0;
	virtual ErrorCategory errorCategory() const;

	virtual bool isValid(ValidationContext const &context) const = 0;
	virtual std::string errorMessage(ValidationContext const &context) const;

	/*!
	 * \return The names of any other arguments this validator refers to.
	 *         These are checked for existence when a Schema is built.
	 */
	virtual std::vector<std::string> dependencies() const;

	virtual boost::optional<std::string>
	usageHelp(StringProvider const &strings) const;

	/*!
	 * Throw a ParseError if the given context is not valid.
	 *
	 * \param context The value(s) to validate.
	 */
	void validate(ValidationContext const &context) const;
};

class ValidateNotEmpty : public ArgumentValidator
{
public:
	virtual ~ValidateNotEmpty() = default;

	virtual ValidationMode mode() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;
};

class ValidateNotWhiteSpace : public ArgumentValidator
{
public:
	virtual ~ValidateNotWhiteSpace() = default;

	virtual ValidationMode mode() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;
};

/*!
 * Requires the raw value to contain a match for a regular expression. The
 * pattern is not implicitly anchored; use ^ and $ to match the whole value.
 */
class ValidatePattern : public ArgumentValidator
{
public:
	ValidatePattern(std::string const &pattern, bool caseSensitive = true,
	                boost::optional<std::string> const &message =
	                        boost::none);

	virtual ~ValidatePattern() = default;

	virtual ValidationMode mode() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;

private:
	string::RegEx regex;
	boost::optional<std::string> customMessage;
};

class ValidateStringLength : public ArgumentValidator
{
public:
	ValidateStringLength(std::size_t mn, boost::optional<std::size_t> const
	                                             &mx = boost::none);

	virtual ~ValidateStringLength() = default;

	virtual ValidationMode mode() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;

private:
	std::size_t minimum;
	boost::optional<std::size_t> maximum;
};

/*!
 * Requires each converted value to fall within [minimum, maximum] (either
 * bound may be omitted). Integers and floats are compared numerically with
 * each other; other types must match the bound's type exactly. For
 * dictionary arguments, the range applies to each entry's value.
 */
class ValidateRange : public ArgumentValidator
{
public:
	ValidateRange(boost::optional<ScalarValue> const &mn,
	              boost::optional<ScalarValue> const &mx);

	virtual ~ValidateRange() = default;

	virtual ValidationMode mode() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;
	virtual boost::optional<std::string>
	usageHelp(StringProvider const &strings) const;

private:
	boost::optional<ScalarValue> minimum;
	boost::optional<ScalarValue> maximum;
};

/*!
 * Rejects enumeration values which do not correspond to a named member (for
 * example, a numeric value which the enumeration does not define).
 */
class ValidateEnumValue : public ArgumentValidator
{
public:
	virtual ~ValidateEnumValue() = default;

	virtual ValidationMode mode() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;
};

/*!
 * Requires a multi-value or dictionary argument which was supplied to have
 * between minimum and maximum items.
 */
class ValidateCount : public ArgumentValidator
{
public:
	ValidateCount(std::size_t mn,
	              boost::optional<std::size_t> const &mx = boost::none);

	virtual ~ValidateCount() = default;

	virtual ValidationMode mode() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;

private:
	std::size_t minimum;
	boost::optional<std::size_t> maximum;
};

/*!
 * If the argument is supplied, every one of the named arguments must be
 * supplied as well.
 */
class Requires : public ArgumentValidator
{
public:
	explicit Requires(std::vector<std::string> const &a);

	virtual ~Requires() = default;

	virtual ValidationMode mode() const;
	virtual ErrorCategory errorCategory() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;
	virtual std::vector<std::string> dependencies() const;
	virtual boost::optional<std::string>
	usageHelp(StringProvider const &strings) const;

private:
	std::vector<std::string> arguments;
};

/*!
 * If the argument is supplied, none of the named arguments may be supplied.
 */
class Prohibits : public ArgumentValidator
{
public:
	explicit Prohibits(std::vector<std::string> const &a);

	virtual ~Prohibits() = default;

	virtual ValidationMode mode() const;
	virtual ErrorCategory errorCategory() const;
	virtual bool isValid(ValidationContext const &context) const;
	virtual std::string errorMessage(ValidationContext const &context) const;
	virtual std::vector<std::string> dependencies() const;
	virtual boost::optional<std::string>
	usageHelp(StringProvider const &strings) const;

private:
	std::vector<std::string> arguments;
};

/*!
 * A validator which applies to a whole argument set rather than a single
 * argument. These run after every per-argument validator has passed.
 */
class ArgumentSetValidator
{
public:
	virtual ~ArgumentSetValidator() = default;

	virtual ErrorCategory errorCategory() const;
	virtual bool isValid(ArgumentStateView const &arguments) const = 0;
	virtual std::string errorMessage(StringProvider const &strings) const = 0;
	virtual std::vector<std::string> dependencies() const;

	void validate(ArgumentStateView const &arguments,
	              StringProvider const &strings) const;
};

/*!
 * Requires at least one of the named arguments to be supplied.
 */
class RequiresAny : public ArgumentSetValidator
{
public:
	explicit RequiresAny(std::vector<std::string> const &a);

	virtual ~RequiresAny() = default;

	virtual ErrorCategory errorCategory() const;
	virtual bool isValid(ArgumentStateView const &state) const;
	virtual std::string errorMessage(StringProvider const &strings) const;
	virtual std::vector<std::string> dependencies() const;

private:
	std::vector<std::string> arguments;
};
}
}

#endif
