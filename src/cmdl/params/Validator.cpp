#include "Validator.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/variant/get.hpp>

#include "cmdl/algorithm/String.hpp"
#include "cmdl/params/Argument.hpp"
#include "cmdl/params/StringProvider.hpp"

namespace
{
bool isNumeric(cmdl::params::ValueType type)
{
	return (type == cmdl::params::ValueType::Integer) ||
	       (type == cmdl::params::ValueType::Float);
}

double toDouble(cmdl::params::ScalarValue const &value)
{
	if(auto integer = boost::get<cmdl::params::IntegerType>(&value))
		return static_cast<double>(*integer);
	return boost::get<cmdl::params::FloatType>(value);
}

/*!
 * Compare two values, in the manner of std::string::compare. Returns
 * boost::none if the values' types can't be compared with each other.
 */
boost::optional<int> compareScalars(cmdl::params::ScalarValue const &a,
                                    cmdl::params::ScalarValue const &b)
{
	auto aType = cmdl::params::valueTypeOf(a);
	auto bType = cmdl::params::valueTypeOf(b);

	if(isNumeric(aType) && isNumeric(bType) && (aType != bType))
	{
		double x = toDouble(a);
		double y = toDouble(b);
		if(x < y)
			return -1;
		return y < x ? 1 : 0;
	}

	if(aType != bType)
		return boost::none;
	if(a < b)
		return -1;
	return b < a ? 1 : 0;
}

boost::optional<std::string>
formatBound(boost::optional<cmdl::params::ScalarValue> const &bound,
            std::locale const &culture)
{
	if(!bound)
		return boost::none;
	return cmdl::params::format(*bound, culture);
}

bool allSupplied(cmdl::params::ArgumentStateView const &state,
                 std::vector<std::string> const &names)
{
	return std::all_of(names.begin(), names.end(),
	                   [&state](std::string const &name) -> bool
	                   {
		                   return state.isSupplied(name);
		           });
}

bool noneSupplied(cmdl::params::ArgumentStateView const &state,
                  std::vector<std::string> const &names)
{
	return std::none_of(names.begin(), names.end(),
	                    [&state](std::string const &name) -> bool
	                    {
		                    return state.isSupplied(name);
		            });
}
}

namespace cmdl
{
namespace params
{
ValidationContext::ValidationContext(Argument const &a, ValidationMode m,
                                     ArgumentStateView const &as,
                                     StringProvider const &s,
                                     std::locale const &c)
        : argument(a),
          mode(m),
          rawValue(boost::none),
          convertedValue(boost::none),
          value(nullptr),
          arguments(as),
          strings(s),
          culture(c)
{
}

ErrorCategory ArgumentValidator::errorCategory() const
{
	return ErrorCategory::ValidationFailed;
}

std::string
ArgumentValidator::errorMessage(ValidationContext const &context) const
{
	return context.strings.validationFailed(context.argument.name);
}

std::vector<std::string> ArgumentValidator::dependencies() const
{
	return {};
}

boost::optional<std::string>
ArgumentValidator::usageHelp(StringProvider const &) const
{
	return boost::none;
}

void ArgumentValidator::validate(ValidationContext const &context) const
{
	if(!isValid(context))
	{
		throw ParseError(errorCategory(), errorMessage(context),
		                 context.argument.name);
	}
}

ValidationMode ValidateNotEmpty::mode() const
{
	return ValidationMode::BeforeConversion;
}

bool ValidateNotEmpty::isValid(ValidationContext const &context) const
{
	if(!context.rawValue)
		return true;
	return !context.rawValue->empty();
}

std::string
ValidateNotEmpty::errorMessage(ValidationContext const &context) const
{
	return context.strings.validateNotEmpty(context.argument.name);
}

ValidationMode ValidateNotWhiteSpace::mode() const
{
	return ValidationMode::BeforeConversion;
}

bool ValidateNotWhiteSpace::isValid(ValidationContext const &context) const
{
	if(!context.rawValue)
		return true;
	return !context.rawValue->empty() &&
	       !algorithm::string::isWhiteSpace(*context.rawValue);
}

std::string
ValidateNotWhiteSpace::errorMessage(ValidationContext const &context) const
{
	return context.strings.validateNotWhiteSpace(context.argument.name);
}

ValidatePattern::ValidatePattern(std::string const &pattern,
                                 bool caseSensitive,
                                 boost::optional<std::string> const &message)
        : regex(pattern,
                [caseSensitive]()
                {
	                string::RegExOptions options;
	                options.caseSensitive = caseSensitive;
	                return options;
	        }()),
          customMessage(message)
{
}

ValidationMode ValidatePattern::mode() const
{
	return ValidationMode::BeforeConversion;
}

bool ValidatePattern::isValid(ValidationContext const &context) const
{
	if(!context.rawValue)
		return true;
	return regex.match(*context.rawValue).matched;
}

std::string
ValidatePattern::errorMessage(ValidationContext const &context) const
{
	if(!!customMessage)
		return *customMessage;
	return context.strings.validatePattern(
	        context.argument.name, context.rawValue.value_or(""),
	        regex.pattern());
}

ValidateStringLength::ValidateStringLength(
        std::size_t mn, boost::optional<std::size_t> const &mx)
        : minimum(mn), maximum(mx)
{
	if(!!maximum && (*maximum < minimum))
		throw std::invalid_argument("Invalid string length range.");
}

ValidationMode ValidateStringLength::mode() const
{
	return ValidationMode::BeforeConversion;
}

bool ValidateStringLength::isValid(ValidationContext const &context) const
{
	if(!context.rawValue)
		return true;
	std::size_t length = context.rawValue->length();
	return (length >= minimum) && (!maximum || (length <= *maximum));
}

std::string
ValidateStringLength::errorMessage(ValidationContext const &context) const
{
	return context.strings.validateStringLength(context.argument.name,
	                                            minimum, maximum);
}

ValidateRange::ValidateRange(boost::optional<ScalarValue> const &mn,
                             boost::optional<ScalarValue> const &mx)
        : minimum(mn), maximum(mx)
{
	if(!minimum && !maximum)
		throw std::invalid_argument("A range needs at least one bound.");
}

ValidationMode ValidateRange::mode() const
{
	return ValidationMode::AfterConversion;
}

bool ValidateRange::isValid(ValidationContext const &context) const
{
	if(!context.convertedValue)
		return true;

	ScalarValue const *value = &(*context.convertedValue);
	if(auto pair = boost::get<KeyValuePair>(value))
		value = &pair->value;

	if(!!minimum)
	{
		auto result = compareScalars(*value, *minimum);
		if(!result || (*result < 0))
			return false;
	}

	if(!!maximum)
	{
		auto result = compareScalars(*value, *maximum);
		if(!result || (*result > 0))
			return false;
	}

	return true;
}

std::string
ValidateRange::errorMessage(ValidationContext const &context) const
{
	return context.strings.validateRange(
	        context.argument.name, formatBound(minimum, context.culture),
	        formatBound(maximum, context.culture));
}

boost::optional<std::string>
ValidateRange::usageHelp(StringProvider const &strings) const
{
	return strings.rangeUsageHelp(
	        formatBound(minimum, std::locale::classic()),
	        formatBound(maximum, std::locale::classic()));
}

ValidationMode ValidateEnumValue::mode() const
{
	return ValidationMode::AfterConversion;
}

bool ValidateEnumValue::isValid(ValidationContext const &context) const
{
	if(!context.convertedValue)
		return true;
	auto value = boost::get<EnumValue>(&(*context.convertedValue));
	if(value == nullptr)
		return true;
	return !value->name.empty();
}

std::string
ValidateEnumValue::errorMessage(ValidationContext const &context) const
{
	std::string value;
	if(!!context.convertedValue)
		value = format(*context.convertedValue, context.culture);
	return context.strings.validateEnumValue(context.argument.name, value);
}

ValidateCount::ValidateCount(std::size_t mn,
                             boost::optional<std::size_t> const &mx)
        : minimum(mn), maximum(mx)
{
	if(!!maximum && (*maximum < minimum))
		throw std::invalid_argument("Invalid count range.");
}

ValidationMode ValidateCount::mode() const
{
	return ValidationMode::AfterParsing;
}

bool ValidateCount::isValid(ValidationContext const &context) const
{
	if((context.value == nullptr) || context.value->isDefault)
		return true;
	std::size_t count = context.value->size();
	return (count >= minimum) && (!maximum || (count <= *maximum));
}

std::string
ValidateCount::errorMessage(ValidationContext const &context) const
{
	return context.strings.validateCount(context.argument.name, minimum,
	                                     maximum);
}

Requires::Requires(std::vector<std::string> const &a) : arguments(a)
{
}

ValidationMode Requires::mode() const
{
	return ValidationMode::AfterParsing;
}

ErrorCategory Requires::errorCategory() const
{
	return ErrorCategory::DependencyFailed;
}

bool Requires::isValid(ValidationContext const &context) const
{
	if(!context.arguments.isSupplied(context.argument.name))
		return true;
	return allSupplied(context.arguments, arguments);
}

std::string Requires::errorMessage(ValidationContext const &context) const
{
	return context.strings.requiresArguments(context.argument.name,
	                                         arguments);
}

std::vector<std::string> Requires::dependencies() const
{
	return arguments;
}

boost::optional<std::string>
Requires::usageHelp(StringProvider const &strings) const
{
	return strings.requiresUsageHelp(arguments);
}

Prohibits::Prohibits(std::vector<std::string> const &a) : arguments(a)
{
}

ValidationMode Prohibits::mode() const
{
	return ValidationMode::AfterParsing;
}

ErrorCategory Prohibits::errorCategory() const
{
	return ErrorCategory::DependencyFailed;
}

bool Prohibits::isValid(ValidationContext const &context) const
{
	if(!context.arguments.isSupplied(context.argument.name))
		return true;
	return noneSupplied(context.arguments, arguments);
}

std::string Prohibits::errorMessage(ValidationContext const &context) const
{
	return context.strings.prohibitsArguments(context.argument.name,
	                                          arguments);
}

std::vector<std::string> Prohibits::dependencies() const
{
	return arguments;
}

boost::optional<std::string>
Prohibits::usageHelp(StringProvider const &strings) const
{
	return strings.prohibitsUsageHelp(arguments);
}

ErrorCategory ArgumentSetValidator::errorCategory() const
{
	return ErrorCategory::ValidationFailed;
}

std::vector<std::string> ArgumentSetValidator::dependencies() const
{
	return {};
}

void ArgumentSetValidator::validate(ArgumentStateView const &arguments,
                                    StringProvider const &strings) const
{
	if(!isValid(arguments))
		throw ParseError(errorCategory(), errorMessage(strings));
}

RequiresAny::RequiresAny(std::vector<std::string> const &a) : arguments(a)
{
	if(arguments.empty())
		throw std::invalid_argument("RequiresAny needs argument names.");
}

ErrorCategory RequiresAny::errorCategory() const
{
	return ErrorCategory::DependencyFailed;
}

bool RequiresAny::isValid(ArgumentStateView const &state) const
{
	return std::any_of(arguments.begin(), arguments.end(),
	                   [&state](std::string const &name) -> bool
	                   {
		                   return state.isSupplied(name);
		           });
}

std::string RequiresAny::errorMessage(StringProvider const &strings) const
{
	return strings.requiresAny(arguments);
}

std::vector<std::string> RequiresAny::dependencies() const
{
	return arguments;
}
}
}
