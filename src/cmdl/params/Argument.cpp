#include "Argument.hpp"

#include <stdexcept>

#include "cmdl/params/Validator.hpp"

namespace
{
// Switches share one converter, so equal descriptions build equal schemas.
std::shared_ptr<cmdl::params::ArgumentConverter const> const &
switchConverter()
{
	static std::shared_ptr<cmdl::params::ArgumentConverter const> const
	        converter = std::make_shared<cmdl::params::BooleanConverter>();
	return converter;
}
}

namespace cmdl
{
namespace params
{
Argument Argument::flag(std::string const &n, std::string const &h)
{
	Argument argument(n, switchConverter(), typeid(bool));
	argument.isSwitch = true;
	argument.help = h;
	return argument;
}

Argument Argument::required(std::string const &n,
                            std::shared_ptr<ArgumentConverter const> const &c,
                            std::string const &h)
{
	Argument argument(n, c);
	argument.isRequired = true;
	argument.help = h;
	return argument;
}

Argument Argument::optional(std::string const &n,
                            std::shared_ptr<ArgumentConverter const> const &c,
                            std::string const &h,
                            boost::optional<std::string> const &dv)
{
	Argument argument(n, c);
	argument.help = h;
	argument.defaultText = dv;
	return argument;
}

Argument
Argument::positional(std::string const &n, std::size_t p, bool r,
                     std::shared_ptr<ArgumentConverter const> const &c,
                     std::string const &h)
{
	Argument argument(n, c);
	argument.position = p;
	argument.isRequired = r;
	argument.help = h;
	return argument;
}

Argument
Argument::multiValue(std::string const &n,
                     std::shared_ptr<ArgumentConverter const> const &c,
                     std::string const &h)
{
	Argument argument(n, c);
	argument.isMultiValue = true;
	argument.help = h;
	return argument;
}

Argument::Argument(std::string const &n,
                   std::shared_ptr<ArgumentConverter const> const &c,
                   std::type_index const &et)
        : name(n),
          aliases(),
          hasLongName(true),
          shortName(boost::none),
          shortAliases(),
          position(boost::none),
          valueType(ValueType::String),
          elementType(et),
          isRequired(false),
          defaultText(boost::none),
          defaultValue(boost::none),
          isMultiValue(false),
          multiValueSeparator(boost::none),
          allowMultiValueWhiteSpaceSeparator(false),
          isDictionary(false),
          allowDuplicateDictionaryKeys(false),
          isSwitch(false),
          cancelMode(CancelMode::None),
          isHidden(false),
          help(),
          valueDescription(boost::none),
          converter(c),
          customConverter(false),
          validators()
{
	if(!converter)
		throw std::invalid_argument("Arguments require a converter.");
	valueType = converter->valueType();
}

bool Argument::isPositional() const
{
	return !!position;
}

std::string Argument::displayValueDescription() const
{
	if(!!valueDescription)
		return *valueDescription;
	return toString(valueType);
}

bool operator==(Argument const &a, Argument const &b)
{
	return (a.name == b.name) && (a.aliases == b.aliases) &&
	       (a.hasLongName == b.hasLongName) &&
	       (a.shortName == b.shortName) &&
	       (a.shortAliases == b.shortAliases) &&
	       (a.position == b.position) && (a.valueType == b.valueType) &&
	       (a.elementType == b.elementType) &&
	       (a.isRequired == b.isRequired) &&
	       (a.defaultText == b.defaultText) &&
	       (a.defaultValue == b.defaultValue) &&
	       (a.isMultiValue == b.isMultiValue) &&
	       (a.multiValueSeparator == b.multiValueSeparator) &&
	       (a.allowMultiValueWhiteSpaceSeparator ==
	        b.allowMultiValueWhiteSpaceSeparator) &&
	       (a.isDictionary == b.isDictionary) &&
	       (a.allowDuplicateDictionaryKeys ==
	        b.allowDuplicateDictionaryKeys) &&
	       (a.isSwitch == b.isSwitch) && (a.cancelMode == b.cancelMode) &&
	       (a.isHidden == b.isHidden) && (a.help == b.help) &&
	       (a.valueDescription == b.valueDescription) &&
	       (a.converter == b.converter) &&
	       (a.customConverter == b.customConverter) &&
	       (a.validators == b.validators);
}

bool operator!=(Argument const &a, Argument const &b)
{
	return !(a == b);
}
}
}
