#ifndef cmdl_params_StringProvider_HPP
#define cmdl_params_StringProvider_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

namespace cmdl
{
namespace params
{
/*!
 * StringProvider produces every user-visible message the parser emits. The
 * default implementation returns English text; applications can derive from
 * this class and override any subset of the messages, and then pass an
 * instance in via ParseOptions::stringProvider.
 */
class StringProvider
{
public:
	StringProvider() = default;
	virtual ~StringProvider() = default;

	virtual std::string unknownArgument(std::string const &name) const;
	virtual std::string unknownCommand(std::string const &name) const;
	virtual std::string noCommandSpecified() const;
	virtual std::string
	missingNamedArgumentValue(std::string const &name) const;
	virtual std::string duplicateArgument(std::string const &name) const;
	virtual std::string
	duplicateArgumentWarning(std::string const &name) const;
	virtual std::string tooManyArguments() const;
	virtual std::string
	missingRequiredArguments(std::vector<std::string> const &names) const;

	/*!
	 * \param name The name of the argument being converted.
	 * \param value The raw value which couldn't be converted.
	 * \param valueDescription A short description of the expected type.
	 * \param detail The converter's own explanation of the failure.
	 * \return The error message.
	 */
	virtual std::string
	argumentValueConversion(std::string const &name,
	                        std::string const &value,
	                        std::string const &valueDescription,
	                        std::string const &detail) const;

	virtual std::string invalidDictionaryValue(std::string const &name,
	                                           std::string const &value,
	                                           std::string const &key) const;
	virtual std::string
	combinedShortNameNonSwitch(std::string const &name) const;
	virtual std::string validationFailed(std::string const &name) const;

	virtual std::string validateNotEmpty(std::string const &name) const;
	virtual std::string
	validateNotWhiteSpace(std::string const &name) const;
	virtual std::string validatePattern(std::string const &name,
	                                    std::string const &value,
	                                    std::string const &pattern) const;
	virtual std::string
	validateStringLength(std::string const &name, std::size_t minimum,
	                     boost::optional<std::size_t> const &maximum) const;
	virtual std::string
	validateRange(std::string const &name,
	              boost::optional<std::string> const &minimum,
	              boost::optional<std::string> const &maximum) const;
	virtual std::string validateEnumValue(std::string const &name,
	                                      std::string const &value) const;
	virtual std::string
	validateCount(std::string const &name, std::size_t minimum,
	              boost::optional<std::size_t> const &maximum) const;
	virtual std::string
	requiresArguments(std::string const &name,
	         std::vector<std::string> const &dependencies) const;
	virtual std::string
	prohibitsArguments(std::string const &name,
	          std::vector<std::string> const &dependencies) const;
	virtual std::string
	requiresAny(std::vector<std::string> const &names) const;

	virtual std::string
	requiresUsageHelp(std::vector<std::string> const &dependencies) const;
	virtual std::string
	prohibitsUsageHelp(std::vector<std::string> const &dependencies) const;
	virtual std::string
	rangeUsageHelp(boost::optional<std::string> const &minimum,
	               boost::optional<std::string> const &maximum) const;
};
}
}

#endif
