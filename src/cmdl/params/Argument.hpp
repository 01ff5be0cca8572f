#ifndef cmdl_params_Argument_HPP
#define cmdl_params_Argument_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/Converter.hpp"
#include "cmdl/params/Value.hpp"

namespace cmdl
{
namespace params
{
class ArgumentValidator;

/*!
 * What the parser does right after a value was bound to an argument.
 */
enum class CancelMode
{
	None,
	// Stop parsing, and report the parse as canceled (e.g. for -Help).
	AbortFailure,
	// Stop parsing, and report success with the unconsumed tokens.
	AbortSuccess
};

/*!
 * An Argument describes one logical command-line argument: how it can be
 * named, whether it can be supplied positionally, what type its value has,
 * and which constraints apply to it. Once part of a Schema, an Argument is
 * never modified.
 */
struct Argument
{
	/*!
	 * Helper for constructing a switch: a boolean argument which is set to
	 * true just by supplying its name.
	 *
	 * \param n The name of the switch.
	 * \param h The help message for this switch.
	 * \return The newly-constructed argument.
	 */
	static Argument flag(std::string const &n, std::string const &h = "");

	/*!
	 * Helper for constructing a named argument which must always be
	 * supplied.
	 *
	 * \param n The name of the argument.
	 * \param c The converter for the argument's values.
	 * \param h The help message for this argument.
	 * \return The newly-constructed argument.
	 */
	static Argument required(
	        std::string const &n,
	        std::shared_ptr<ArgumentConverter const> const &c =
	                std::make_shared<StringConverter>(),
	        std::string const &h = "");

	/*!
	 * Helper for constructing a named argument which may be omitted. If a
	 * default value is given, it is converted with the argument's
	 * converter (using the invariant culture) when the argument is not
	 * supplied.
	 *
	 * \param n The name of the argument.
	 * \param c The converter for the argument's values.
	 * \param h The help message for this argument.
	 * \param dv The default value, in textual form.
	 * \return The newly-constructed argument.
	 */
	static Argument
	optional(std::string const &n,
	         std::shared_ptr<ArgumentConverter const> const &c =
	                 std::make_shared<StringConverter>(),
	         std::string const &h = "",
	         boost::optional<std::string> const &dv = boost::none);

	static Argument positional(
	        std::string const &n, std::size_t p, bool r,
	        std::shared_ptr<ArgumentConverter const> const &c =
	                std::make_shared<StringConverter>(),
	        std::string const &h = "");

	/*!
	 * Helper for constructing a multi-value argument. Every occurrence of
	 * the argument appends to its value.
	 *
	 * \param n The name of the argument.
	 * \param c The converter for each individual value.
	 * \param h The help message for this argument.
	 * \return The newly-constructed argument.
	 */
	static Argument multiValue(
	        std::string const &n,
	        std::shared_ptr<ArgumentConverter const> const &c =
	                std::make_shared<StringConverter>(),
	        std::string const &h = "");

	std::string name;
	std::vector<std::string> aliases;

	// In LongShort mode, whether name (and aliases) can be used at all.
	bool hasLongName;
	boost::optional<char> shortName;
	std::vector<char> shortAliases;

	boost::optional<std::size_t> position;

	ValueType valueType;
	std::type_index elementType;

	bool isRequired;
	boost::optional<std::string> defaultText;
	boost::optional<Value> defaultValue;

	bool isMultiValue;
	boost::optional<std::string> multiValueSeparator;
	bool allowMultiValueWhiteSpaceSeparator;

	bool isDictionary;
	bool allowDuplicateDictionaryKeys;

	bool isSwitch;
	CancelMode cancelMode;
	bool isHidden;

	std::string help;
	boost::optional<std::string> valueDescription;

	std::shared_ptr<ArgumentConverter const> converter;
	bool customConverter;

	std::vector<std::shared_ptr<ArgumentValidator const>> validators;

	Argument(std::string const &n,
	         std::shared_ptr<ArgumentConverter const> const &c =
	                 std::make_shared<StringConverter>(),
	         std::type_index const &et = typeid(std::string));

	Argument(Argument const &) = default;
	Argument(Argument &&) = default;
	Argument &operator=(Argument const &) = default;
	Argument &operator=(Argument &&) = default;

	~Argument() = default;

	bool isPositional() const;

	/*!
	 * \return The value description to display in help and errors: the
	 *         explicit valueDescription if any, otherwise the value type.
	 */
	std::string displayValueDescription() const;
};

bool operator==(Argument const &a, Argument const &b);
bool operator!=(Argument const &a, Argument const &b);
}
}

#endif
