#ifndef cmdl_params_ArgumentBuilder_HPP
#define cmdl_params_ArgumentBuilder_HPP

#include <cstddef>
#include <memory>
#include <string>

#include "cmdl/params/Argument.hpp"
#include "cmdl/params/Converter.hpp"
#include "cmdl/params/Schema.hpp"
#include "cmdl/params/Validator.hpp"
#include "cmdl/params/Value.hpp"
#include "cmdl/params/detail/SchemaCache.hpp"

namespace cmdl
{
namespace params
{
/*!
 * ArgumentBuilder is returned by ArgumentSet<T>::add, and provides a fluent
 * interface for filling in the rest of an argument's attributes. A builder
 * refers to its ArgumentSet, so it must not outlive it (or be used after
 * the set is moved).
 */
class ArgumentBuilder
{
public:
	ArgumentBuilder(ArgumentSetDescription &d, std::size_t i,
	                std::shared_ptr<detail::SchemaCache> const &c);

	ArgumentBuilder(ArgumentBuilder const &) = default;
	ArgumentBuilder &operator=(ArgumentBuilder const &) = default;

	~ArgumentBuilder() = default;

	Argument const &argument() const;

	ArgumentBuilder &required(bool r = true);
	ArgumentBuilder &position(std::size_t p);
	ArgumentBuilder &alias(std::string const &a);

	ArgumentBuilder &shortName(char s);
	ArgumentBuilder &shortAlias(char s);

	/*!
	 * In LongShort mode, whether or not the argument can be used with its
	 * long name. Arguments with only a short name must call this with
	 * false.
	 *
	 * \param l Whether or not the argument has a long name.
	 * \return This builder.
	 */
	ArgumentBuilder &longName(bool l = true);

	ArgumentBuilder &defaultText(std::string const &t);
	ArgumentBuilder &defaultValue(ScalarValue const &v);
	ArgumentBuilder &defaultValue(char const *) = delete;

	ArgumentBuilder &multiValueSeparator(std::string const &s);
	ArgumentBuilder &whiteSpaceSeparated(bool w = true);

	/*!
	 * Change the separator between dictionary keys and values. Throws
	 * std::logic_error if this is not a dictionary argument.
	 *
	 * \param s The new separator.
	 * \return This builder.
	 */
	ArgumentBuilder &keyValueSeparator(std::string const &s);
	ArgumentBuilder &allowDuplicateKeys(bool a = true);

	ArgumentBuilder &cancel(CancelMode m);
	ArgumentBuilder &hidden(bool h = true);
	ArgumentBuilder &help(std::string const &h);
	ArgumentBuilder &valueDescription(std::string const &d);

	/*!
	 * Use a specific converter for this argument. This takes precedence
	 * over any converter registered in ParseOptions::converters. The
	 * converter must produce values of the type the member expects.
	 *
	 * \param c The converter to use.
	 * \return This builder.
	 */
	ArgumentBuilder &
	converter(std::shared_ptr<ArgumentConverter const> const &c);

	ArgumentBuilder &
	validate(std::shared_ptr<ArgumentValidator const> const &v);

private:
	ArgumentSetDescription *description;
	std::size_t index;
	std::shared_ptr<detail::SchemaCache> cache;

	Argument &mutableArgument();
};
}
}

#endif
