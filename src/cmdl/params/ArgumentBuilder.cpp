#include "ArgumentBuilder.hpp"

#include <stdexcept>

namespace cmdl
{
namespace params
{
ArgumentBuilder::ArgumentBuilder(ArgumentSetDescription &d, std::size_t i,
                                 std::shared_ptr<detail::SchemaCache> const &c)
        : description(&d), index(i), cache(c)
{
}

Argument const &ArgumentBuilder::argument() const
{
	return description->arguments.at(index);
}

ArgumentBuilder &ArgumentBuilder::required(bool r)
{
	mutableArgument().isRequired = r;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::position(std::size_t p)
{
	mutableArgument().position = p;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::alias(std::string const &a)
{
	mutableArgument().aliases.push_back(a);
	return *this;
}

ArgumentBuilder &ArgumentBuilder::shortName(char s)
{
	mutableArgument().shortName = s;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::shortAlias(char s)
{
	mutableArgument().shortAliases.push_back(s);
	return *this;
}

ArgumentBuilder &ArgumentBuilder::longName(bool l)
{
	mutableArgument().hasLongName = l;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::defaultText(std::string const &t)
{
	Argument &a = mutableArgument();
	a.defaultText = t;
	a.defaultValue = boost::none;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::defaultValue(ScalarValue const &v)
{
	Argument &a = mutableArgument();
	a.defaultText = boost::none;
	a.defaultValue = Value(v, true);
	return *this;
}

ArgumentBuilder &ArgumentBuilder::multiValueSeparator(std::string const &s)
{
	mutableArgument().multiValueSeparator = s;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::whiteSpaceSeparated(bool w)
{
	mutableArgument().allowMultiValueWhiteSpaceSeparator = w;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::keyValueSeparator(std::string const &s)
{
	Argument &a = mutableArgument();
	auto pairConverter =
	        std::dynamic_pointer_cast<KeyValuePairConverter const>(
	                a.converter);
	if(!a.isDictionary || !pairConverter)
	{
		throw std::logic_error("The argument '" + a.name +
		                       "' is not a dictionary argument.");
	}

	a.converter = std::make_shared<KeyValuePairConverter>(
	        pairConverter->keyConverter(), pairConverter->valueConverter(),
	        s);
	return *this;
}

ArgumentBuilder &ArgumentBuilder::allowDuplicateKeys(bool a)
{
	mutableArgument().allowDuplicateDictionaryKeys = a;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::cancel(CancelMode m)
{
	mutableArgument().cancelMode = m;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::hidden(bool h)
{
	mutableArgument().isHidden = h;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::help(std::string const &h)
{
	mutableArgument().help = h;
	return *this;
}

ArgumentBuilder &ArgumentBuilder::valueDescription(std::string const &d)
{
	mutableArgument().valueDescription = d;
	return *this;
}

ArgumentBuilder &
ArgumentBuilder::converter(std::shared_ptr<ArgumentConverter const> const &c)
{
	if(!c)
		throw std::invalid_argument("Can't use a null converter.");

	Argument &a = mutableArgument();
	a.converter = c;
	a.valueType = c->valueType();
	a.customConverter = true;
	return *this;
}

ArgumentBuilder &
ArgumentBuilder::validate(std::shared_ptr<ArgumentValidator const> const &v)
{
	if(!v)
		throw std::invalid_argument("Can't use a null validator.");
	mutableArgument().validators.push_back(v);
	return *this;
}

Argument &ArgumentBuilder::mutableArgument()
{
	// Any change invalidates previously built schemas.
	cache->clear();
	return description->arguments.at(index);
}
}
}
