#include "Schema.hpp"

#include <algorithm>
#include <cctype>
#include <locale>
#include <set>
#include <tuple>

#include "cmdl/algorithm/String.hpp"
#include "cmdl/params/ParseError.hpp"

namespace
{
template <typename Key, typename Comparator>
void insertName(std::map<Key, std::size_t, Comparator> &map, Key const &key,
                std::string const &display, std::size_t index)
{
	auto it = map.find(key);
	if(it == map.end())
	{
		map.insert(std::make_pair(key, index));
		return;
	}
	if(it->second != index)
	{
		throw cmdl::params::SchemaError("Duplicate argument name '" +
		                                display + "'.");
	}
}

bool isValidName(std::string const &name,
                 std::vector<char> const &separators)
{
	if(name.empty())
		return false;

	std::locale locale;
	for(char c : name)
	{
		if(std::isspace(c, locale))
			return false;
		if(std::find(separators.begin(), separators.end(), c) !=
		   separators.end())
		{
			return false;
		}
	}
	return true;
}
}

namespace cmdl
{
namespace params
{
ConstructorDescription::ConstructorDescription(std::vector<Argument> const &a,
                                               bool d)
        : arguments(a), designated(d)
{
}

ArgumentSetDescription::ArgumentSetDescription(std::string const &n,
                                               std::string const &d)
        : name(n), description(d), constructors(), arguments(), validators()
{
}

SchemaOptions::SchemaOptions() : SchemaOptions(ParseOptions())
{
}

SchemaOptions::SchemaOptions(ParseOptions const &options)
        : mode(options.mode),
          caseSensitive(options.caseSensitive),
          argumentNamePrefixes(options.argumentNamePrefixes),
          longArgumentNamePrefix(options.longArgumentNamePrefix),
          nameValueSeparators(options.nameValueSeparators),
          autoHelpArgument(options.autoHelpArgument)
{
}

bool operator==(SchemaOptions const &a, SchemaOptions const &b)
{
	return std::tie(a.mode, a.caseSensitive, a.argumentNamePrefixes,
	                a.longArgumentNamePrefix, a.nameValueSeparators,
	                a.autoHelpArgument) ==
	       std::tie(b.mode, b.caseSensitive, b.argumentNamePrefixes,
	                b.longArgumentNamePrefix, b.nameValueSeparators,
	                b.autoHelpArgument);
}

bool operator<(SchemaOptions const &a, SchemaOptions const &b)
{
	return std::tie(a.mode, a.caseSensitive, a.argumentNamePrefixes,
	                a.longArgumentNamePrefix, a.nameValueSeparators,
	                a.autoHelpArgument) <
	       std::tie(b.mode, b.caseSensitive, b.argumentNamePrefixes,
	                b.longArgumentNamePrefix, b.nameValueSeparators,
	                b.autoHelpArgument);
}

namespace detail
{
NameComparator::NameComparator(bool cs) : caseSensitive(cs)
{
}

bool NameComparator::operator()(std::string const &a,
                                std::string const &b) const
{
	return algorithm::string::compare(a, b, caseSensitive) < 0;
}

ShortNameComparator::ShortNameComparator(bool cs) : caseSensitive(cs)
{
}

bool ShortNameComparator::operator()(char a, char b) const
{
	if(!caseSensitive)
	{
		a = static_cast<char>(std::tolower(static_cast<unsigned char>(a)));
		b = static_cast<char>(std::tolower(static_cast<unsigned char>(b)));
	}
	return a < b;
}
}

const std::string Schema::HELP_ARGUMENT_NAME = "Help";

Schema::Schema(ArgumentSetDescription const &d, SchemaOptions const &o)
        : schemaName(d.name),
          schemaDescription(d.description),
          schemaOptions(o),
          schemaArguments(),
          positionals(0),
          constructor(boost::none),
          constructorArguments(0),
          setValidators(d.validators),
          help(boost::none),
          allNames(detail::NameComparator(o.caseSensitive)),
          names(detail::NameComparator(o.caseSensitive)),
          shortNames(detail::ShortNameComparator(o.caseSensitive))
{
	// Figure out which constructor supplies the leading arguments.
	if(d.constructors.size() == 1)
	{
		constructor = 0;
	}
	else if(d.constructors.size() > 1)
	{
		for(std::size_t i = 0; i < d.constructors.size(); ++i)
		{
			if(!d.constructors[i].designated)
				continue;
			if(!!constructor)
			{
				throw SchemaError("The argument set '" + schemaName +
				                  "' designates more than one "
				                  "constructor.");
			}
			constructor = i;
		}

		if(!constructor)
		{
			throw SchemaError("The argument set '" + schemaName +
			                  "' has multiple constructors, but none "
			                  "of them is designated.");
		}
	}

	if(!!constructor)
	{
		for(auto const &argument : d.constructors[*constructor].arguments)
		{
			schemaArguments.push_back(argument);
			schemaArguments.back().position = schemaArguments.size() - 1;
		}
		constructorArguments = schemaArguments.size();
	}

	std::vector<Argument> memberPositionals;
	std::vector<Argument> requiredNamed;
	std::vector<Argument> optionalNamed;
	for(auto const &argument : d.arguments)
	{
		if(argument.isPositional())
			memberPositionals.push_back(argument);
		else if(argument.isRequired)
			requiredNamed.push_back(argument);
		else
			optionalNamed.push_back(argument);
	}

	std::stable_sort(memberPositionals.begin(), memberPositionals.end(),
	                 [](Argument const &a, Argument const &b) -> bool
	                 {
		                 return *a.position < *b.position;
		         });
	for(std::size_t i = 1; i < memberPositionals.size(); ++i)
	{
		if(*memberPositionals[i - 1].position ==
		   *memberPositionals[i].position)
		{
			throw SchemaError("The arguments '" +
			                  memberPositionals[i - 1].name +
			                  "' and '" + memberPositionals[i].name +
			                  "' have the same position.");
		}
	}

	for(auto const &argument : memberPositionals)
	{
		schemaArguments.push_back(argument);
		schemaArguments.back().position = schemaArguments.size() - 1;
	}
	positionals = schemaArguments.size();

	schemaArguments.insert(schemaArguments.end(), requiredNamed.begin(),
	                       requiredNamed.end());
	schemaArguments.insert(schemaArguments.end(), optionalNamed.begin(),
	                       optionalNamed.end());

	for(std::size_t i = 0; i < schemaArguments.size(); ++i)
	{
		checkArgument(schemaArguments[i]);
		addNames(i);
	}

	bool seenOptional = false;
	for(std::size_t i = 0; i < positionals; ++i)
	{
		Argument const &argument = schemaArguments[i];
		if(argument.isMultiValue && (i + 1 != positionals))
		{
			throw SchemaError("The multi-value positional argument '" +
			                  argument.name +
			                  "' must be the last positional "
			                  "argument.");
		}

		if(argument.isRequired && seenOptional)
		{
			throw SchemaError("The required positional argument '" +
			                  argument.name +
			                  "' follows an optional positional "
			                  "argument.");
		}
		if(!argument.isRequired)
			seenOptional = true;
	}

	if(schemaOptions.autoHelpArgument)
		addHelpArgument();

	for(auto &argument : schemaArguments)
		convertDefault(argument);

	checkDependencies();
}

std::string const &Schema::name() const
{
	return schemaName;
}

std::string const &Schema::description() const
{
	return schemaDescription;
}

SchemaOptions const &Schema::options() const
{
	return schemaOptions;
}

std::vector<Argument> const &Schema::arguments() const
{
	return schemaArguments;
}

std::size_t Schema::size() const
{
	return schemaArguments.size();
}

Argument const &Schema::argument(std::size_t index) const
{
	return schemaArguments.at(index);
}

std::size_t Schema::positionalCount() const
{
	return positionals;
}

boost::optional<std::size_t> Schema::constructorIndex() const
{
	return constructor;
}

std::size_t Schema::constructorArgumentCount() const
{
	return constructorArguments;
}

std::vector<std::shared_ptr<ArgumentSetValidator const>> const &
Schema::validators() const
{
	return setValidators;
}

boost::optional<std::size_t> Schema::find(std::string const &name) const
{
	auto it = names.find(name);
	if(it == names.end())
		return boost::none;
	return it->second;
}

boost::optional<std::size_t> Schema::findShort(char name) const
{
	auto it = shortNames.find(name);
	if(it == shortNames.end())
		return boost::none;
	return it->second;
}

std::vector<std::size_t>
Schema::findByPrefix(std::string const &prefix) const
{
	std::set<std::size_t> matches;
	for(auto const &entry : names)
	{
		if(algorithm::string::startsWith(entry.first, prefix,
		                                 schemaOptions.caseSensitive))
		{
			matches.insert(entry.second);
		}
	}
	return std::vector<std::size_t>(matches.begin(), matches.end());
}

boost::optional<std::size_t> Schema::indexOf(std::string const &name) const
{
	auto it = allNames.find(name);
	if(it == allNames.end())
		return boost::none;
	return it->second;
}

boost::optional<std::size_t> Schema::helpArgument() const
{
	return help;
}

void Schema::addNames(std::size_t index)
{
	Argument const &argument = schemaArguments[index];

	insertName(allNames, argument.name, argument.name, index);
	for(auto const &alias : argument.aliases)
		insertName(allNames, alias, alias, index);

	if((schemaOptions.mode == ParsingMode::Default) || argument.hasLongName)
	{
		insertName(names, argument.name, argument.name, index);
		for(auto const &alias : argument.aliases)
			insertName(names, alias, alias, index);
	}

	if(schemaOptions.mode == ParsingMode::LongShort)
	{
		if(!!argument.shortName)
		{
			insertName(shortNames, *argument.shortName,
			           std::string(1, *argument.shortName), index);
		}
		for(char alias : argument.shortAliases)
			insertName(shortNames, alias, std::string(1, alias), index);
	}
}

void Schema::addHelpArgument()
{
	if(!!indexOf(HELP_ARGUMENT_NAME))
		return;

	Argument argument =
	        Argument::flag(HELP_ARGUMENT_NAME, "Displays this help message.");
	argument.cancelMode = CancelMode::AbortFailure;
	if(schemaOptions.mode == ParsingMode::LongShort)
	{
		if(!findShort('?'))
			argument.shortName = '?';
		if(!findShort('h'))
			argument.shortAliases.push_back('h');
	}
	else
	{
		for(std::string alias : {"?", "h"})
		{
			if(!indexOf(alias))
				argument.aliases.push_back(alias);
		}
	}

	schemaArguments.push_back(argument);
	help = schemaArguments.size() - 1;
	addNames(*help);
}

void Schema::checkArgument(Argument const &argument) const
{
	if(!isValidName(argument.name, schemaOptions.nameValueSeparators))
	{
		throw SchemaError("The argument name '" + argument.name +
		                  "' is empty, or contains white space or a "
		                  "name/value separator.");
	}

	for(auto const &alias : argument.aliases)
	{
		if(!isValidName(alias, schemaOptions.nameValueSeparators))
		{
			throw SchemaError("The alias '" + alias +
			                  "' for the argument '" + argument.name +
			                  "' is empty, or contains white space or "
			                  "a name/value separator.");
		}
	}

	if((schemaOptions.mode == ParsingMode::LongShort) &&
	   !argument.hasLongName && !argument.shortName)
	{
		throw SchemaError("The argument '" + argument.name +
		                  "' has neither a long nor a short name.");
	}

	if(argument.isSwitch && (argument.valueType != ValueType::Boolean))
	{
		throw SchemaError("The switch argument '" + argument.name +
		                  "' must have a boolean value type.");
	}

	if(argument.isDictionary &&
	   (!argument.isMultiValue ||
	    (argument.valueType != ValueType::KeyValuePair)))
	{
		throw SchemaError("The dictionary argument '" + argument.name +
		                  "' must be multi-value, with key/value pair "
		                  "elements.");
	}

	if(!!argument.multiValueSeparator &&
	   (!argument.isMultiValue || argument.multiValueSeparator->empty()))
	{
		throw SchemaError("The argument '" + argument.name +
		                  "' has a multi-value separator, but it is not "
		                  "a multi-value argument.");
	}
}

void Schema::checkDependencies() const
{
	for(auto const &argument : schemaArguments)
	{
		for(auto const &validator : argument.validators)
		{
			if(!validator)
			{
				throw SchemaError("The argument '" + argument.name +
				                  "' has a null validator.");
			}

			for(auto const &dependency : validator->dependencies())
			{
				if(!indexOf(dependency))
				{
					throw SchemaError(
					        "The argument '" + argument.name +
					        "' depends on the unknown "
					        "argument '" +
					        dependency + "'.");
				}
			}
		}
	}

	for(auto const &validator : setValidators)
	{
		if(!validator)
			throw SchemaError("Null argument set validator.");

		for(auto const &dependency : validator->dependencies())
		{
			if(!indexOf(dependency))
			{
				throw SchemaError("The argument set '" + schemaName +
				                  "' refers to the unknown argument '" +
				                  dependency + "'.");
			}
		}
	}
}

void Schema::convertDefault(Argument &argument) const
{
	if(!argument.defaultText)
	{
		if(!!argument.defaultValue)
			argument.defaultValue->isDefault = true;
		return;
	}

	std::vector<std::string> parts;
	if(argument.isMultiValue && !!argument.multiValueSeparator)
	{
		parts = algorithm::string::split(*argument.defaultText,
		                                 *argument.multiValueSeparator,
		                                 /*keepEmpty=*/true);
	}
	else
	{
		parts.push_back(*argument.defaultText);
	}

	Value value;
	value.isDefault = true;
	for(auto const &part : parts)
	{
		try
		{
			value.items.push_back(convert(*argument.converter, part,
			                              std::locale::classic()));
		}
		catch(ConversionError const &e)
		{
			throw SchemaError("The default value '" + part +
			                  "' for the argument '" + argument.name +
			                  "' is invalid: " + e.what());
		}
	}
	argument.defaultValue = value;
}

bool operator==(Schema const &a, Schema const &b)
{
	return (a.name() == b.name()) && (a.description() == b.description()) &&
	       (a.options() == b.options()) &&
	       (a.arguments() == b.arguments()) &&
	       (a.positionalCount() == b.positionalCount()) &&
	       (a.constructorIndex() == b.constructorIndex()) &&
	       (a.validators() == b.validators());
}

bool operator!=(Schema const &a, Schema const &b)
{
	return !(a == b);
}
}
}
