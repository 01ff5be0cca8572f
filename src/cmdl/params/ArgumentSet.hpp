#ifndef cmdl_params_ArgumentSet_HPP
#define cmdl_params_ArgumentSet_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/Argument.hpp"
#include "cmdl/params/ArgumentBuilder.hpp"
#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/ParseResult.hpp"
#include "cmdl/params/Schema.hpp"
#include "cmdl/params/Validator.hpp"
#include "cmdl/params/detail/SchemaCache.hpp"
#include "cmdl/params/detail/ValueTraits.hpp"
#include "cmdl/params/parse.hpp"

namespace cmdl
{
namespace params
{
/*!
 * The result of parsing with an ArgumentSet<T>. If parsing succeeded (even
 * if it was canceled with success), arguments holds the populated T.
 */
template <typename T> struct TypedParseResult
{
	ParseResult result;
	boost::optional<T> arguments;

	TypedParseResult(ParseResult const &r,
	                 boost::optional<T> const &a = boost::none)
	        : result(r), arguments(a)
	{
	}
};

/*!
 * ArgumentSet<T> declares the command-line arguments of a plain struct T, by
 * binding arguments to T's data members. The member's type determines the
 * argument's type:
 *
 * - bool members are switches.
 * - std::vector<E> members are multi-value arguments.
 * - std::map<K, V> members are dictionary arguments (key=value).
 * - boost::optional<E> members are left empty if there is no value.
 * - Enumerations need an EnumNames<E> specialization.
 * - Any other class with a static parse(std::string const &) or
 *   parse(std::string const &, std::locale const &) function is converted
 *   with it.
 *
 * Schemas are built on demand and cached per set of schema options; any
 * change to the set invalidates the cache.
 */
template <typename T> class ArgumentSet
{
public:
	typedef std::function<T(ParseResult const &)> Factory;

	ArgumentSet(std::string const &name = "",
	            std::string const &description = "")
	        : setDescription(name, description),
	          binders(),
	          factories(),
	          cache(std::make_shared<detail::SchemaCache>())
	{
	}

	ArgumentSet(ArgumentSet const &o)
	        : setDescription(o.setDescription),
	          binders(o.binders),
	          factories(o.factories),
	          cache(std::make_shared<detail::SchemaCache>())
	{
	}

	ArgumentSet &operator=(ArgumentSet const &o)
	{
		if(this == &o)
			return *this;
		setDescription = o.setDescription;
		binders = o.binders;
		factories = o.factories;
		cache = std::make_shared<detail::SchemaCache>();
		return *this;
	}

	~ArgumentSet() = default;

	/*!
	 * Add a named argument bound to the given member.
	 *
	 * \param name The argument's name.
	 * \param member The member the argument's value is stored in.
	 * \return A builder, to set the argument's other attributes.
	 */
	template <typename M>
	ArgumentBuilder add(std::string const &name, M T::*member)
	{
		setDescription.arguments.push_back(
		        detail::MemberTraits<M>::describe(name));
		binders.push_back([member](T &object, Value const &value)
		                  {
			                  detail::MemberTraits<M>::assign(
			                          object.*member, value);
			          });
		cache->clear();
		return ArgumentBuilder(setDescription,
		                       setDescription.arguments.size() - 1, cache);
	}

	template <typename M>
	ArgumentBuilder addPositional(std::string const &name, M T::*member,
	                              std::size_t position)
	{
		return add(name, member).position(position);
	}

	/*!
	 * Describe an argument which is passed to a constructor rather than
	 * stored in a member. See constructor().
	 *
	 * \param name The argument's name.
	 * \param required Whether or not the argument is required.
	 * \return The argument description.
	 */
	template <typename M>
	static Argument constructorArgument(std::string const &name,
	                                    bool required = true)
	{
		Argument argument = detail::MemberTraits<M>::describe(name);
		argument.isRequired = required;
		return argument;
	}

	/*!
	 * Extract a typed value from a parse result, for use in constructor
	 * factories. If the argument has no value, M() is returned.
	 */
	template <typename M>
	static M valueOf(ParseResult const &result, std::string const &name)
	{
		M ret = M();
		Value const *value = result.value(name);
		if(value != nullptr)
			detail::MemberTraits<M>::assign(ret, *value);
		return ret;
	}

	/*!
	 * Add a constructor-like entry point. Its arguments become the leading
	 * positional arguments, and the factory is used to create the T which
	 * member values are then stored into. If more than one constructor is
	 * added, exactly one must be designated.
	 *
	 * \param arguments The constructor's arguments, in order.
	 * \param factory Creates a T from the parse result.
	 * \param designated Whether this is the constructor to use.
	 * \return This argument set.
	 */
	ArgumentSet &constructor(std::vector<Argument> const &arguments,
	                         Factory const &factory, bool designated = false)
	{
		if(!factory)
			throw std::invalid_argument("Constructors need a factory.");
		setDescription.constructors.emplace_back(arguments, designated);
		factories.push_back(factory);
		cache->clear();
		return *this;
	}

	ArgumentSet &
	validator(std::shared_ptr<ArgumentSetValidator const> const &v)
	{
		if(!v)
			throw std::invalid_argument("Can't use a null validator.");
		setDescription.validators.push_back(v);
		cache->clear();
		return *this;
	}

	ArgumentSetDescription const &description() const
	{
		return setDescription;
	}

	/*!
	 * \param options The options the schema will be used with.
	 * \return The (cached) schema for this argument set. Throws
	 *         SchemaError if the argument set is invalid.
	 */
	std::shared_ptr<Schema const>
	schema(ParseOptions const &options = ParseOptions()) const
	{
		return cache->get(setDescription, SchemaOptions(options));
	}

	TypedParseResult<T> parse(std::vector<std::string> const &args,
	                          std::size_t index = 0,
	                          ParseOptions const &options =
	                                  ParseOptions()) const
	{
		ParseResult result =
		        params::parse(schema(options), args, index, options);
		if(result.status() != ParseStatus::Success)
			return TypedParseResult<T>(result);
		return TypedParseResult<T>(result, create(result));
	}

	/*!
	 * Create a T from a parse result produced with this set's schema:
	 * call the designated constructor's factory (or default construct T),
	 * and then store every member argument which has a value.
	 *
	 * \param result The result to create T from.
	 * \return The populated T.
	 */
	T create(ParseResult const &result) const
	{
		auto const &schema = *result.schema();
		T object = !!schema.constructorIndex()
		                   ? factories.at(*schema.constructorIndex())(
		                             result)
		                   : detail::defaultConstruct<T>();

		for(std::size_t i = 0; i < binders.size(); ++i)
		{
			Value const *value =
			        result.value(setDescription.arguments[i].name);
			if(value != nullptr)
				binders[i](object, *value);
		}
		return object;
	}

private:
	typedef std::function<void(T &, Value const &)> Binder;

	ArgumentSetDescription setDescription;
	std::vector<Binder> binders;
	std::vector<Factory> factories;
	std::shared_ptr<detail::SchemaCache> cache;
};
}
}

#endif
