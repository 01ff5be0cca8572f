#ifndef cmdl_params_detail_ValueTraits_HPP
#define cmdl_params_detail_ValueTraits_HPP

#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include <boost/any.hpp>
#include <boost/optional/optional.hpp>
#include <boost/variant/get.hpp>

#include "cmdl/params/Argument.hpp"
#include "cmdl/params/Converter.hpp"
#include "cmdl/params/Value.hpp"

namespace cmdl
{
namespace params
{
/*!
 * Specialize this for each enumeration type used as an argument, providing:
 *
 *     static std::vector<std::pair<std::string, E>> values();
 *
 * which lists every member's name and value.
 */
template <typename E> struct EnumNames;

namespace detail
{
template <typename T, typename Enable = void> struct ScalarTraits;

template <> struct ScalarTraits<std::string, void>
{
	static std::shared_ptr<ArgumentConverter const> converter()
	{
		return std::make_shared<StringConverter>();
	}

	static std::string fromValue(ScalarValue const &value)
	{
		return boost::get<StringType>(value);
	}
};

template <> struct ScalarTraits<bool, void>
{
	static std::shared_ptr<ArgumentConverter const> converter()
	{
		return std::make_shared<BooleanConverter>();
	}

	static bool fromValue(ScalarValue const &value)
	{
		return boost::get<BooleanType>(value);
	}
};

template <typename T>
struct ScalarTraits<T, typename std::enable_if<std::is_integral<T>::value &&
                                               !std::is_same<T, bool>::value>::type>
{
	static std::shared_ptr<ArgumentConverter const> converter()
	{
		// Unsigned 64-bit values are limited to what IntegerType holds.
		IntegerType maximum =
		        std::numeric_limits<T>::digits >
		                        std::numeric_limits<IntegerType>::digits
		                ? std::numeric_limits<IntegerType>::max()
		                : static_cast<IntegerType>(
		                          std::numeric_limits<T>::max());
		return std::make_shared<IntegerConverter>(
		        static_cast<IntegerType>(std::numeric_limits<T>::min()),
		        maximum);
	}

	static T fromValue(ScalarValue const &value)
	{
		return static_cast<T>(boost::get<IntegerType>(value));
	}
};

template <typename T>
struct ScalarTraits<T, typename std::enable_if<
                               std::is_floating_point<T>::value>::type>
{
	static std::shared_ptr<ArgumentConverter const> converter()
	{
		return std::make_shared<FloatConverter>();
	}

	static T fromValue(ScalarValue const &value)
	{
		return static_cast<T>(boost::get<FloatType>(value));
	}
};

template <> struct ScalarTraits<DateTimeType, void>
{
	static std::shared_ptr<ArgumentConverter const> converter()
	{
		return std::make_shared<DateTimeConverter>();
	}

	static DateTimeType fromValue(ScalarValue const &value)
	{
		return boost::get<DateTimeType>(value);
	}
};

template <typename T>
struct ScalarTraits<T, typename std::enable_if<std::is_enum<T>::value>::type>
{
	static std::shared_ptr<ArgumentConverter const> converter()
	{
		std::vector<EnumValue> members;
		for(auto const &member : EnumNames<T>::values())
		{
			members.emplace_back(
			        member.first,
			        static_cast<IntegerType>(member.second));
		}
		return std::make_shared<EnumConverter>(members);
	}

	static T fromValue(ScalarValue const &value)
	{
		return static_cast<T>(boost::get<EnumValue>(value).value);
	}
};

template <typename T>
struct ScalarTraits<
        T, typename std::enable_if<std::is_class<T>::value &&
                                   (HasCultureParse<T>::value ||
                                    HasPlainParse<T>::value)>::type>
{
	static std::shared_ptr<ArgumentConverter const> converter()
	{
		return std::make_shared<ParsableConverter<T>>();
	}

	static T fromValue(ScalarValue const &value)
	{
		return boost::any_cast<T>(boost::get<CustomValue>(value).value);
	}
};

/*!
 * MemberTraits describes how a data member of type M maps onto an argument:
 * describe() produces an Argument with the right converter and flags, and
 * assign() stores a parsed Value into a member.
 */
template <typename M> struct MemberTraits
{
	static Argument describe(std::string const &name)
	{
		Argument argument(name, ScalarTraits<M>::converter(), typeid(M));
		argument.isSwitch = std::is_same<M, bool>::value;
		return argument;
	}

	static void assign(M &member, Value const &value)
	{
		member = ScalarTraits<M>::fromValue(value.scalar());
	}
};

template <typename E> struct MemberTraits<boost::optional<E>>
{
	static Argument describe(std::string const &name)
	{
		return MemberTraits<E>::describe(name);
	}

	static void assign(boost::optional<E> &member, Value const &value)
	{
		member = ScalarTraits<E>::fromValue(value.scalar());
	}
};

template <typename E> struct MemberTraits<std::vector<E>>
{
	static Argument describe(std::string const &name)
	{
		Argument argument(name, ScalarTraits<E>::converter(), typeid(E));
		argument.isMultiValue = true;
		return argument;
	}

	static void assign(std::vector<E> &member, Value const &value)
	{
		member.clear();
		for(auto const &item : value.items)
			member.push_back(ScalarTraits<E>::fromValue(item));
	}
};

template <typename K, typename V> struct MemberTraits<std::map<K, V>>
{
	static Argument describe(std::string const &name)
	{
		Argument argument(
		        name, std::make_shared<KeyValuePairConverter>(
		                      ScalarTraits<K>::converter(),
		                      ScalarTraits<V>::converter()),
		        typeid(std::pair<K, V>));
		argument.isMultiValue = true;
		argument.isDictionary = true;
		return argument;
	}

	static void assign(std::map<K, V> &member, Value const &value)
	{
		member.clear();
		for(auto const &item : value.items)
		{
			KeyValuePair const &pair = boost::get<KeyValuePair>(item);
			member[ScalarTraits<K>::fromValue(pair.key)] =
			        ScalarTraits<V>::fromValue(pair.value);
		}
	}
};

template <typename T>
typename std::enable_if<std::is_default_constructible<T>::value, T>::type
defaultConstruct()
{
	return T();
}

template <typename T>
typename std::enable_if<!std::is_default_constructible<T>::value, T>::type
defaultConstruct()
{
	throw std::logic_error("This argument set has no constructor, and its "
	                       "type is not default constructible.");
}
}
}
}

#endif
