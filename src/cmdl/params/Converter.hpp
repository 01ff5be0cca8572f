#ifndef cmdl_params_Converter_HPP
#define cmdl_params_Converter_HPP

#include <functional>
#include <limits>
#include <locale>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cmdl/params/Value.hpp"

namespace cmdl
{
namespace params
{
/*!
 * Thrown by converters when a string cannot be converted to the target type.
 * The parse session wraps this in a ParseError with the
 * ArgumentValueConversion category.
 */
class ConversionError : public std::runtime_error
{
public:
	explicit ConversionError(std::string const &message);
	virtual ~ConversionError() = default;
};

/*!
 * An ArgumentConverter maps one raw command-line string to a typed value.
 * Converters must be deterministic: the result depends only on the input
 * string and the given locale. On failure, implementations throw
 * ConversionError (std::invalid_argument and std::out_of_range are also
 * treated as conversion failures).
 */
class ArgumentConverter
{
public:
	virtual ~ArgumentConverter() = default;

	virtual ValueType valueType() const = 0;

	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const = 0;
};

class StringConverter : public ArgumentConverter
{
public:
	virtual ~StringConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;
};

/*!
 * Accepts "true" and "false", ignoring case.
 */
class BooleanConverter : public ArgumentConverter
{
public:
	virtual ~BooleanConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;
};

/*!
 * Converts integers, rejecting any value outside of [minimum, maximum]. This
 * allows the same converter to serve every integral member type.
 */
class IntegerConverter : public ArgumentConverter
{
public:
	IntegerConverter(
	        IntegerType mn = std::numeric_limits<IntegerType>::min(),
	        IntegerType mx = std::numeric_limits<IntegerType>::max());

	virtual ~IntegerConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;

private:
	IntegerType minimum;
	IntegerType maximum;
};

class FloatConverter : public ArgumentConverter
{
public:
	virtual ~FloatConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;
};

/*!
 * Converts dates and times. If the given locale has a
 * boost::posix_time::time_input_facet installed, that facet's format is the
 * only one accepted. Otherwise, ISO 8601 style values ("2024-05-01",
 * "2024-05-01 13:45:00" or "2024-05-01T13:45:00") are accepted.
 */
class DateTimeConverter : public ArgumentConverter
{
public:
	virtual ~DateTimeConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;
};

/*!
 * Converts enumeration values by member name (ignoring case), or by numeric
 * value. A numeric value which does not correspond to any member is accepted
 * with an empty name; ValidateEnumValue can be used to reject those.
 */
class EnumConverter : public ArgumentConverter
{
public:
	explicit EnumConverter(std::vector<EnumValue> const &m);

	virtual ~EnumConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;

	std::vector<EnumValue> const &members() const;

private:
	std::vector<EnumValue> enumMembers;
};

/*!
 * Converts "key<separator>value" strings into a KeyValuePair, using separate
 * converters for the key and the value. Only the first occurrence of the
 * separator splits the string.
 */
class KeyValuePairConverter : public ArgumentConverter
{
public:
	static const std::string DEFAULT_SEPARATOR;

	KeyValuePairConverter(std::shared_ptr<ArgumentConverter const> const &k,
	                      std::shared_ptr<ArgumentConverter const> const &v,
	                      std::string const &s = DEFAULT_SEPARATOR);

	virtual ~KeyValuePairConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;

	std::shared_ptr<ArgumentConverter const> const &keyConverter() const;
	std::shared_ptr<ArgumentConverter const> const &valueConverter() const;
	std::string const &separator() const;

private:
	std::shared_ptr<ArgumentConverter const> key;
	std::shared_ptr<ArgumentConverter const> value;
	std::string keyValueSeparator;
};

/*!
 * Convert the given value with the given converter. Besides ConversionError,
 * converters (and user parse hooks) may report failures by throwing
 * std::invalid_argument or std::out_of_range; this function rethrows those
 * as ConversionError, so callers only need to handle the one type.
 *
 * \param converter The converter to use.
 * \param value The raw value to convert.
 * \param culture The locale to convert with.
 * \return The converted value.
 */
ScalarValue convert(ArgumentConverter const &converter,
                    std::string const &value, std::locale const &culture);

typedef std::function<ScalarValue(std::string const &, std::locale const &)>
        ConversionFunction;

/*!
 * Adapts an arbitrary function into a converter, for one-off per-argument
 * conversions.
 */
class FunctionConverter : public ArgumentConverter
{
public:
	FunctionConverter(ValueType t, ConversionFunction const &f);

	virtual ~FunctionConverter() = default;

	virtual ValueType valueType() const;
	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const;

private:
	ValueType type;
	ConversionFunction function;
};

namespace detail
{
template <typename T> class HasCultureParse
{
private:
	template <typename U>
	static auto test(int) -> decltype(
	        U::parse(std::declval<std::string const &>(),
	                 std::declval<std::locale const &>()),
	        std::true_type());

	template <typename> static std::false_type test(...);

public:
	static constexpr bool value = decltype(test<T>(0))::value;
};

template <typename T> class HasPlainParse
{
private:
	template <typename U>
	static auto test(int) -> decltype(
	        U::parse(std::declval<std::string const &>()),
	        std::true_type());

	template <typename> static std::false_type test(...);

public:
	static constexpr bool value = decltype(test<T>(0))::value;
};

template <typename T>
T callParse(std::string const &value, std::locale const &culture,
            std::true_type)
{
	return T::parse(value, culture);
}

template <typename T>
T callParse(std::string const &value, std::locale const &, std::false_type)
{
	return T::parse(value);
}
}

/*!
 * Converts any type T which exposes a static parse function, taking either
 * (std::string const &, std::locale const &) or just (std::string const &),
 * and returning a T. The parse function reports failure by throwing
 * ConversionError, std::invalid_argument or std::out_of_range.
 */
template <typename T> class ParsableConverter : public ArgumentConverter
{
public:
	virtual ~ParsableConverter() = default;

	virtual ValueType valueType() const
	{
		return ValueType::Custom;
	}

	virtual ScalarValue convert(std::string const &value,
	                            std::locale const &culture) const
	{
		return CustomValue(
		        detail::callParse<T>(
		                value, culture,
		                std::integral_constant<
		                        bool,
		                        detail::HasCultureParse<T>::value>()),
		        value);
	}
};
}
}

#endif
