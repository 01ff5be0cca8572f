#ifndef cmdl_params_Value_HPP
#define cmdl_params_Value_HPP

#include <locale>
#include <ostream>
#include <string>
#include <vector>

#include <boost/any.hpp>
#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/recursive_wrapper.hpp>
#include <boost/variant/variant.hpp>

namespace cmdl
{
namespace params
{
/*!
 * The semantic type of an argument's (element) value. Collections and
 * dictionaries are not types of their own; they are properties of the
 * argument (see Argument::isMultiValue and Argument::isDictionary).
 */
enum class ValueType
{
	String,
	Integer,
	Float,
	Boolean,
	DateTime,
	Enumeration,
	Custom,
	KeyValuePair
};

std::string toString(ValueType type);

typedef bool BooleanType;
typedef long long int IntegerType;
typedef double FloatType;
typedef std::string StringType;
typedef boost::posix_time::ptime DateTimeType;

struct EnumValue
{
	std::string name;
	IntegerType value;

	EnumValue(std::string const &n, IntegerType v);

	bool operator==(EnumValue const &o) const;
	bool operator!=(EnumValue const &o) const;
	bool operator<(EnumValue const &o) const;
};

/*!
 * A value produced by a converter for a type the library has no native
 * representation for. The parsed object is held type-erased, along with the
 * text it was parsed from (which is used for comparison and display).
 */
struct CustomValue
{
	boost::any value;
	std::string text;

	CustomValue(boost::any const &v, std::string const &t);

	bool operator==(CustomValue const &o) const;
	bool operator!=(CustomValue const &o) const;
	bool operator<(CustomValue const &o) const;
};

struct KeyValuePair;

typedef boost::variant<BooleanType, IntegerType, FloatType, StringType,
                       DateTimeType, EnumValue, CustomValue,
                       boost::recursive_wrapper<KeyValuePair>>
        ScalarValue;

struct KeyValuePair
{
	ScalarValue key;
	ScalarValue value;

	KeyValuePair(ScalarValue const &k, ScalarValue const &v);

	bool operator==(KeyValuePair const &o) const;
	bool operator!=(KeyValuePair const &o) const;
	bool operator<(KeyValuePair const &o) const;
};

// Streaming writes the same text as format() with the classic locale.
std::ostream &operator<<(std::ostream &out, EnumValue const &value);
std::ostream &operator<<(std::ostream &out, CustomValue const &value);
std::ostream &operator<<(std::ostream &out, KeyValuePair const &value);

ValueType valueTypeOf(ScalarValue const &value);

/*!
 * Render the given value as a string, using the given locale for numbers and
 * dates. For every built-in type, converting the result back with the
 * matching converter and the same locale yields the original value.
 *
 * \param value The value to format.
 * \param culture The locale to format with.
 * \return The value's string representation.
 */
std::string format(ScalarValue const &value,
                   std::locale const &culture = std::locale::classic());

/*!
 * The value of one argument after parsing. Scalar arguments hold exactly one
 * item; multi-value and dictionary arguments hold one item per value, in the
 * order they were supplied.
 */
struct Value
{
	std::vector<ScalarValue> items;
	bool isDefault;

	Value();
	explicit Value(ScalarValue const &v, bool d = false);

	bool empty() const;
	std::size_t size() const;

	/*!
	 * \return The last item in this value. For scalar arguments, this is
	 *         the argument's value. Throws std::out_of_range if empty.
	 */
	ScalarValue const &scalar() const;

	bool operator==(Value const &o) const;
	bool operator!=(Value const &o) const;
};
}
}

#endif
