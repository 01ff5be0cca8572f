#include "Value.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

namespace
{
class ValueTypeVisitor : public boost::static_visitor<cmdl::params::ValueType>
{
public:
	cmdl::params::ValueType operator()(cmdl::params::BooleanType const &) const
	{
		return cmdl::params::ValueType::Boolean;
	}

	cmdl::params::ValueType operator()(cmdl::params::IntegerType const &) const
	{
		return cmdl::params::ValueType::Integer;
	}

	cmdl::params::ValueType operator()(cmdl::params::FloatType const &) const
	{
		return cmdl::params::ValueType::Float;
	}

	cmdl::params::ValueType operator()(cmdl::params::StringType const &) const
	{
		return cmdl::params::ValueType::String;
	}

	cmdl::params::ValueType
	operator()(cmdl::params::DateTimeType const &) const
	{
		return cmdl::params::ValueType::DateTime;
	}

	cmdl::params::ValueType operator()(cmdl::params::EnumValue const &) const
	{
		return cmdl::params::ValueType::Enumeration;
	}

	cmdl::params::ValueType
	operator()(cmdl::params::CustomValue const &) const
	{
		return cmdl::params::ValueType::Custom;
	}

	cmdl::params::ValueType
	operator()(cmdl::params::KeyValuePair const &) const
	{
		return cmdl::params::ValueType::KeyValuePair;
	}
};

std::string formatFloat(double value, std::locale const &culture)
{
	// Prefer the shorter representation, unless it loses precision.
	for(int precision : {std::numeric_limits<double>::digits10,
	                     std::numeric_limits<double>::max_digits10})
	{
		std::ostringstream oss;
		oss.imbue(culture);
		oss << std::setprecision(precision) << value;

		std::istringstream iss(oss.str());
		iss.imbue(culture);
		double parsed = 0.0;
		iss >> parsed;
		if(!iss.fail() && parsed == value)
			return oss.str();
	}

	std::ostringstream oss;
	oss.imbue(culture);
	oss << std::setprecision(std::numeric_limits<double>::max_digits10)
	    << value;
	return oss.str();
}

class FormatVisitor : public boost::static_visitor<std::string>
{
public:
	FormatVisitor(std::locale const &c) : culture(c)
	{
	}

	std::string operator()(cmdl::params::BooleanType const &value) const
	{
		return value ? "true" : "false";
	}

	std::string operator()(cmdl::params::IntegerType const &value) const
	{
		std::ostringstream oss;
		oss.imbue(culture);
		oss << value;
		return oss.str();
	}

	std::string operator()(cmdl::params::FloatType const &value) const
	{
		if(std::isnan(value))
			return "NaN";
		return formatFloat(value, culture);
	}

	std::string operator()(cmdl::params::StringType const &value) const
	{
		return value;
	}

	std::string operator()(cmdl::params::DateTimeType const &value) const
	{
		if(!std::has_facet<boost::posix_time::time_facet>(culture))
			return boost::posix_time::to_iso_extended_string(value);

		std::ostringstream oss;
		oss.imbue(culture);
		oss << value;
		return oss.str();
	}

	std::string operator()(cmdl::params::EnumValue const &value) const
	{
		if(!value.name.empty())
			return value.name;
		return (*this)(value.value);
	}

	std::string operator()(cmdl::params::CustomValue const &value) const
	{
		return value.text;
	}

	std::string operator()(cmdl::params::KeyValuePair const &value) const
	{
		return boost::apply_visitor(*this, value.key) + "=" +
		       boost::apply_visitor(*this, value.value);
	}

private:
	std::locale culture;
};
}

namespace cmdl
{
namespace params
{
std::string toString(ValueType type)
{
	switch(type)
	{
	case ValueType::String:
		return "String";
	case ValueType::Integer:
		return "Integer";
	case ValueType::Float:
		return "Float";
	case ValueType::Boolean:
		return "Boolean";
	case ValueType::DateTime:
		return "DateTime";
	case ValueType::Enumeration:
		return "Enumeration";
	case ValueType::Custom:
		return "Custom";
	case ValueType::KeyValuePair:
		return "KeyValuePair";
	}
	return "Custom";
}

EnumValue::EnumValue(std::string const &n, IntegerType v) : name(n), value(v)
{
}

bool EnumValue::operator==(EnumValue const &o) const
{
	return value == o.value;
}

bool EnumValue::operator!=(EnumValue const &o) const
{
	return !(*this == o);
}

bool EnumValue::operator<(EnumValue const &o) const
{
	return value < o.value;
}

CustomValue::CustomValue(boost::any const &v, std::string const &t)
        : value(v), text(t)
{
}

bool CustomValue::operator==(CustomValue const &o) const
{
	return text == o.text;
}

bool CustomValue::operator!=(CustomValue const &o) const
{
	return !(*this == o);
}

bool CustomValue::operator<(CustomValue const &o) const
{
	return text < o.text;
}

KeyValuePair::KeyValuePair(ScalarValue const &k, ScalarValue const &v)
        : key(k), value(v)
{
}

bool KeyValuePair::operator==(KeyValuePair const &o) const
{
	return (key == o.key) && (value == o.value);
}

bool KeyValuePair::operator!=(KeyValuePair const &o) const
{
	return !(*this == o);
}

bool KeyValuePair::operator<(KeyValuePair const &o) const
{
	if(key < o.key)
		return true;
	if(o.key < key)
		return false;
	return value < o.value;
}

std::ostream &operator<<(std::ostream &out, EnumValue const &value)
{
	out << format(ScalarValue(value));
	return out;
}

std::ostream &operator<<(std::ostream &out, CustomValue const &value)
{
	out << format(ScalarValue(value));
	return out;
}

std::ostream &operator<<(std::ostream &out, KeyValuePair const &value)
{
	out << format(ScalarValue(value));
	return out;
}

ValueType valueTypeOf(ScalarValue const &value)
{
	return boost::apply_visitor(ValueTypeVisitor(), value);
}

std::string format(ScalarValue const &value, std::locale const &culture)
{
	return boost::apply_visitor(FormatVisitor(culture), value);
}

Value::Value() : items(), isDefault(false)
{
}

Value::Value(ScalarValue const &v, bool d) : items({v}), isDefault(d)
{
}

bool Value::empty() const
{
	return items.empty();
}

std::size_t Value::size() const
{
	return items.size();
}

ScalarValue const &Value::scalar() const
{
	if(items.empty())
		throw std::out_of_range("Value has no items.");
	return items.back();
}

bool Value::operator==(Value const &o) const
{
	return items == o.items;
}

bool Value::operator!=(Value const &o) const
{
	return !(*this == o);
}
}
}
