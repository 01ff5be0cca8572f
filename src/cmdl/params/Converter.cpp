#include "Converter.hpp"

#include <ios>
#include <limits>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "cmdl/algorithm/String.hpp"

namespace
{
const std::vector<std::string> DEFAULT_DATE_TIME_FORMATS{
        "%Y-%m-%dT%H:%M:%S%F", "%Y-%m-%d %H:%M:%S%F", "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"};

template <typename T>
bool parseNumber(std::string const &value, std::locale const &culture,
                 T &parsed)
{
	std::istringstream iss(value);
	iss.imbue(culture);
	iss >> parsed;
	if(iss.fail())
		return false;

	std::string rest;
	iss >> rest;
	return rest.empty();
}

bool parseNonFinite(std::string const &value, double &parsed)
{
	std::string name = value;
	bool negative = false;
	if(!name.empty() && (name[0] == '+' || name[0] == '-'))
	{
		negative = name[0] == '-';
		name.erase(0, 1);
	}

	if(cmdl::algorithm::string::compare(name, "nan", false) == 0)
	{
		parsed = std::numeric_limits<double>::quiet_NaN();
		return true;
	}
	if((cmdl::algorithm::string::compare(name, "inf", false) == 0) ||
	   (cmdl::algorithm::string::compare(name, "infinity", false) == 0))
	{
		parsed = negative ? -std::numeric_limits<double>::infinity()
		                  : std::numeric_limits<double>::infinity();
		return true;
	}
	return false;
}

bool parseDateTime(std::string const &value, std::locale const &culture,
                   boost::posix_time::ptime &parsed)
{
	std::istringstream iss(value);
	iss.imbue(culture);
	try
	{
		iss >> parsed;
	}
	catch(std::out_of_range const &)
	{
		return false;
	}
	catch(std::ios_base::failure const &)
	{
		return false;
	}

	if(iss.fail() || parsed.is_special())
		return false;

	std::string rest;
	iss >> rest;
	return rest.empty();
}
}

namespace cmdl
{
namespace params
{
ConversionError::ConversionError(std::string const &message)
        : std::runtime_error(message)
{
}

ValueType StringConverter::valueType() const
{
	return ValueType::String;
}

ScalarValue StringConverter::convert(std::string const &value,
                                     std::locale const &) const
{
	return StringType(value);
}

ValueType BooleanConverter::valueType() const
{
	return ValueType::Boolean;
}

ScalarValue BooleanConverter::convert(std::string const &value,
                                      std::locale const &) const
{
	if(algorithm::string::compare(value, "true", false) == 0)
		return BooleanType(true);
	if(algorithm::string::compare(value, "false", false) == 0)
		return BooleanType(false);
	throw ConversionError("'" + value + "' is not a valid boolean value.");
}

IntegerConverter::IntegerConverter(IntegerType mn, IntegerType mx)
        : minimum(mn), maximum(mx)
{
}

ValueType IntegerConverter::valueType() const
{
	return ValueType::Integer;
}

ScalarValue IntegerConverter::convert(std::string const &value,
                                      std::locale const &culture) const
{
	IntegerType parsed = 0;
	if(!parseNumber(value, culture, parsed))
		throw ConversionError("'" + value + "' is not a valid integer.");
	if(parsed < minimum || parsed > maximum)
	{
		std::ostringstream oss;
		oss << "'" << value << "' is outside of the range [" << minimum
		    << ", " << maximum << "].";
		throw ConversionError(oss.str());
	}
	return parsed;
}

ValueType FloatConverter::valueType() const
{
	return ValueType::Float;
}

ScalarValue FloatConverter::convert(std::string const &value,
                                    std::locale const &culture) const
{
	FloatType parsed = 0.0;
	if(!parseNumber(value, culture, parsed) &&
	   !parseNonFinite(value, parsed))
	{
		throw ConversionError("'" + value +
		                      "' is not a valid floating point number.");
	}
	return parsed;
}

ValueType DateTimeConverter::valueType() const
{
	return ValueType::DateTime;
}

ScalarValue DateTimeConverter::convert(std::string const &value,
                                       std::locale const &culture) const
{
	boost::posix_time::ptime parsed(boost::posix_time::not_a_date_time);
	if(std::has_facet<boost::posix_time::time_input_facet>(culture))
	{
		if(parseDateTime(value, culture, parsed))
			return parsed;
	}
	else
	{
		for(auto const &format : DEFAULT_DATE_TIME_FORMATS)
		{
			std::locale locale(
			        culture,
			        new boost::posix_time::time_input_facet(format));
			if(parseDateTime(value, locale, parsed))
				return parsed;
		}
	}

	throw ConversionError("'" + value + "' is not a valid date and time.");
}

EnumConverter::EnumConverter(std::vector<EnumValue> const &m) : enumMembers(m)
{
}

ValueType EnumConverter::valueType() const
{
	return ValueType::Enumeration;
}

ScalarValue EnumConverter::convert(std::string const &value,
                                   std::locale const &culture) const
{
	for(auto const &member : enumMembers)
	{
		if(algorithm::string::compare(member.name, value, false) == 0)
			return member;
	}

	IntegerType numeric = 0;
	if(parseNumber(value, culture, numeric))
	{
		for(auto const &member : enumMembers)
		{
			if(member.value == numeric)
				return member;
		}
		return EnumValue("", numeric);
	}

	std::vector<std::string> names;
	for(auto const &member : enumMembers)
		names.push_back(member.name);
	throw ConversionError("'" + value +
	                      "' is not a valid value. Valid values are: " +
	                      algorithm::string::join(names.begin(),
	                                              names.end(), ", ") +
	                      ".");
}

std::vector<EnumValue> const &EnumConverter::members() const
{
	return enumMembers;
}

const std::string KeyValuePairConverter::DEFAULT_SEPARATOR = "=";

KeyValuePairConverter::KeyValuePairConverter(
        std::shared_ptr<ArgumentConverter const> const &k,
        std::shared_ptr<ArgumentConverter const> const &v,
        std::string const &s)
        : key(k), value(v), keyValueSeparator(s)
{
	if(!key || !value)
		throw std::invalid_argument("Key and value converters required.");
	if(keyValueSeparator.empty())
		throw std::invalid_argument("Key/value separator is empty.");
}

ValueType KeyValuePairConverter::valueType() const
{
	return ValueType::KeyValuePair;
}

ScalarValue KeyValuePairConverter::convert(std::string const &v,
                                           std::locale const &culture) const
{
	auto idx = v.find(keyValueSeparator);
	if(idx == std::string::npos)
	{
		throw ConversionError("The value '" + v +
		                      "' does not contain the key/value "
		                      "separator '" +
		                      keyValueSeparator + "'.");
	}

	return KeyValuePair(
	        key->convert(v.substr(0, idx), culture),
	        value->convert(v.substr(idx + keyValueSeparator.length()),
	                       culture));
}

std::shared_ptr<ArgumentConverter const> const &
KeyValuePairConverter::keyConverter() const
{
	return key;
}

std::shared_ptr<ArgumentConverter const> const &
KeyValuePairConverter::valueConverter() const
{
	return value;
}

std::string const &KeyValuePairConverter::separator() const
{
	return keyValueSeparator;
}

FunctionConverter::FunctionConverter(ValueType t, ConversionFunction const &f)
        : type(t), function(f)
{
}

ValueType FunctionConverter::valueType() const
{
	return type;
}

ScalarValue FunctionConverter::convert(std::string const &value,
                                       std::locale const &culture) const
{
	return function(value, culture);
}

ScalarValue convert(ArgumentConverter const &converter,
                    std::string const &value, std::locale const &culture)
{
	try
	{
		return converter.convert(value, culture);
	}
	catch(std::invalid_argument const &e)
	{
		throw ConversionError(e.what());
	}
	catch(std::out_of_range const &e)
	{
		throw ConversionError(e.what());
	}
}
}
}
