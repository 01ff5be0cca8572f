#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <locale>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/any.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/variant/get.hpp>

#include "cmdl/params/Converter.hpp"
#include "cmdl/params/Value.hpp"

namespace
{
class CommaDecimalPoint : public std::numpunct<char>
{
protected:
	virtual char do_decimal_point() const
	{
		return ',';
	}

	virtual char do_thousands_sep() const
	{
		return '.';
	}
};

struct Point
{
	int x;
	int y;

	static Point parse(std::string const &value)
	{
		auto idx = value.find(',');
		if(idx == std::string::npos)
			throw std::invalid_argument("Expected 'x,y'.");
		return {std::stoi(value.substr(0, idx)),
		        std::stoi(value.substr(idx + 1))};
	}
};

const std::locale CLASSIC = std::locale::classic();

void checkReadBack(cmdl::params::ArgumentConverter const &converter,
                   cmdl::params::ScalarValue const &value)
{
	std::string text = cmdl::params::format(value, CLASSIC);
	INFO("Formatted value: " << text);
	CHECK(converter.convert(text, CLASSIC) == value);
}
}

TEST_CASE("Test string conversion", "[Converter]")
{
	cmdl::params::StringConverter converter;
	CHECK(converter.valueType() == cmdl::params::ValueType::String);
	CHECK(boost::get<std::string>(converter.convert(" foo ", CLASSIC)) ==
	      " foo ");
}

TEST_CASE("Test boolean conversion", "[Converter]")
{
	cmdl::params::BooleanConverter converter;
	CHECK(boost::get<bool>(converter.convert("true", CLASSIC)));
	CHECK(boost::get<bool>(converter.convert("TRUE", CLASSIC)));
	CHECK_FALSE(boost::get<bool>(converter.convert("False", CLASSIC)));
	CHECK_THROWS_AS(converter.convert("yes", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(converter.convert("", CLASSIC),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test integer conversion", "[Converter]")
{
	cmdl::params::IntegerConverter converter;
	CHECK(boost::get<cmdl::params::IntegerType>(
	              converter.convert("42", CLASSIC)) == 42);
	CHECK(boost::get<cmdl::params::IntegerType>(
	              converter.convert("-2", CLASSIC)) == -2);
	CHECK_THROWS_AS(converter.convert("4x", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(converter.convert("1.5", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(converter.convert("", CLASSIC),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test integer conversion range", "[Converter]")
{
	cmdl::params::IntegerConverter converter(0, 255);
	CHECK(boost::get<cmdl::params::IntegerType>(
	              converter.convert("255", CLASSIC)) == 255);
	CHECK_THROWS_AS(converter.convert("256", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(converter.convert("-1", CLASSIC),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test float conversion uses the culture", "[Converter]")
{
	cmdl::params::FloatConverter converter;
	std::locale culture(CLASSIC, new CommaDecimalPoint());

	CHECK(boost::get<cmdl::params::FloatType>(
	              converter.convert("1.5", CLASSIC)) == 1.5);
	CHECK(boost::get<cmdl::params::FloatType>(
	              converter.convert("1,5", culture)) == 1.5);
	CHECK_THROWS_AS(converter.convert("1,5", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(converter.convert("abc", CLASSIC),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test formatted values convert back to the same value",
          "[Converter]")
{
	std::locale culture(CLASSIC, new CommaDecimalPoint());
	cmdl::params::FloatConverter converter;

	for(double value : {0.1, -3.25, 1e-7, 123456.789})
	{
		cmdl::params::ScalarValue v(value);
		std::string text = cmdl::params::format(v, culture);
		CHECK(converter.convert(text, culture) == v);
	}

	CHECK(cmdl::params::format(cmdl::params::ScalarValue(1.5), culture) ==
	      "1,5");
}

TEST_CASE("Test every built-in converter reads back formatted values",
          "[Converter]")
{
	SECTION("Strings and booleans")
	{
		cmdl::params::StringConverter strings;
		checkReadBack(strings, cmdl::params::StringType(""));
		checkReadBack(strings, cmdl::params::StringType("hello world"));

		cmdl::params::BooleanConverter booleans;
		checkReadBack(booleans, cmdl::params::BooleanType(true));
		checkReadBack(booleans, cmdl::params::BooleanType(false));
	}

	SECTION("Integers")
	{
		cmdl::params::IntegerConverter converter;
		for(cmdl::params::IntegerType value :
		    {cmdl::params::IntegerType(0), cmdl::params::IntegerType(-42),
		     std::numeric_limits<cmdl::params::IntegerType>::min(),
		     std::numeric_limits<cmdl::params::IntegerType>::max()})
		{
			checkReadBack(converter, value);
		}
	}

	SECTION("Floating point numbers")
	{
		cmdl::params::FloatConverter converter;
		for(double value : {0.0, 0.1, -3.25, 1e300,
		                    std::numeric_limits<double>::max(),
		                    std::numeric_limits<double>::lowest(),
		                    std::numeric_limits<double>::infinity(),
		                    -std::numeric_limits<double>::infinity()})
		{
			checkReadBack(converter, value);
		}

		std::string nan = cmdl::params::format(
		        cmdl::params::ScalarValue(
		                std::numeric_limits<double>::quiet_NaN()),
		        CLASSIC);
		CHECK(std::isnan(boost::get<cmdl::params::FloatType>(
		        converter.convert(nan, CLASSIC))));
		CHECK(std::isinf(boost::get<cmdl::params::FloatType>(
		        converter.convert("-Infinity", CLASSIC))));
	}

	SECTION("Dates and times")
	{
		cmdl::params::DateTimeConverter converter;
		checkReadBack(converter,
		              boost::posix_time::ptime(
		                      boost::gregorian::date(2024, 5, 1),
		                      boost::posix_time::time_duration(13, 45, 7)));
		checkReadBack(converter, boost::posix_time::ptime(
		                                 boost::gregorian::date(2024, 5, 1)));
		checkReadBack(converter, boost::posix_time::time_from_string(
		                                 "2020-01-02 03:04:05.250"));
	}

	SECTION("Enumerations")
	{
		cmdl::params::EnumConverter converter(
		        {cmdl::params::EnumValue("Red", 1),
		         cmdl::params::EnumValue("Green", 2)});
		checkReadBack(converter, cmdl::params::EnumValue("Green", 2));
		checkReadBack(converter, cmdl::params::EnumValue("", 7));
	}

	SECTION("Key/value pairs")
	{
		cmdl::params::KeyValuePairConverter converter(
		        std::make_shared<cmdl::params::StringConverter>(),
		        std::make_shared<cmdl::params::IntegerConverter>());
		checkReadBack(converter,
		              cmdl::params::KeyValuePair(
		                      cmdl::params::StringType("foo"),
		                      cmdl::params::IntegerType(-12)));
	}
}

TEST_CASE("Test date and time conversion", "[Converter]")
{
	cmdl::params::DateTimeConverter converter;
	boost::posix_time::ptime expected(
	        boost::gregorian::date(2024, 5, 1),
	        boost::posix_time::time_duration(13, 45, 0));

	CHECK(boost::get<cmdl::params::DateTimeType>(converter.convert(
	              "2024-05-01T13:45:00", CLASSIC)) == expected);
	CHECK(boost::get<cmdl::params::DateTimeType>(converter.convert(
	              "2024-05-01 13:45:00", CLASSIC)) == expected);
	CHECK_THROWS_AS(converter.convert("yesterday", CLASSIC),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test date and time conversion with a culture format",
          "[Converter]")
{
	cmdl::params::DateTimeConverter converter;
	std::locale culture(
	        CLASSIC,
	        new boost::posix_time::time_input_facet("%d/%m/%Y %H:%M:%S"));
	boost::posix_time::ptime expected(
	        boost::gregorian::date(2024, 5, 1),
	        boost::posix_time::time_duration(13, 45, 0));

	CHECK(boost::get<cmdl::params::DateTimeType>(converter.convert(
	              "01/05/2024 13:45:00", culture)) == expected);
	CHECK_THROWS_AS(converter.convert("yesterday", culture),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test enumeration conversion", "[Converter]")
{
	cmdl::params::EnumConverter converter(
	        {cmdl::params::EnumValue("Red", 1),
	         cmdl::params::EnumValue("Green", 2)});

	auto value = boost::get<cmdl::params::EnumValue>(
	        converter.convert("green", CLASSIC));
	CHECK(value.name == "Green");
	CHECK(value.value == 2);

	value = boost::get<cmdl::params::EnumValue>(
	        converter.convert("1", CLASSIC));
	CHECK(value.name == "Red");

	// Undefined numeric values are accepted without a name.
	value = boost::get<cmdl::params::EnumValue>(
	        converter.convert("7", CLASSIC));
	CHECK(value.name.empty());
	CHECK(value.value == 7);

	CHECK_THROWS_AS(converter.convert("Blue", CLASSIC),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test key/value pair conversion", "[Converter]")
{
	cmdl::params::KeyValuePairConverter converter(
	        std::make_shared<cmdl::params::StringConverter>(),
	        std::make_shared<cmdl::params::IntegerConverter>());

	// Only the first separator splits; the rest belongs to the value.
	CHECK_THROWS_AS(converter.convert("foo=12=3", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(converter.convert("foo", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(converter.convert("foo=bar", CLASSIC),
	                cmdl::params::ConversionError);

	auto pair = boost::get<cmdl::params::KeyValuePair>(
	        converter.convert("foo=12", CLASSIC));
	CHECK(boost::get<std::string>(pair.key) == "foo");
	CHECK(boost::get<cmdl::params::IntegerType>(pair.value) == 12);
	CHECK(cmdl::params::format(pair) == "foo=12");
}

TEST_CASE("Test key/value pair conversion with a custom separator",
          "[Converter]")
{
	cmdl::params::KeyValuePairConverter converter(
	        std::make_shared<cmdl::params::StringConverter>(),
	        std::make_shared<cmdl::params::StringConverter>(), "::");

	auto pair = boost::get<cmdl::params::KeyValuePair>(
	        converter.convert("a::b=c", CLASSIC));
	CHECK(boost::get<std::string>(pair.key) == "a");
	CHECK(boost::get<std::string>(pair.value) == "b=c");

	CHECK_THROWS_AS(cmdl::params::KeyValuePairConverter(
	                        std::make_shared<
	                                cmdl::params::StringConverter>(),
	                        std::make_shared<
	                                cmdl::params::StringConverter>(),
	                        ""),
	                std::invalid_argument);
}

TEST_CASE("Test conversion with a parse function", "[Converter]")
{
	cmdl::params::ParsableConverter<Point> converter;
	CHECK(converter.valueType() == cmdl::params::ValueType::Custom);

	auto value = boost::get<cmdl::params::CustomValue>(
	        cmdl::params::convert(converter, "3,4", CLASSIC));
	CHECK(value.text == "3,4");
	Point point = boost::any_cast<Point>(value.value);
	CHECK(point.x == 3);
	CHECK(point.y == 4);

	// std::invalid_argument from the parse function is reported as a
	// conversion error.
	CHECK_THROWS_AS(cmdl::params::convert(converter, "34", CLASSIC),
	                cmdl::params::ConversionError);
	CHECK_THROWS_AS(cmdl::params::convert(converter, "a,b", CLASSIC),
	                cmdl::params::ConversionError);
}

TEST_CASE("Test function converter", "[Converter]")
{
	cmdl::params::FunctionConverter converter(
	        cmdl::params::ValueType::Integer,
	        [](std::string const &value,
	           std::locale const &) -> cmdl::params::ScalarValue
	        {
		        return static_cast<cmdl::params::IntegerType>(
		                value.length());
		});

	CHECK(converter.valueType() == cmdl::params::ValueType::Integer);
	CHECK(boost::get<cmdl::params::IntegerType>(
	              converter.convert("abcd", CLASSIC)) == 4);
}
