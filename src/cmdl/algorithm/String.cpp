#include "String.hpp"

#include <algorithm>
#include <cctype>
#include <locale>

namespace
{
char lowerAscii(char c)
{
	return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}
}

namespace cmdl
{
namespace algorithm
{
namespace string
{
int compare(std::string const &a, std::string const &b, bool caseSensitive)
{
	if(caseSensitive)
		return a.compare(b);

	auto aIt = a.begin();
	auto bIt = b.begin();
	for(; aIt != a.end() && bIt != b.end(); ++aIt, ++bIt)
	{
		char ac = lowerAscii(*aIt);
		char bc = lowerAscii(*bIt);
		if(ac != bc)
			return ac < bc ? -1 : 1;
	}

	if(aIt == a.end())
		return bIt == b.end() ? 0 : -1;
	return 1;
}

bool startsWith(std::string const &s, std::string const &prefix,
                bool caseSensitive)
{
	if(prefix.length() > s.length())
		return false;
	return compare(s.substr(0, prefix.length()), prefix, caseSensitive) ==
	       0;
}

std::vector<std::string> split(std::string const &s, std::string const &d,
                               bool keepEmpty)
{
	std::vector<std::string> components;
	if(d.empty())
	{
		if(keepEmpty || !s.empty())
			components.push_back(s);
		return components;
	}

	std::string::size_type start = 0;
	while(true)
	{
		std::string::size_type end = s.find(d, start);
		std::string component = s.substr(
		        start, end == std::string::npos ? std::string::npos
		                                        : end - start);
		if(keepEmpty || !component.empty())
			components.push_back(component);

		if(end == std::string::npos)
			break;
		start = end + d.length();
	}

	return components;
}

bool isWhiteSpace(std::string const &s)
{
	std::locale locale;
	return std::all_of(s.begin(), s.end(), [&locale](char c) -> bool
	                   {
		                   return std::isspace(c, locale);
		           });
}
}
}
}
