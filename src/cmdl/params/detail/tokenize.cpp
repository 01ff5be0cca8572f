#include "tokenize.hpp"

#include <algorithm>
#include <cctype>

#include "cmdl/algorithm/String.hpp"

namespace
{
bool isDigit(char c)
{
	return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool looksNumeric(std::string const &s)
{
	if(s.empty())
		return false;
	if(isDigit(s[0]))
		return true;
	return (s[0] == '.') && (s.length() > 1) && isDigit(s[1]);
}

std::string terminatorToken(cmdl::params::ParseOptions const &options)
{
	if(options.mode == cmdl::params::ParsingMode::LongShort)
		return options.longArgumentNamePrefix;
	return "--";
}
}

namespace cmdl
{
namespace params
{
namespace detail
{
Token::Token(TokenKind k, std::string const &t)
        : kind(k), text(t), prefix(), name(), value(boost::none)
{
}

std::vector<std::string> sortedPrefixes(ParseOptions const &options)
{
	std::vector<std::string> prefixes;
	for(auto const &prefix : options.argumentNamePrefixes)
	{
		if(!prefix.empty())
			prefixes.push_back(prefix);
	}
	if((options.mode == ParsingMode::LongShort) &&
	   !options.longArgumentNamePrefix.empty())
	{
		prefixes.push_back(options.longArgumentNamePrefix);
	}

	std::sort(prefixes.begin(), prefixes.end());
	prefixes.erase(std::unique(prefixes.begin(), prefixes.end()),
	               prefixes.end());
	std::stable_sort(prefixes.begin(), prefixes.end(),
	                 [](std::string const &a, std::string const &b) -> bool
	                 {
		                 return a.length() > b.length();
		         });
	return prefixes;
}

Token classifyToken(std::string const &token, Schema const &schema,
                    ParseOptions const &options)
{
	if((options.prefixTermination != PrefixTermination::None) &&
	   (token == terminatorToken(options)))
	{
		return Token(TokenKind::Terminator, token);
	}

	for(auto const &prefix : sortedPrefixes(options))
	{
		if(!algorithm::string::startsWith(token, prefix))
			continue;

		std::string rest = token.substr(prefix.length());
		if(rest.empty())
			return Token(TokenKind::Value, token);

		bool isShort = (options.mode == ParsingMode::LongShort) &&
		               (prefix != options.longArgumentNamePrefix);

		Token ret(isShort ? TokenKind::ShortNamed : TokenKind::Named,
		          token);
		ret.prefix = prefix;
		auto separator = rest.find_first_of(
		        std::string(options.nameValueSeparators.begin(),
		                    options.nameValueSeparators.end()));
		ret.name = rest.substr(0, separator);
		if(separator != std::string::npos)
			ret.value = rest.substr(separator + 1);

		if(looksNumeric(rest))
		{
			if(options.numericTokens == NumericTokenMode::Value)
				return Token(TokenKind::Value, token);

			bool known = false;
			if(isShort)
			{
				known = (ret.name.length() == 1) &&
				        !!schema.findShort(ret.name[0]);
			}
			else
			{
				known = !!schema.find(ret.name);
			}

			if(!known)
				return Token(TokenKind::Value, token);
		}

		return ret;
	}

	return Token(TokenKind::Value, token);
}
}
}
}
