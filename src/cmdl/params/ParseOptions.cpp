#include "ParseOptions.hpp"

#include <iostream>

namespace
{
std::vector<std::string> defaultArgumentNamePrefixes()
{
#ifdef _WIN32
	return {"-", "/"};
#else
	return {"-"};
#endif
}
}

namespace cmdl
{
namespace params
{
ParseOptions::ParseOptions()
        : mode(ParsingMode::Default),
          caseSensitive(false),
          argumentNamePrefixes(defaultArgumentNamePrefixes()),
          longArgumentNamePrefix("--"),
          nameValueSeparators({':', '='}),
          allowWhiteSpaceValueSeparator(true),
          allowDuplicateArguments(false),
          duplicateArguments(ErrorMode::Error),
          culture(std::locale::classic()),
          autoHelpArgument(true),
          autoPrefixAliases(false),
          numericTokens(NumericTokenMode::Value),
          prefixTermination(PrefixTermination::None),
          converters(),
          stringProvider(std::make_shared<StringProvider>()),
          out(&std::cout),
          error(&std::cerr)
{
}

ErrorMode ParseOptions::effectiveDuplicateArguments() const
{
	if(allowDuplicateArguments)
		return ErrorMode::Allow;
	return duplicateArguments;
}

StringProvider const &ParseOptions::strings() const
{
	static const StringProvider defaultProvider;
	if(!stringProvider)
		return defaultProvider;
	return *stringProvider;
}
}
}
