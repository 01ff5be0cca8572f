#ifndef cmdl_params_ParseOptions_HPP
#define cmdl_params_ParseOptions_HPP

#include <iosfwd>
#include <locale>
#include <memory>
#include <string>
#include <vector>

#include "cmdl/params/ConverterRegistry.hpp"
#include "cmdl/params/StringProvider.hpp"

namespace cmdl
{
namespace params
{
enum class ParsingMode
{
	// Every name is used with any of the argument name prefixes.
	Default,
	// Long names use the long prefix, single character short names use the
	// short prefixes, and short switches can be combined.
	LongShort
};

enum class ErrorMode
{
	Error,
	Warning,
	Allow
};

enum class NumericTokenMode
{
	// A prefix followed by a digit is always a value.
	Value,
	// A prefix followed by a digit is a name if it exactly matches one.
	NameIfKnown
};

enum class PrefixTermination
{
	None,
	// Every token after the terminator is treated as a positional value.
	PositionalOnly,
	// Parsing stops successfully at the terminator, and the rest of the
	// tokens are returned as remaining arguments.
	CancelWithSuccess
};

/*!
 * ParseOptions collects every setting which affects how a command line is
 * tokenized, matched and converted. It is passed explicitly into every parse;
 * the library keeps no global parser state.
 */
struct ParseOptions
{
	ParsingMode mode;
	bool caseSensitive;

	/*!
	 * The prefixes which introduce a named argument. In LongShort mode,
	 * these are the short name prefixes.
	 */
	std::vector<std::string> argumentNamePrefixes;

	// Only used in LongShort mode.
	std::string longArgumentNamePrefix;

	std::vector<char> nameValueSeparators;
	bool allowWhiteSpaceValueSeparator;

	/*!
	 * If true, this overrides duplicateArguments with ErrorMode::Allow.
	 */
	bool allowDuplicateArguments;
	ErrorMode duplicateArguments;

	std::locale culture;

	bool autoHelpArgument;
	bool autoPrefixAliases;
	NumericTokenMode numericTokens;
	PrefixTermination prefixTermination;

	ConverterRegistry converters;
	std::shared_ptr<StringProvider const> stringProvider;

	// Help and warning/error output. Either may be null to discard it.
	std::ostream *out;
	std::ostream *error;

	ParseOptions();

	ErrorMode effectiveDuplicateArguments() const;
	StringProvider const &strings() const;
};
}
}

#endif
