#ifndef cmdl_params_detail_tokenize_HPP
#define cmdl_params_detail_tokenize_HPP

#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/Schema.hpp"

namespace cmdl
{
namespace params
{
namespace detail
{
enum class TokenKind
{
	// A positional value, or the value of a preceding named argument.
	Value,
	// A name used with a long prefix, or any prefix in Default mode.
	Named,
	// One or more combined short names, in LongShort mode.
	ShortNamed,
	// The prefix termination token ("--"), if enabled.
	Terminator
};

struct Token
{
	TokenKind kind;
	std::string text;
	std::string prefix;
	std::string name;
	boost::optional<std::string> value;

	Token(TokenKind k, std::string const &t);
};

/*!
 * \param options The parse options in use.
 * \return Every name prefix in use, longest first.
 */
std::vector<std::string> sortedPrefixes(ParseOptions const &options);

/*!
 * Classify a single command-line token. Named tokens are split into their
 * prefix, name and (optional) inline value, at the first name/value
 * separator. A token consisting only of a prefix is a value, and so is a
 * prefix followed by a digit (a negative number), unless
 * NumericTokenMode::NameIfKnown is set and the name exactly matches an
 * argument.
 *
 * \param token The raw token.
 * \param schema The schema being parsed against.
 * \param options The parse options in use.
 * \return The classified token.
 */
Token classifyToken(std::string const &token, Schema const &schema,
                    ParseOptions const &options);
}
}
}

#endif
