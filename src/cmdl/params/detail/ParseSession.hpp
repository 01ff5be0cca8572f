#ifndef cmdl_params_detail_ParseSession_HPP
#define cmdl_params_detail_ParseSession_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/ParseResult.hpp"
#include "cmdl/params/Schema.hpp"
#include "cmdl/params/Validator.hpp"
#include "cmdl/params/detail/tokenize.hpp"

namespace cmdl
{
namespace params
{
namespace detail
{
enum class SessionState
{
	Initial,
	Tokenizing,
	EndOfStreamChecks,
	AfterParsingValidation,
	Complete,
	Failed,
	Canceled
};

/*!
 * A ParseSession performs exactly one parse of a command line against a
 * schema. It owns the per-argument state for that parse, and is the view
 * validators see of the other arguments. Sessions are not reusable, and must
 * not be shared between threads.
 */
class ParseSession : public ArgumentStateView
{
public:
	ParseSession(std::shared_ptr<Schema const> const &s,
	             ParseOptions const &o);

	ParseSession(ParseSession const &) = delete;
	ParseSession &operator=(ParseSession const &) = delete;

	virtual ~ParseSession() = default;

	/*!
	 * Parse the given arguments, starting at the given index. Throws a
	 * ParseError if the arguments are invalid, in which case the session
	 * ends up in the Failed state.
	 *
	 * \param args The raw command-line arguments.
	 * \param index The index of the first argument to parse.
	 * \return The result of the parse.
	 */
	ParseResult run(std::vector<std::string> const &args,
	                std::size_t index = 0);

	SessionState state() const;

	virtual Value const *value(std::string const &name) const;
	virtual bool isSupplied(std::string const &name) const;

private:
	struct ArgumentState
	{
		boost::optional<Value> value;
		boost::optional<std::string> rawValue;
		boost::optional<std::string> usedName;
	};

	std::shared_ptr<Schema const> schema;
	ParseOptions const &options;
	SessionState sessionState;
	std::vector<ArgumentState> states;
	std::size_t positionalIndex;
	bool positionalOnly;
	boost::optional<std::size_t> greedyArgument;
	boost::optional<std::size_t> cancelingArgument;

	std::size_t resolveName(Token const &token) const;
	std::size_t resolveShortName(char name) const;

	boost::optional<std::string>
	acquireValue(std::vector<std::string> const &args, std::size_t &index,
	             Token const &token, Argument const &argument) const;

	std::size_t parseNamed(std::vector<std::string> const &args,
	                       std::size_t index, Token const &token);
	std::size_t parseShortNamed(std::vector<std::string> const &args,
	                            std::size_t index, Token const &token);
	void parsePositional(std::string const &value);

	void setValue(std::size_t index, std::string const &raw,
	              boost::optional<std::string> const &usedName);

	std::shared_ptr<ArgumentConverter const>
	converterFor(Argument const &argument) const;
	ScalarValue convertValue(Argument const &argument,
	                         ArgumentConverter const &converter,
	                         std::string const &raw,
	                         std::locale const &culture) const;
	void runValidators(ValidationContext const &context) const;

	void checkRequired() const;
	void applyDefaults();
	void validateAfterParsing() const;

	ParseResult makeResult(ParseStatus status,
	                       std::vector<std::string> const &remaining,
	                       boost::optional<std::string> const &canceledBy,
	                       bool helpRequested) const;
};
}
}
}

#endif
