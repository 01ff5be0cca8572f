#include "ParseSession.hpp"

#include <ostream>
#include <stdexcept>

#include <boost/variant/get.hpp>

#include "cmdl/algorithm/String.hpp"
#include "cmdl/params/ParseError.hpp"
#include "cmdl/util/ScopeExit.hpp"

namespace cmdl
{
namespace params
{
namespace detail
{
ParseSession::ParseSession(std::shared_ptr<Schema const> const &s,
                           ParseOptions const &o)
        : schema(s),
          options(o),
          sessionState(SessionState::Initial),
          states(),
          positionalIndex(0),
          positionalOnly(false),
          greedyArgument(boost::none),
          cancelingArgument(boost::none)
{
	if(!schema)
		throw std::invalid_argument("Can't parse without a schema.");
	states.resize(schema->size());
}

ParseResult ParseSession::run(std::vector<std::string> const &args,
                              std::size_t index)
{
	if(sessionState != SessionState::Initial)
		throw std::logic_error("A parse session can only be run once.");
	if(index > args.size())
		throw std::out_of_range("Argument index out of range.");

	util::ScopeExit fail([this]()
	                     {
		                     sessionState = SessionState::Failed;
		             });
	sessionState = SessionState::Tokenizing;

	for(std::size_t i = index; i < args.size(); ++i)
	{
		if(positionalOnly)
		{
			parsePositional(args[i]);
		}
		else
		{
			Token token = classifyToken(args[i], *schema, options);
			switch(token.kind)
			{
			case TokenKind::Terminator:
				greedyArgument = boost::none;
				if(options.prefixTermination ==
				   PrefixTermination::PositionalOnly)
				{
					positionalOnly = true;
					break;
				}

				// Stop here, handing back everything after the
				// terminator.
				applyDefaults();
				fail.dismiss();
				sessionState = SessionState::Canceled;
				return makeResult(
				        ParseStatus::Success,
				        std::vector<std::string>(
				                args.begin() + i + 1, args.end()),
				        boost::none, false);

			case TokenKind::Named:
				i = parseNamed(args, i, token);
				break;

			case TokenKind::ShortNamed:
				i = parseShortNamed(args, i, token);
				break;

			case TokenKind::Value:
				if(!!greedyArgument)
					setValue(*greedyArgument, args[i], boost::none);
				else
					parsePositional(args[i]);
				break;
			}
		}

		if(!!cancelingArgument)
		{
			Argument const &argument =
			        schema->argument(*cancelingArgument);
			if(argument.cancelMode == CancelMode::AbortFailure)
			{
				fail.dismiss();
				sessionState = SessionState::Canceled;
				return makeResult(ParseStatus::Canceled, {},
				                  argument.name, true);
			}

			applyDefaults();
			fail.dismiss();
			sessionState = SessionState::Canceled;
			return makeResult(
			        ParseStatus::Success,
			        std::vector<std::string>(args.begin() + i + 1,
			                                 args.end()),
			        argument.name, false);
		}
	}

	sessionState = SessionState::EndOfStreamChecks;
	checkRequired();
	applyDefaults();

	sessionState = SessionState::AfterParsingValidation;
	validateAfterParsing();

	fail.dismiss();
	sessionState = SessionState::Complete;
	return makeResult(ParseStatus::Success, {}, boost::none, false);
}

SessionState ParseSession::state() const
{
	return sessionState;
}

Value const *ParseSession::value(std::string const &name) const
{
	auto index = schema->indexOf(name);
	if(!index)
		throw std::out_of_range("Unknown argument '" + name + "'.");
	auto const &v = states[*index].value;
	if(!v)
		return nullptr;
	return &(*v);
}

bool ParseSession::isSupplied(std::string const &name) const
{
	Value const *v = value(name);
	return (v != nullptr) && !v->isDefault;
}

std::size_t ParseSession::resolveName(Token const &token) const
{
	auto index = schema->find(token.name);
	if(!!index)
		return *index;

	if(options.autoPrefixAliases && !token.name.empty())
	{
		auto matches = schema->findByPrefix(token.name);
		if(matches.size() == 1)
			return matches.front();
	}

	throw ParseError(ErrorCategory::UnknownArgument,
	                 options.strings().unknownArgument(token.name),
	                 token.name);
}

std::size_t ParseSession::resolveShortName(char name) const
{
	auto index = schema->findShort(name);
	if(!index)
	{
		std::string n(1, name);
		throw ParseError(ErrorCategory::UnknownArgument,
		                 options.strings().unknownArgument(n), n);
	}
	return *index;
}

boost::optional<std::string>
ParseSession::acquireValue(std::vector<std::string> const &args,
                           std::size_t &index, Token const &token,
                           Argument const &argument) const
{
	if(!!token.value)
		return token.value;
	if(argument.isSwitch)
		return std::string("true");

	// With white space as a separator, the next token is the value, as
	// long as it isn't a name itself.
	if(options.allowWhiteSpaceValueSeparator && (index + 1 < args.size()) &&
	   (classifyToken(args[index + 1], *schema, options).kind ==
	    TokenKind::Value))
	{
		++index;
		return args[index];
	}

	throw ParseError(ErrorCategory::MissingNamedArgumentValue,
	                 options.strings().missingNamedArgumentValue(
	                         argument.name),
	                 argument.name);
}

std::size_t ParseSession::parseNamed(std::vector<std::string> const &args,
                                     std::size_t index, Token const &token)
{
	greedyArgument = boost::none;

	std::size_t argumentIndex = (token.kind == TokenKind::ShortNamed)
	                                    ? resolveShortName(token.name[0])
	                                    : resolveName(token);
	Argument const &argument = schema->argument(argumentIndex);
	auto value = acquireValue(args, index, token, argument);
	setValue(argumentIndex, *value, token.name);

	if(argument.isMultiValue && argument.allowMultiValueWhiteSpaceSeparator &&
	   options.allowWhiteSpaceValueSeparator && !cancelingArgument)
	{
		greedyArgument = argumentIndex;
	}
	return index;
}

std::size_t
ParseSession::parseShortNamed(std::vector<std::string> const &args,
                              std::size_t index, Token const &token)
{
	if(token.name.empty())
	{
		throw ParseError(ErrorCategory::UnknownArgument,
		                 options.strings().unknownArgument(token.name),
		                 token.name);
	}
	if(token.name.length() == 1)
		return parseNamed(args, index, token);

	greedyArgument = boost::none;

	// Combined short names: every one but the last must be a switch. The
	// last one receives the inline value, if there is one.
	for(std::size_t c = 0; c < token.name.length(); ++c)
	{
		std::size_t argumentIndex = resolveShortName(token.name[c]);
		Argument const &argument = schema->argument(argumentIndex);
		bool last = (c + 1 == token.name.length());

		if(!argument.isSwitch && (!last || !token.value))
		{
			throw ParseError(
			        ErrorCategory::CombinedShortNameNonSwitch,
			        options.strings().combinedShortNameNonSwitch(
			                token.name),
			        token.name);
		}

		std::string value = "true";
		if(last && !!token.value)
			value = *token.value;
		setValue(argumentIndex, value, std::string(1, token.name[c]));

		if(!!cancelingArgument)
			break;
	}

	return index;
}

void ParseSession::parsePositional(std::string const &value)
{
	// Skip positional arguments which were already supplied by name.
	while((positionalIndex < schema->positionalCount()) &&
	      !schema->argument(positionalIndex).isMultiValue &&
	      !!states[positionalIndex].value)
	{
		++positionalIndex;
	}

	if(positionalIndex >= schema->positionalCount())
	{
		throw ParseError(ErrorCategory::TooManyArguments,
		                 options.strings().tooManyArguments());
	}

	setValue(positionalIndex, value, boost::none);
}

void ParseSession::setValue(std::size_t index, std::string const &raw,
                            boost::optional<std::string> const &usedName)
{
	Argument const &argument = schema->argument(index);
	ArgumentState &state = states[index];
	StringProvider const &strings = options.strings();

	if(!!state.value && !argument.isMultiValue)
	{
		switch(options.effectiveDuplicateArguments())
		{
		case ErrorMode::Error:
			throw ParseError(ErrorCategory::DuplicateArgument,
			                 strings.duplicateArgument(argument.name),
			                 argument.name);

		case ErrorMode::Warning:
			if(options.error != nullptr)
			{
				*options.error
				        << "WARNING: "
				        << strings.duplicateArgumentWarning(
				                   argument.name)
				        << "\n";
			}
			break;

		case ErrorMode::Allow:
			break;
		}

		state.value = boost::none;
	}

	std::vector<std::string> parts;
	if(argument.isMultiValue && !!argument.multiValueSeparator)
	{
		parts = algorithm::string::split(raw, *argument.multiValueSeparator,
		                                 /*keepEmpty=*/true);
	}
	else
	{
		parts.push_back(raw);
	}

	auto converter = converterFor(argument);
	if(!state.value)
		state.value = Value();

	for(auto const &part : parts)
	{
		ValidationContext before(argument, ValidationMode::BeforeConversion,
		                         *this, strings, options.culture);
		before.rawValue = part;
		before.value = &(*state.value);
		runValidators(before);

		ScalarValue converted =
		        convertValue(argument, *converter, part, options.culture);

		if(argument.isDictionary && !argument.allowDuplicateDictionaryKeys)
		{
			if(auto pair = boost::get<KeyValuePair>(&converted))
			{
				for(auto const &item : state.value->items)
				{
					auto existing = boost::get<KeyValuePair>(&item);
					if((existing != nullptr) &&
					   (existing->key == pair->key))
					{
						throw ParseError(
						        ErrorCategory::InvalidDictionaryValue,
						        strings.invalidDictionaryValue(
						                argument.name, part,
						                format(pair->key,
						                       options.culture)),
						        argument.name);
					}
				}
			}
		}

		state.value->items.push_back(converted);

		ValidationContext after(argument, ValidationMode::AfterConversion,
		                        *this, strings, options.culture);
		after.convertedValue = converted;
		after.value = &(*state.value);
		runValidators(after);
	}

	state.rawValue = raw;
	state.usedName = usedName;

	if(argument.cancelMode != CancelMode::None)
	{
		// A switch explicitly set to false doesn't cancel.
		auto flag = boost::get<BooleanType>(&state.value->scalar());
		if(!argument.isSwitch || (flag == nullptr) || *flag)
			cancelingArgument = index;
	}
}

std::shared_ptr<ArgumentConverter const>
ParseSession::converterFor(Argument const &argument) const
{
	if(argument.customConverter)
		return argument.converter;
	auto registered = options.converters.find(argument.elementType);
	if(registered)
		return registered;
	return argument.converter;
}

ScalarValue ParseSession::convertValue(Argument const &argument,
                                       ArgumentConverter const &converter,
                                       std::string const &raw,
                                       std::locale const &culture) const
{
	try
	{
		return convert(converter, raw, culture);
	}
	catch(ConversionError const &e)
	{
		throw ParseError(ErrorCategory::ArgumentValueConversion,
		                 options.strings().argumentValueConversion(
		                         argument.name, raw,
		                         argument.displayValueDescription(),
		                         e.what()),
		                 argument.name);
	}
}

void ParseSession::runValidators(ValidationContext const &context) const
{
	for(auto const &validator : context.argument.validators)
	{
		if(validator->mode() == context.mode)
			validator->validate(context);
	}
}

void ParseSession::checkRequired() const
{
	std::vector<std::string> missing;
	for(std::size_t i = 0; i < schema->size(); ++i)
	{
		Argument const &argument = schema->argument(i);
		if(argument.isRequired && !states[i].value)
			missing.push_back(argument.name);
	}

	if(!missing.empty())
	{
		ParseError error(
		        ErrorCategory::MissingRequiredArgument,
		        options.strings().missingRequiredArguments(missing),
		        missing.front());
		error.setMissingArguments(missing);
		throw error;
	}
}

void ParseSession::applyDefaults()
{
	for(std::size_t i = 0; i < schema->size(); ++i)
	{
		Argument const &argument = schema->argument(i);
		ArgumentState &state = states[i];
		if(!!state.value || !argument.defaultValue)
			continue;

		auto converter = converterFor(argument);
		if(!argument.defaultText || (converter == argument.converter))
		{
			state.value = argument.defaultValue;
		}
		else
		{
			// Textual defaults go through the same converter as
			// values from the command line.
			std::vector<std::string> parts;
			if(argument.isMultiValue && !!argument.multiValueSeparator)
			{
				parts = algorithm::string::split(
				        *argument.defaultText,
				        *argument.multiValueSeparator,
				        /*keepEmpty=*/true);
			}
			else
			{
				parts.push_back(*argument.defaultText);
			}

			Value value;
			for(auto const &part : parts)
			{
				value.items.push_back(
				        convertValue(argument, *converter, part,
				                     std::locale::classic()));
			}
			state.value = value;
		}
		state.value->isDefault = true;
	}
}

void ParseSession::validateAfterParsing() const
{
	StringProvider const &strings = options.strings();
	for(std::size_t i = 0; i < schema->size(); ++i)
	{
		ValidationContext context(schema->argument(i),
		                          ValidationMode::AfterParsing, *this,
		                          strings, options.culture);
		if(!!states[i].value)
			context.value = &(*states[i].value);
		runValidators(context);
	}

	for(auto const &validator : schema->validators())
		validator->validate(*this, strings);
}

ParseResult ParseSession::makeResult(
        ParseStatus status, std::vector<std::string> const &remaining,
        boost::optional<std::string> const &canceledBy,
        bool helpRequested) const
{
	std::vector<boost::optional<Value>> values;
	std::vector<boost::optional<std::string>> usedNames;
	for(auto const &state : states)
	{
		values.push_back(state.value);
		usedNames.push_back(state.usedName);
	}
	return ParseResult(schema, status, values, usedNames, remaining,
	                   canceledBy, helpRequested);
}
}
}
}
