#include "parseAndExecuteImpl.hpp"

#include <cstdlib>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

#include <boost/optional/optional.hpp>

#include "cmdl/params/CommandSet.hpp"
#include "cmdl/params/Help.hpp"
#include "cmdl/params/ParseError.hpp"
#include "cmdl/params/ProgramParameters.hpp"
#include "cmdl/params/detail/parseCommand.hpp"
#include "cmdl/params/parse.hpp"

namespace cmdl
{
namespace params
{
namespace detail
{
namespace
{
// Either stream may be null, which silences that kind of output.
void printError(ParseOptions const &options, std::string const &message)
{
	if(options.error != nullptr)
		*options.error << "ERROR: " << message << "\n";
}

void printUsage(ParseOptions const &options, std::string const &program,
                Schema const &schema,
                boost::optional<std::string> const &command)
{
	if(options.out != nullptr)
	{
		writeUsage(*options.out, program, schema, command,
		           options.strings());
	}
}
}

int parseAndExecuteImpl(std::string const &program,
                        ProgramParameters parameters,
                        CommandSet const &commands, bool printProgramHelp,
                        bool printCommandName)
{
	ParseOptions const &options = commands.options().parseOptions;
	StringProvider const &strings = options.strings();

	// First, figure out which command we'll be parsing parameters for.
	boost::optional<std::string> attempted;
	if(!parameters.parameters.empty())
		attempted = parameters.parameters.front();
	Command const *command = detail::parseCommand(parameters, commands);
	if(command == nullptr)
	{
		if(printProgramHelp)
		{
			printError(options, !!attempted
			                            ? strings.unknownCommand(
			                                      *attempted)
			                            : strings.noCommandSpecified());
			if(options.out != nullptr)
			{
				writeCommandList(*options.out, program,
				                 commands.commands());
			}
		}
		return EXIT_FAILURE;
	}

	boost::optional<std::string> commandName;
	if(printCommandName)
		commandName = command->name;

	// Parse this command's arguments.
	std::shared_ptr<Schema const> schema = command->schema(options);
	boost::optional<ParseResult> result;
	try
	{
		result = parse(schema, parameters.toVector(), 0, options);
	}
	catch(ParseError const &e)
	{
		printError(options, e.what());
		printUsage(options, program, *schema, commandName);
		return EXIT_FAILURE;
	}

	if(result->status() == ParseStatus::Canceled)
	{
		printUsage(options, program, *schema, commandName);
		return EXIT_FAILURE;
	}

	// Execute the user-provided function.
	if(!command->function)
		return EXIT_SUCCESS;
	try
	{
		return command->function(*result);
	}
	catch(std::exception const &e)
	{
		printError(options, e.what());
	}

	return EXIT_FAILURE;
}
}
}
}
