#include "parseAndExecute.hpp"

#include <string>

#include "cmdl/params/CommandSet.hpp"
#include "cmdl/params/ProgramParameters.hpp"
#include "cmdl/params/detail/parseAndExecuteImpl.hpp"

namespace cmdl
{
namespace params
{
int parseAndExecute(int argc, char const *const *argv, Command const &command,
                    ParseOptions const &options)
{
	CommandOptions commandOptions;
	commandOptions.caseSensitive = true;
	commandOptions.parent = command.parent;
	commandOptions.parseOptions = options;

	ProgramParameters parameters(argc, argv);
	parameters.parameters.push_front(command.name);

	return detail::parseAndExecuteImpl(
	        argc > 0 ? std::string(argv[0]) : command.name, parameters,
	        CommandSet({command}, commandOptions),
	        /*printProgramHelp=*/false,
	        /*printCommandName=*/false);
}
}
}
