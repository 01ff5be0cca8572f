#include "parseAndExecuteCommand.hpp"

#include <string>

#include "cmdl/params/ProgramParameters.hpp"
#include "cmdl/params/detail/parseAndExecuteImpl.hpp"

namespace cmdl
{
namespace params
{
int parseAndExecuteCommand(int argc, char const *const *argv,
                           CommandSet const &commands)
{
	return detail::parseAndExecuteImpl(
	        argc > 0 ? std::string(argv[0]) : std::string(),
	        ProgramParameters(argc, argv), commands,
	        /*printProgramHelp=*/true,
	        /*printCommandName=*/true);
}
}
}
