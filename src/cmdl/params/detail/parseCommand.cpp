#include "parseCommand.hpp"

#include "cmdl/params/CommandSet.hpp"
#include "cmdl/params/ProgramParameters.hpp"

namespace cmdl
{
namespace params
{
namespace detail
{
Command const *parseCommand(ProgramParameters &parameters,
                            CommandSet const &commands)
{
	if(parameters.parameters.empty())
		return nullptr;
	Command const *ret = commands.find(parameters.parameters.front());
	if(ret != nullptr)
		parameters.parameters.pop_front();
	return ret;
}
}
}
}
