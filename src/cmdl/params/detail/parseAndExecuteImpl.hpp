#ifndef cmdl_params_detail_parseAndExecuteImpl_HPP
#define cmdl_params_detail_parseAndExecuteImpl_HPP

#include <string>

namespace cmdl
{
namespace params
{
class CommandSet;
struct ProgramParameters;

namespace detail
{
int parseAndExecuteImpl(std::string const &program,
                        ProgramParameters parameters,
                        CommandSet const &commands, bool printProgramHelp,
                        bool printCommandName);
}
}
}

#endif
