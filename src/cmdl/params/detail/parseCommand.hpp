#ifndef cmdl_params_detail_parseCommand_HPP
#define cmdl_params_detail_parseCommand_HPP

#include "cmdl/params/Command.hpp"

namespace cmdl
{
namespace params
{
class CommandSet;
struct ProgramParameters;

namespace detail
{
/*!
 * Look up the command named by the first remaining parameter. If it is
 * found, that parameter is consumed.
 *
 * \param parameters The remaining command-line parameters.
 * \param commands The commands to search.
 * \return The command, or nullptr if there is no such command.
 */
Command const *parseCommand(ProgramParameters &parameters,
                            CommandSet const &commands);
}
}
}

#endif
