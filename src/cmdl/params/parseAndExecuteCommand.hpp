#ifndef cmdl_params_parseAndExecuteCommand_HPP
#define cmdl_params_parseAndExecuteCommand_HPP

#include "cmdl/params/CommandSet.hpp"

namespace cmdl
{
namespace params
{
/*!
 * Resolve the command named by argv[1], parse the rest of the command line
 * against its schema, and execute it. Errors and usage help are printed to
 * the streams configured in the command set's parse options.
 *
 * \param argc The number of command-line arguments.
 * \param argv The list of command-line arguments.
 * \param commands The commands this binary supports.
 * \return The exit code; can be returned from main().
 */
int parseAndExecuteCommand(int argc, char const *const *argv,
                           CommandSet const &commands);
}
}

#endif
