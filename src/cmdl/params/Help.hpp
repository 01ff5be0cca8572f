#ifndef cmdl_params_Help_HPP
#define cmdl_params_Help_HPP

#include <ostream>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/Command.hpp"
#include "cmdl/params/Schema.hpp"
#include "cmdl/params/StringProvider.hpp"

namespace cmdl
{
namespace params
{
/*!
 * Write a list of the given commands, with their help messages.
 *
 * \param out The stream to write to.
 * \param program The name of the binary being executed.
 * \param commands The commands this binary supports.
 */
void writeCommandList(std::ostream &out, std::string const &program,
                      std::vector<Command const *> const &commands);

/*!
 * Write usage help for the given schema. If a command name is given, it is
 * included in the usage line after the program name. Hidden arguments are
 * omitted.
 *
 * \param out The stream to write to.
 * \param program The name of the binary being executed.
 * \param schema The schema to describe.
 * \param command The name of the command being described, if any.
 * \param strings The provider for validator usage messages.
 */
void writeUsage(std::ostream &out, std::string const &program,
                Schema const &schema,
                boost::optional<std::string> const &command = boost::none,
                StringProvider const &strings = StringProvider());

/*!
 * \param schema The schema the argument belongs to.
 * \param argument The argument to describe.
 * \return Every name the argument can be supplied with, including its
 *         prefix, separated by ", ".
 */
std::string formatNames(Schema const &schema, Argument const &argument);
}
}

#endif
