#ifndef cmdl_params_Command_HPP
#define cmdl_params_Command_HPP

#include <functional>
#include <memory>
#include <string>

#include <boost/optional/optional.hpp>

#include "cmdl/params/ArgumentSet.hpp"
#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/ParseResult.hpp"
#include "cmdl/params/Schema.hpp"

namespace cmdl
{
namespace params
{
typedef std::function<std::shared_ptr<Schema const>(ParseOptions const &)>
        SchemaFunction;

typedef std::function<int(ParseResult const &)> CommandFunction;

/*!
 * A command is a "subcommand" for the overall executable. Examples of
 * applications which use "subcommands" include Git, Docker, and etc. If your
 * executable has only a single logical function, then a single command can
 * be constructed with an arbitrary name.
 *
 * Each command has its own argument schema. Commands can declare a parent
 * command name; CommandSet only exposes the commands whose parent matches
 * its options, which allows applications to build nested commands.
 */
struct Command
{
	std::string name;
	std::string help;
	SchemaFunction schema;
	CommandFunction function;
	boost::optional<std::string> parent;

	/*!
	 * \param n The name of the command, used to call it.
	 * \param h The help message for this command.
	 * \param s Returns this command's argument schema.
	 * \param fn The function to call when this command is executed. Its
	 *           return value is the process exit code.
	 * \param p The name of this command's parent command, if any.
	 */
	Command(std::string const &n, std::string const &h,
	        SchemaFunction const &s, CommandFunction const &fn,
	        boost::optional<std::string> const &p = boost::none);
};

bool operator<(Command const &a, Command const &b);

/*!
 * Construct a command whose arguments are described by an ArgumentSet<T>.
 * The function is called with the populated T.
 *
 * \param name The name of the command, used to call it.
 * \param help The help message for this command.
 * \param arguments The command's argument set.
 * \param fn The function to call when this command is executed.
 * \param parent The name of this command's parent command, if any.
 * \return The newly-constructed command.
 */
template <typename T>
Command makeCommand(std::string const &name, std::string const &help,
                    ArgumentSet<T> const &arguments,
                    std::function<int(T const &)> const &fn,
                    boost::optional<std::string> const &parent = boost::none)
{
	auto set = std::make_shared<ArgumentSet<T>>(arguments);
	return Command(name, help,
	               [set](ParseOptions const &options)
	               {
		               return set->schema(options);
		       },
	               [set, fn](ParseResult const &result) -> int
	               {
		               if(!fn)
			               return 0;
		               return fn(set->create(result));
		       },
	               parent);
}
}
}

#endif
