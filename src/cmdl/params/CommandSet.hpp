#ifndef cmdl_params_CommandSet_HPP
#define cmdl_params_CommandSet_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/Command.hpp"
#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/ParseResult.hpp"

namespace cmdl
{
namespace params
{
struct CommandOptions
{
	bool caseSensitive;

	// If set, only commands for which this returns true are exposed.
	std::function<bool(Command const &)> filter;

	/*!
	 * Only commands whose declared parent equals this are exposed. If
	 * this is empty, only commands without a parent are exposed.
	 */
	boost::optional<std::string> parent;

	ParseOptions parseOptions;

	CommandOptions();
};

/*!
 * A CommandSet resolves a command name from the command line to one of a
 * flat list of commands, and parses the rest of the command line with that
 * command's schema.
 */
class CommandSet
{
public:
	CommandSet(std::initializer_list<Command> const &c = {},
	           CommandOptions const &o = CommandOptions());
	CommandSet(std::vector<Command> const &c,
	           CommandOptions const &o = CommandOptions());

	CommandSet(CommandSet const &) = default;
	CommandSet(CommandSet &&) = default;
	CommandSet &operator=(CommandSet const &) = default;
	CommandSet &operator=(CommandSet &&) = default;

	~CommandSet() = default;

	/*!
	 * Add a command to this set. Throws std::invalid_argument if a command
	 * with the same name (and parent) already exists.
	 *
	 * \param command The command to add.
	 */
	void add(Command const &command);

	CommandOptions const &options() const;

	/*!
	 * \return Every command exposed by this set (taking the filter and
	 *         parent options into account), sorted by name.
	 */
	std::vector<Command const *> commands() const;

	/*!
	 * \param name The name of the command to find.
	 * \return The exposed command with the given name, or nullptr.
	 */
	Command const *find(std::string const &name) const;

	/*!
	 * Resolve the command named by args[index]. Throws a ParseError with
	 * the UnknownCommand category if there is no such command (or no
	 * argument at that index).
	 *
	 * \param args The raw command-line arguments.
	 * \param index The index of the command name.
	 * \return The command.
	 */
	Command const &resolve(std::vector<std::string> const &args,
	                       std::size_t index = 0) const;

	/*!
	 * Resolve the command named by args[index], and parse the remaining
	 * arguments with that command's schema. Throws ParseError if either
	 * step fails.
	 *
	 * \param args The raw command-line arguments.
	 * \param index The index of the command name.
	 * \return The command, and the result of parsing its arguments.
	 */
	std::pair<Command const *, ParseResult>
	createCommand(std::vector<std::string> const &args,
	              std::size_t index = 0) const;

	/*!
	 * Resolve, parse and execute a command. Errors are printed (along with
	 * usage help) to the streams configured in the parse options, instead
	 * of being thrown.
	 *
	 * \param args The raw command-line arguments.
	 * \param index The index of the command name.
	 * \param program The program name, used in usage help.
	 * \return The exit code; can be returned from main().
	 */
	int run(std::vector<std::string> const &args, std::size_t index = 0,
	        std::string const &program = "") const;

private:
	std::vector<Command> allCommands;
	CommandOptions commandOptions;

	bool isExposed(Command const &command) const;
};
}
}

#endif
