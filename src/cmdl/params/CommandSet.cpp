#include "CommandSet.hpp"

#include <algorithm>
#include <list>
#include <stdexcept>

#include "cmdl/algorithm/String.hpp"
#include "cmdl/params/ParseError.hpp"
#include "cmdl/params/ProgramParameters.hpp"
#include "cmdl/params/detail/parseAndExecuteImpl.hpp"
#include "cmdl/params/parse.hpp"

namespace cmdl
{
namespace params
{
CommandOptions::CommandOptions()
        : caseSensitive(false),
          filter(),
          parent(boost::none),
          parseOptions()
{
}

CommandSet::CommandSet(std::initializer_list<Command> const &c,
                       CommandOptions const &o)
        : CommandSet(std::vector<Command>(c), o)
{
}

CommandSet::CommandSet(std::vector<Command> const &c, CommandOptions const &o)
        : allCommands(), commandOptions(o)
{
	for(auto const &command : c)
		add(command);
}

void CommandSet::add(Command const &command)
{
	for(auto const &existing : allCommands)
	{
		if((algorithm::string::compare(existing.name, command.name,
		                               commandOptions.caseSensitive) ==
		    0) &&
		   (existing.parent == command.parent))
		{
			throw std::invalid_argument("Duplicate command name '" +
			                            command.name + "'.");
		}
	}

	allCommands.push_back(command);
}

CommandOptions const &CommandSet::options() const
{
	return commandOptions;
}

std::vector<Command const *> CommandSet::commands() const
{
	std::vector<Command const *> ret;
	for(auto const &command : allCommands)
	{
		if(isExposed(command))
			ret.push_back(&command);
	}

	std::sort(ret.begin(), ret.end(),
	          [](Command const *a, Command const *b) -> bool
	          {
		          return *a < *b;
		  });
	return ret;
}

Command const *CommandSet::find(std::string const &name) const
{
	for(auto const &command : allCommands)
	{
		if(!isExposed(command))
			continue;
		if(algorithm::string::compare(command.name, name,
		                              commandOptions.caseSensitive) == 0)
		{
			return &command;
		}
	}
	return nullptr;
}

Command const &CommandSet::resolve(std::vector<std::string> const &args,
                                   std::size_t index) const
{
	StringProvider const &strings = commandOptions.parseOptions.strings();
	if(index >= args.size())
	{
		throw ParseError(ErrorCategory::UnknownCommand,
		                 strings.noCommandSpecified());
	}

	Command const *command = find(args[index]);
	if(command == nullptr)
	{
		throw ParseError(ErrorCategory::UnknownCommand,
		                 strings.unknownCommand(args[index]),
		                 args[index]);
	}
	return *command;
}

std::pair<Command const *, ParseResult>
CommandSet::createCommand(std::vector<std::string> const &args,
                          std::size_t index) const
{
	Command const &command = resolve(args, index);
	ParseResult result =
	        parse(command.schema(commandOptions.parseOptions), args,
	              index + 1, commandOptions.parseOptions);
	return std::make_pair(&command, result);
}

int CommandSet::run(std::vector<std::string> const &args, std::size_t index,
                    std::string const &program) const
{
	if(index > args.size())
		throw std::out_of_range("Argument index out of range.");

	ProgramParameters parameters(
	        std::list<std::string>(args.begin() + index, args.end()));
	return detail::parseAndExecuteImpl(program, parameters, *this,
	                                   /*printProgramHelp=*/true,
	                                   /*printCommandName=*/true);
}

bool CommandSet::isExposed(Command const &command) const
{
	if(command.parent != commandOptions.parent)
		return false;
	if(commandOptions.filter && !commandOptions.filter(command))
		return false;
	return true;
}
}
}
