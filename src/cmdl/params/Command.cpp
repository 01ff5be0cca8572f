#include "Command.hpp"

#include <stdexcept>

namespace cmdl
{
namespace params
{
Command::Command(std::string const &n, std::string const &h,
                 SchemaFunction const &s, CommandFunction const &fn,
                 boost::optional<std::string> const &p)
        : name(n), help(h), schema(s), function(fn), parent(p)
{
	if(name.empty())
		throw std::invalid_argument("Commands must have a name.");
	if(!schema)
	{
		throw std::invalid_argument("The command '" + name +
		                            "' has no schema.");
	}
}

bool operator<(Command const &a, Command const &b)
{
	return a.name < b.name;
}
}
}
