#ifndef cmdl_params_ProgramParameters_HPP
#define cmdl_params_ProgramParameters_HPP

#include <initializer_list>
#include <list>
#include <string>
#include <vector>

namespace cmdl
{
namespace params
{
/*!
 * The command-line parameters not yet consumed by the command runner. The
 * program name (argv[0]) is never included.
 */
struct ProgramParameters
{
	std::list<std::string> parameters;

	explicit ProgramParameters(std::list<std::string> const &p);
	explicit ProgramParameters(std::initializer_list<std::string> const &p);
	ProgramParameters(int argc, char const *const *argv);

	std::vector<std::string> toVector() const;
};
}
}

#endif
