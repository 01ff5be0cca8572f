#include "ProgramParameters.hpp"

namespace cmdl
{
namespace params
{
ProgramParameters::ProgramParameters(std::list<std::string> const &p)
        : parameters(p)
{
}

ProgramParameters::ProgramParameters(
        std::initializer_list<std::string> const &p)
        : parameters(p)
{
}

ProgramParameters::ProgramParameters(int argc, char const *const *argv)
        : parameters()
{
	for(int i = 1; i < argc; ++i)
		parameters.emplace_back(argv[i]);
}

std::vector<std::string> ProgramParameters::toVector() const
{
	return std::vector<std::string>(parameters.begin(), parameters.end());
}
}
}
