#include "ScopeExit.hpp"

namespace cmdl
{
namespace util
{
ScopeExit::ScopeExit(std::function<void()> f) : function(f), dismissed(false)
{
}

ScopeExit::~ScopeExit()
{
	if(!dismissed && function)
		function();
}

void ScopeExit::dismiss()
{
	dismissed = true;
}
}
}
