#ifndef cmdl_util_ScopeExit_HPP
#define cmdl_util_ScopeExit_HPP

#include <functional>

namespace cmdl
{
namespace util
{
/*!
 * Runs the given function when this object goes out of scope, unless it has
 * been dismissed first.
 */
class ScopeExit
{
public:
	ScopeExit(std::function<void()> f);

	ScopeExit(ScopeExit const &) = delete;
	ScopeExit &operator=(ScopeExit const &) = delete;

	~ScopeExit();

	void dismiss();

private:
	std::function<void()> function;
	bool dismissed;
};
}
}

#endif
