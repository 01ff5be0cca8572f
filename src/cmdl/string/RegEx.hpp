#ifndef cmdl_string_RegEx_HPP
#define cmdl_string_RegEx_HPP

#include <memory>
#include <string>
#include <vector>

namespace cmdl
{
namespace string
{
namespace detail
{
struct RegExImpl;
}

struct RegExOptions
{
	bool caseSensitive;

	RegExOptions();
};

struct RegExResult
{
	bool matched;
	std::vector<std::string> matches;
};

/*!
 * A thin, copyable wrapper around an RE2 regular expression. Construction
 * throws std::runtime_error if the pattern is invalid.
 */
class RegEx
{
public:
	RegEx(std::string const &pattern, RegExOptions const &options = {});

	RegEx(RegEx const &o);
	RegEx(RegEx &&o);
	RegEx &operator=(RegEx const &o);
	RegEx &operator=(RegEx &&o);

	~RegEx();

	std::string const &pattern() const;

	/*!
	 * Search for the pattern anywhere in the given text.
	 *
	 * \param text The text to search.
	 * \return Whether the pattern matched, plus the full match and the
	 *         contents of every capturing group.
	 */
	RegExResult match(std::string const &text) const;

private:
	std::unique_ptr<detail::RegExImpl> impl;
};
}
}

#endif
