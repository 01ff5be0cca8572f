#ifndef cmdl_algorithm_String_HPP
#define cmdl_algorithm_String_HPP

#include <sstream>
#include <string>
#include <vector>

namespace cmdl
{
namespace algorithm
{
namespace string
{
/*!
 * Compare two strings, optionally ignoring ASCII case.
 *
 * \param a The first string.
 * \param b The second string.
 * \param caseSensitive Whether or not case differences are significant.
 * \return <0, 0 or >0, in the same manner as std::string::compare.
 */
int compare(std::string const &a, std::string const &b, bool caseSensitive);

bool startsWith(std::string const &s, std::string const &prefix,
                bool caseSensitive = true);

/*!
 * Split the given string on every occurrence of the given delimiter. If
 * keepEmpty is false, empty components are discarded (so leading, trailing
 * and repeated delimiters are ignored). Otherwise, every component is kept,
 * and a string containing N delimiters always yields N + 1 components.
 *
 * \param s The string to split.
 * \param d The delimiter.
 * \param keepEmpty Whether or not empty components should be returned.
 * \return The components of the input string.
 */
std::vector<std::string> split(std::string const &s, std::string const &d,
                               bool keepEmpty = false);

template <typename Iterator>
std::string join(Iterator begin, Iterator end, std::string const &delimiter)
{
	std::ostringstream oss;
	for(auto it = begin; it != end; ++it)
	{
		oss << *it;

		auto next = it;
		++next;
		if(next != end)
			oss << delimiter;
	}
	return oss.str();
}

bool isWhiteSpace(std::string const &s);
}
}
}

#endif
