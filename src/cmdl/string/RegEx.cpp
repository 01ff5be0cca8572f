#include "RegEx.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <iterator>
#include <stdexcept>

#include <boost/optional/optional.hpp>

#include <re2/re2.h>
#include <re2/stringpiece.h>

namespace cmdl
{
namespace string
{
namespace detail
{
struct RegExImpl
{
	RegExOptions options;
	boost::optional<re2::RE2> regex;

	RegExImpl(std::string const &p, RegExOptions const &o);

	RegExImpl(RegExImpl const &o);
	RegExImpl &operator=(RegExImpl const &o);

	void compile(std::string const &p);
};

RegExImpl::RegExImpl(std::string const &p, RegExOptions const &o)
        : options(o), regex()
{
	compile(p);
}

RegExImpl::RegExImpl(RegExImpl const &o) : options(o.options), regex()
{
	compile(o.regex->pattern());
}

RegExImpl &RegExImpl::operator=(RegExImpl const &o)
{
	if(this == &o)
		return *this;
	options = o.options;
	compile(o.regex->pattern());
	return *this;
}

void RegExImpl::compile(std::string const &p)
{
	re2::RE2::Options re2Options;
	re2Options.set_case_sensitive(options.caseSensitive);
	re2Options.set_log_errors(false);
	regex.emplace(p, re2Options);
	if(!regex->ok())
		throw std::runtime_error(regex->error());
}
}

RegExOptions::RegExOptions() : caseSensitive(true)
{
}

RegEx::RegEx(std::string const &pattern, RegExOptions const &options)
        : impl(new detail::RegExImpl(pattern, options))
{
}

RegEx::RegEx(RegEx const &o)
{
	*this = o;
}

RegEx::RegEx(RegEx &&o) = default;

RegEx &RegEx::operator=(RegEx const &o)
{
	if(this == &o)
		return *this;
	impl.reset();
	if(!!o.impl)
		impl.reset(new detail::RegExImpl(*o.impl));
	return *this;
}

RegEx &RegEx::operator=(RegEx &&o) = default;

RegEx::~RegEx()
{
}

std::string const &RegEx::pattern() const
{
	assert(!!impl);
	return impl->regex->pattern();
}

RegExResult RegEx::match(std::string const &text) const
{
	assert(!!impl);
	assert(!!impl->regex);

	std::vector<re2::StringPiece> matches(static_cast<std::size_t>(
	        impl->regex->NumberOfCapturingGroups() + 1));
	bool matched = impl->regex->Match(
	        re2::StringPiece(text.data(), text.size()), 0, text.size(),
	        re2::RE2::UNANCHORED, matches.data(),
	        static_cast<int>(matches.size()));

	RegExResult result = {matched, {}};
	if(!matched)
		return result;
	result.matches.reserve(matches.size());
	std::transform(matches.begin(), matches.end(),
	               std::back_inserter(result.matches),
	               [](re2::StringPiece const &piece)
	               {
		return std::string(piece.data(), piece.size());
	});
	return result;
}
}
}
