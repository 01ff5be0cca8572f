#ifndef cmdl_params_ParseResult_HPP
#define cmdl_params_ParseResult_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>
#include <boost/variant/get.hpp>

#include "cmdl/params/Schema.hpp"
#include "cmdl/params/Validator.hpp"
#include "cmdl/params/Value.hpp"

namespace cmdl
{
namespace params
{
enum class ParseStatus
{
	Success,
	// Parsing was stopped by an argument with CancelMode::AbortFailure.
	Canceled
};

/*!
 * The outcome of a parse which did not fail. Values are looked up by argument
 * name or alias; looking up a name the schema doesn't know throws
 * std::out_of_range.
 */
class ParseResult : public ArgumentStateView
{
public:
	ParseResult(std::shared_ptr<Schema const> const &s, ParseStatus st,
	            std::vector<boost::optional<Value>> const &v,
	            std::vector<boost::optional<std::string>> const &un,
	            std::vector<std::string> const &ra = {},
	            boost::optional<std::string> const &cb = boost::none,
	            bool hr = false);

	ParseResult(ParseResult const &) = default;
	ParseResult(ParseResult &&) = default;
	ParseResult &operator=(ParseResult const &) = default;
	ParseResult &operator=(ParseResult &&) = default;

	virtual ~ParseResult() = default;

	ParseStatus status() const;
	bool helpRequested() const;
	std::shared_ptr<Schema const> const &schema() const;

	/*!
	 * \return The tokens which weren't consumed because parsing was
	 *         canceled with success; empty otherwise.
	 */
	std::vector<std::string> const &remainingArguments() const;

	/*!
	 * \return The name of the argument which canceled parsing, if any.
	 */
	boost::optional<std::string> const &canceledBy() const;

	virtual Value const *value(std::string const &name) const;
	virtual bool isSupplied(std::string const &name) const;

	bool hasValue(std::string const &name) const;

	/*!
	 * \return The value of the argument at the given schema index, if any.
	 */
	boost::optional<Value> const &valueAt(std::size_t index) const;

	/*!
	 * \param name The argument's name or alias.
	 * \return The name the argument was last supplied with on the command
	 *         line, if it was supplied by name.
	 */
	boost::optional<std::string> const &
	usedName(std::string const &name) const;

	/*!
	 * Get the single (or, for multi-value arguments, last) value of the
	 * given argument. Throws std::out_of_range if it has no value, or
	 * boost::bad_get if T is not the value's type.
	 *
	 * \param name The argument's name or alias.
	 * \return The value.
	 */
	template <typename T> T get(std::string const &name) const
	{
		return boost::get<T>(requireValue(name).scalar());
	}

	template <typename T> std::vector<T> getAll(std::string const &name) const
	{
		std::vector<T> ret;
		Value const *v = value(name);
		if(v == nullptr)
			return ret;
		for(auto const &item : v->items)
			ret.push_back(boost::get<T>(item));
		return ret;
	}

private:
	std::shared_ptr<Schema const> parseSchema;
	ParseStatus parseStatus;
	std::vector<boost::optional<Value>> values;
	std::vector<boost::optional<std::string>> usedNames;
	std::vector<std::string> remaining;
	boost::optional<std::string> canceledByName;
	bool isHelpRequested;

	std::size_t indexOf(std::string const &name) const;
	Value const &requireValue(std::string const &name) const;
};
}
}

#endif
