#include "ParseResult.hpp"

#include <stdexcept>

namespace cmdl
{
namespace params
{
ParseResult::ParseResult(std::shared_ptr<Schema const> const &s,
                         ParseStatus st,
                         std::vector<boost::optional<Value>> const &v,
                         std::vector<boost::optional<std::string>> const &un,
                         std::vector<std::string> const &ra,
                         boost::optional<std::string> const &cb, bool hr)
        : parseSchema(s),
          parseStatus(st),
          values(v),
          usedNames(un),
          remaining(ra),
          canceledByName(cb),
          isHelpRequested(hr)
{
	if(!parseSchema)
		throw std::invalid_argument("Parse results require a schema.");
	if((values.size() != parseSchema->size()) ||
	   (usedNames.size() != parseSchema->size()))
	{
		throw std::invalid_argument(
		        "Parse result doesn't match its schema.");
	}
}

ParseStatus ParseResult::status() const
{
	return parseStatus;
}

bool ParseResult::helpRequested() const
{
	return isHelpRequested;
}

std::shared_ptr<Schema const> const &ParseResult::schema() const
{
	return parseSchema;
}

std::vector<std::string> const &ParseResult::remainingArguments() const
{
	return remaining;
}

boost::optional<std::string> const &ParseResult::canceledBy() const
{
	return canceledByName;
}

Value const *ParseResult::value(std::string const &name) const
{
	auto const &v = values[indexOf(name)];
	if(!v)
		return nullptr;
	return &(*v);
}

bool ParseResult::isSupplied(std::string const &name) const
{
	Value const *v = value(name);
	return (v != nullptr) && !v->isDefault;
}

bool ParseResult::hasValue(std::string const &name) const
{
	return value(name) != nullptr;
}

boost::optional<Value> const &ParseResult::valueAt(std::size_t index) const
{
	return values.at(index);
}

boost::optional<std::string> const &
ParseResult::usedName(std::string const &name) const
{
	return usedNames[indexOf(name)];
}

std::size_t ParseResult::indexOf(std::string const &name) const
{
	auto index = parseSchema->indexOf(name);
	if(!index)
		throw std::out_of_range("Unknown argument '" + name + "'.");
	return *index;
}

Value const &ParseResult::requireValue(std::string const &name) const
{
	Value const *v = value(name);
	if(v == nullptr)
	{
		throw std::out_of_range("The argument '" + name +
		                        "' has no value.");
	}
	return *v;
}
}
}
