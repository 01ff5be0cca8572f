#include "parse.hpp"

#include <stdexcept>

#include "cmdl/params/detail/ParseSession.hpp"

namespace cmdl
{
namespace params
{
ParseResult parse(std::shared_ptr<Schema const> const &schema,
                  std::vector<std::string> const &args, std::size_t index,
                  ParseOptions const &options)
{
	if(!schema)
		throw std::invalid_argument("Can't parse without a schema.");
	if(!(schema->options() == SchemaOptions(options)))
	{
		throw std::invalid_argument(
		        "The schema was built with different options.");
	}

	detail::ParseSession session(schema, options);
	return session.run(args, index);
}

ParseResult parse(ArgumentSetDescription const &description,
                  std::vector<std::string> const &args, std::size_t index,
                  ParseOptions const &options)
{
	return parse(std::make_shared<Schema>(description, SchemaOptions(options)),
	             args, index, options);
}
}
}
