#ifndef cmdl_params_parse_HPP
#define cmdl_params_parse_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/ParseResult.hpp"
#include "cmdl/params/Schema.hpp"

namespace cmdl
{
namespace params
{
/*!
 * Parse the given command-line arguments against an already-built schema.
 * The schema must have been built with options matching the given parse
 * options (see SchemaOptions), otherwise std::invalid_argument is thrown.
 *
 * \param schema The schema to parse against.
 * \param args The raw command-line arguments.
 * \param index The index of the first argument to parse.
 * \param options The options controlling the parse.
 * \return The result of a successful (or canceled) parse. Throws ParseError
 *         if the arguments are invalid.
 */
ParseResult parse(std::shared_ptr<Schema const> const &schema,
                  std::vector<std::string> const &args, std::size_t index = 0,
                  ParseOptions const &options = ParseOptions());

/*!
 * Build a schema from the given description, and parse the given arguments
 * against it. Throws SchemaError if the description is invalid.
 *
 * \param description The argument set description.
 * \param args The raw command-line arguments.
 * \param index The index of the first argument to parse.
 * \param options The options controlling the parse.
 * \return The result of a successful (or canceled) parse.
 */
ParseResult parse(ArgumentSetDescription const &description,
                  std::vector<std::string> const &args, std::size_t index = 0,
                  ParseOptions const &options = ParseOptions());
}
}

#endif
