#ifndef cmdl_params_Schema_HPP
#define cmdl_params_Schema_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cmdl/params/Argument.hpp"
#include "cmdl/params/ParseOptions.hpp"
#include "cmdl/params/Validator.hpp"

namespace cmdl
{
namespace params
{
/*!
 * A constructor-like entry point for an argument set. Its arguments become
 * the leading positional arguments, in the order given here.
 */
struct ConstructorDescription
{
	std::vector<Argument> arguments;
	bool designated;

	ConstructorDescription(std::vector<Argument> const &a = {},
	                       bool d = false);
};

/*!
 * The untyped description of an argument set, from which a Schema is built.
 * ArgumentSet<T> produces one of these; it can also be put together by hand.
 */
struct ArgumentSetDescription
{
	std::string name;
	std::string description;
	std::vector<ConstructorDescription> constructors;
	std::vector<Argument> arguments;
	std::vector<std::shared_ptr<ArgumentSetValidator const>> validators;

	explicit ArgumentSetDescription(std::string const &n = "",
	                                std::string const &d = "");
};

/*!
 * The subset of ParseOptions which influences how a Schema is built.
 */
struct SchemaOptions
{
	ParsingMode mode;
	bool caseSensitive;
	std::vector<std::string> argumentNamePrefixes;
	std::string longArgumentNamePrefix;
	std::vector<char> nameValueSeparators;
	bool autoHelpArgument;

	SchemaOptions();
	explicit SchemaOptions(ParseOptions const &options);
};

bool operator==(SchemaOptions const &a, SchemaOptions const &b);
bool operator<(SchemaOptions const &a, SchemaOptions const &b);

namespace detail
{
struct NameComparator
{
	bool caseSensitive;

	NameComparator(bool cs = false);
	bool operator()(std::string const &a, std::string const &b) const;
};

struct ShortNameComparator
{
	bool caseSensitive;

	ShortNameComparator(bool cs = false);
	bool operator()(char a, char b) const;
};
}

/*!
 * A Schema is the validated, ordered list of arguments for one argument set
 * under one set of schema options. Arguments are ordered as: constructor
 * arguments (in declaration order), then other positional arguments (by
 * position), then named arguments (required ones first, otherwise in
 * declaration order). Every positional argument's position is its index in
 * this list.
 *
 * Construction throws SchemaError if the description is inconsistent. Once
 * constructed, a Schema is immutable and can be shared between concurrent
 * parses.
 */
class Schema
{
public:
	static const std::string HELP_ARGUMENT_NAME;

	Schema(ArgumentSetDescription const &d,
	       SchemaOptions const &o = SchemaOptions());

	Schema(Schema const &) = default;
	Schema(Schema &&) = default;
	Schema &operator=(Schema const &) = default;
	Schema &operator=(Schema &&) = default;

	~Schema() = default;

	std::string const &name() const;
	std::string const &description() const;
	SchemaOptions const &options() const;

	std::vector<Argument> const &arguments() const;
	std::size_t size() const;
	Argument const &argument(std::size_t index) const;

	std::size_t positionalCount() const;

	/*!
	 * \return The index of the constructor whose arguments lead this
	 *         schema, if the description had any constructors.
	 */
	boost::optional<std::size_t> constructorIndex() const;
	std::size_t constructorArgumentCount() const;

	std::vector<std::shared_ptr<ArgumentSetValidator const>> const &
	validators() const;

	/*!
	 * Look up an argument by a name as it would be used on the command
	 * line. In LongShort mode, this only considers long names.
	 *
	 * \param name The name to search for, without any prefix.
	 * \return The argument's index, if found.
	 */
	boost::optional<std::size_t> find(std::string const &name) const;

	boost::optional<std::size_t> findShort(char name) const;

	/*!
	 * \param prefix A prefix of an argument name or alias.
	 * \return The indices of every argument with a matching name or alias.
	 */
	std::vector<std::size_t> findByPrefix(std::string const &prefix) const;

	/*!
	 * Look up an argument by its name or any alias, regardless of the
	 * parsing mode.
	 *
	 * \param name The argument's name or alias.
	 * \return The argument's index, if found.
	 */
	boost::optional<std::size_t> indexOf(std::string const &name) const;

	boost::optional<std::size_t> helpArgument() const;

private:
	std::string schemaName;
	std::string schemaDescription;
	SchemaOptions schemaOptions;
	std::vector<Argument> schemaArguments;
	std::size_t positionals;
	boost::optional<std::size_t> constructor;
	std::size_t constructorArguments;
	std::vector<std::shared_ptr<ArgumentSetValidator const>> setValidators;
	boost::optional<std::size_t> help;

	std::map<std::string, std::size_t, detail::NameComparator> allNames;
	std::map<std::string, std::size_t, detail::NameComparator> names;
	std::map<char, std::size_t, detail::ShortNameComparator> shortNames;

	void addNames(std::size_t index);
	void addHelpArgument();
	void checkArgument(Argument const &argument) const;
	void checkDependencies() const;
	void convertDefault(Argument &argument) const;
};

bool operator==(Schema const &a, Schema const &b);
bool operator!=(Schema const &a, Schema const &b);
}
}

#endif
