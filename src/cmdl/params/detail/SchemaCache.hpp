#ifndef cmdl_params_detail_SchemaCache_HPP
#define cmdl_params_detail_SchemaCache_HPP

#include <map>
#include <memory>
#include <mutex>

#include "cmdl/params/Schema.hpp"

namespace cmdl
{
namespace params
{
namespace detail
{
/*!
 * Caches the Schema built from one argument set description, per set of
 * schema options. This is safe to use from multiple threads; the cached
 * schemas themselves are immutable.
 */
class SchemaCache
{
public:
	SchemaCache() = default;

	SchemaCache(SchemaCache const &) = delete;
	SchemaCache &operator=(SchemaCache const &) = delete;

	~SchemaCache() = default;

	/*!
	 * Return the cached schema for the given options, building it from
	 * the given description first if necessary. If building fails, the
	 * SchemaError propagates and nothing is cached.
	 *
	 * \param description The description to build the schema from.
	 * \param options The options to build the schema with.
	 * \return The (possibly cached) schema.
	 */
	std::shared_ptr<Schema const> get(ArgumentSetDescription const &description,
	                                  SchemaOptions const &options);

	void clear();

private:
	std::mutex mutex;
	std::map<SchemaOptions, std::shared_ptr<Schema const>> schemas;
};
}
}
}

#endif
