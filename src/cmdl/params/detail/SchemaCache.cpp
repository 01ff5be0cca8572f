#include "SchemaCache.hpp"

namespace cmdl
{
namespace params
{
namespace detail
{
std::shared_ptr<Schema const>
SchemaCache::get(ArgumentSetDescription const &description,
                 SchemaOptions const &options)
{
	std::lock_guard<std::mutex> lock(mutex);
	auto it = schemas.find(options);
	if(it != schemas.end())
		return it->second;

	std::shared_ptr<Schema const> schema =
	        std::make_shared<Schema>(description, options);
	schemas.insert(std::make_pair(options, schema));
	return schema;
}

void SchemaCache::clear()
{
	std::lock_guard<std::mutex> lock(mutex);
	schemas.clear();
}
}
}
}
