#include "ConverterRegistry.hpp"

#include <stdexcept>

namespace cmdl
{
namespace params
{
void ConverterRegistry::set(
        std::type_index const &type,
        std::shared_ptr<ArgumentConverter const> const &converter)
{
	if(!converter)
		throw std::invalid_argument("Can't register a null converter.");
	converters[type] = converter;
}

bool ConverterRegistry::erase(std::type_index const &type)
{
	return converters.erase(type) > 0;
}

std::shared_ptr<ArgumentConverter const>
ConverterRegistry::find(std::type_index const &type) const
{
	auto it = converters.find(type);
	if(it == converters.end())
		return nullptr;
	return it->second;
}

bool ConverterRegistry::empty() const
{
	return converters.empty();
}
}
}
