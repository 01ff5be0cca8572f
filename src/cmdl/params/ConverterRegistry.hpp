#ifndef cmdl_params_ConverterRegistry_HPP
#define cmdl_params_ConverterRegistry_HPP

#include <map>
#include <memory>
#include <typeindex>
#include <typeinfo>

#include "cmdl/params/Converter.hpp"

namespace cmdl
{
namespace params
{
/*!
 * A ConverterRegistry maps C++ element types to converters. Converters
 * registered here take precedence over the converter an argument was
 * declared with, unless that argument was given a converter explicitly.
 */
class ConverterRegistry
{
public:
	ConverterRegistry() = default;

	ConverterRegistry(ConverterRegistry const &) = default;
	ConverterRegistry(ConverterRegistry &&) = default;
	ConverterRegistry &operator=(ConverterRegistry const &) = default;
	ConverterRegistry &operator=(ConverterRegistry &&) = default;

	~ConverterRegistry() = default;

	template <typename T>
	void set(std::shared_ptr<ArgumentConverter const> const &converter)
	{
		set(std::type_index(typeid(T)), converter);
	}

	void set(std::type_index const &type,
	         std::shared_ptr<ArgumentConverter const> const &converter);

	bool erase(std::type_index const &type);

	/*!
	 * \param type The element type to look up.
	 * \return The registered converter, or nullptr if there is none.
	 */
	std::shared_ptr<ArgumentConverter const>
	find(std::type_index const &type) const;

	bool empty() const;

private:
	std::map<std::type_index, std::shared_ptr<ArgumentConverter const>>
	        converters;
};
}
}

#endif
