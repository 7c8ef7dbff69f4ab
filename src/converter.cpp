#include "conform/converter.hpp"
#include "conform/registry.hpp"


namespace Conform {

    TypeConverter::TypeConverter(HandlerRegistry& registry) noexcept
        : m_Registry{ registry } {}

    bool TypeConverter::is_instance(const value& v, const type& t) const {
        path_t path;
        return is_instance_recursive(v, t, path);
    }

    expected_void TypeConverter::ensure_is_instance(const value& v, const type& t) const {
        path_t path;
        return ensure_recursive(v, t, path);
    }

    expected_t<value> TypeConverter::convert(const value& v, const type& t) const {
        path_t path;
        return convert_recursive(v, t, path);
    }

    bool TypeConverter::is_instance_recursive(const value& v, const type& t, path_t& path) const {
        return m_Registry.resolve(t).is_instance(*this, v, t, path);
    }

    expected_void TypeConverter::ensure_recursive(const value& v, const type& t, path_t& path) const {
        return m_Registry.resolve(t).ensure_is_instance(*this, v, t, path);
    }

    expected_t<value> TypeConverter::convert_recursive(const value& v, const type& t, path_t& path) const {
        return m_Registry.resolve(t).convert(*this, v, t, path);
    }

    const TypeConverter& default_converter() {
        static const TypeConverter converter{ default_registry() };
        return converter;
    }

} // namespace Conform
