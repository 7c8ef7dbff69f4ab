#pragma once


/*
    ---------------------------------------------
    Conform::TypeConverter - The converter engine
    ---------------------------------------------
    A `TypeConverter` answers three questions about a value and a descriptor:

    - `is_instance(v, t) -> bool`:
        * Resolves the handler for `t` and delegates
        * Never fails for a well-formed descriptor; a mismatch is `false`
    - `ensure_is_instance(v, t) -> expected<void, ConversionError>`:
        * Same check, but a mismatch is reported as a `ConversionError`
          carrying the path, the descriptor and the offending value
    - `convert(v, t) -> expected<value, ConversionError>`:
        * Resolves the handler for `t` and delegates to its conversion
        * Conversion is a pass-through unless the handler transforms the
          value (numbers narrowed to native, containers rebuilt as native)

    -------------------
    Recursion and Paths
    -------------------
    The public entry points start with an empty path. Handlers recurse
    through the `*_recursive` members, extending the path with a
    `PathGuard` for every key or index they step into. Derived converters
    override `convert_recursive` to intercept conversion at any depth (the
    JSON decoding converter does so for records and integer-keyed maps).

    ---------
    Lifecycle
    ---------
    A converter is a service object bound to a `HandlerRegistry`. It holds
    no mutable state of its own, so one instance can be shared across
    threads. `default_converter()` returns a process-lifetime instance bound
    to `default_registry()`.
*/

/// @defgroup ConformConverter Converter Engine
/// @ingroup Conform

#include "conform/config.hpp"
#include "conform/error.hpp"
#include "conform/type.hpp"
#include "conform/value.hpp"

namespace Conform {

    class HandlerRegistry;

    /// @ingroup ConformConverter
    /// @brief Checks and converts values against type descriptors.
    class CONFORM_API TypeConverter {
    public:
        explicit TypeConverter(HandlerRegistry& registry) noexcept;
        virtual ~TypeConverter() = default;

        TypeConverter(const TypeConverter&) = delete;
        TypeConverter& operator=(const TypeConverter&) = delete;

        [[nodiscard]] bool is_instance(const value& v, const type& t) const;
        [[nodiscard]] expected_void ensure_is_instance(const value& v, const type& t) const;
        [[nodiscard]] expected_t<value> convert(const value& v, const type& t) const;

        [[nodiscard]] virtual bool is_instance_recursive(const value& v, const type& t, path_t& path) const;
        [[nodiscard]] virtual expected_void ensure_recursive(const value& v, const type& t, path_t& path) const;
        [[nodiscard]] virtual expected_t<value> convert_recursive(const value& v, const type& t, path_t& path) const;

        [[nodiscard]] HandlerRegistry& registry() const noexcept { return m_Registry; }

    private:
        HandlerRegistry& m_Registry;
    };

    /// @ingroup ConformConverter
    /// @brief Process-lifetime converter bound to `default_registry()`
    [[nodiscard]] CONFORM_API const TypeConverter& default_converter();

} // namespace Conform
