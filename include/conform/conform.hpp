#pragma once


/*
    -------------------------------------------------------------
    Conform - Runtime type checking and conversion for C++ values
    -------------------------------------------------------------

    This is the main public header for Conform

    It brings together:
        - The dynamic runtime value:    `Conform::value`
        - Type descriptors:             `Conform::type`
        - The converter engine:         `Conform::TypeConverter`,
                                        `Conform::HandlerRegistry`
        - Records:                      `Conform::record_type`,
                                        `Conform::record`
        - The serialized tree:          `Conform::tree`
        - The JSON bridge:              `Conform::JsonConverter`
        - Error reporting:              `Conform::ConversionError`
        - Options:                      `Conform::WriteOptions`,
                                        `Conform::DecodeOptions`

    -------------------
    High-Level Overview
    -------------------
    - Checking:
        * `bool is_instance(const value&, const type&)`
        * `expected<void, ConversionError> ensure_is_instance(const value&, const type&)`
    - Converting:
        * `expected<value, ConversionError> convert(const value&, const type&)`
        * Foreign numbers are narrowed to native ones, sequences and mappings
          are rebuilt as native lists and dicts when the descriptor asks for
          element types
    - Serializing:
        * `expected<tree, ConversionError> to_serialized(const value&)`
        * `expected<value, ConversionError> from_serialized(const type&, const tree&, const DecodeOptions& = {})`
        * `std::string dump(const tree&, const WriteOptions& = {})`

    The free functions use the process-lifetime `default_converter()` and
    `default_json_converter()`. Construct a `TypeConverter` or
    `JsonConverter` over your own `HandlerRegistry` to keep a separate
    resolution cache.

    -----
    Usage
    -----
        #include <conform/conform.hpp>

        int main() {
            using namespace Conform;

            auto points = value::tuple({ 1, value::fixed(std::int16_t{ 2 }) });
            auto result = convert(points, type::list(type::integral()));
            if (!result) {
                print_error(std::cerr, result.error());
                return 1;
            }

            auto serialized = to_serialized(*result);
            std::cout << dump(*serialized, { .pretty = true }) << '\n';
        }
*/


#include <iosfwd>
#include <string>

#include "conform/config.hpp"
#include "conform/converter.hpp"
#include "conform/diagnostics.hpp"
#include "conform/error.hpp"
#include "conform/json.hpp"
#include "conform/options.hpp"
#include "conform/record.hpp"
#include "conform/registry.hpp"
#include "conform/tree.hpp"
#include "conform/type.hpp"
#include "conform/value.hpp"

namespace Conform {

    /// @ingroup Conform
    /// @brief True when @p v satisfies @p t; never fails
    [[nodiscard]] CONFORM_API bool is_instance(const value& v, const type& t);

    /// @ingroup Conform
    /// @brief Like `is_instance`, reporting a mismatch as a `ConversionError`
    [[nodiscard]] CONFORM_API expected_void ensure_is_instance(const value& v, const type& t);

    /// @ingroup Conform
    /// @brief Converts @p v to the native representation described by @p t
    [[nodiscard]] CONFORM_API expected_t<value> convert(const value& v, const type& t);

    /// @ingroup Conform
    /// @brief Converts @p v to its serialized tree
    [[nodiscard]] CONFORM_API expected_t<tree> to_serialized(const value& v);

    /// @ingroup Conform
    /// @brief Rebuilds a value of type @p t from serialized @p data
    [[nodiscard]] CONFORM_API expected_t<value> from_serialized(const type& t, const tree& data, const DecodeOptions& opts = {});

    /// @ingroup Conform
    /// @brief Writes @p t as JSON text
    ///
    /// @details
    /// Object keys come out sorted. Non-finite reals are written as `null`.
    [[nodiscard]] CONFORM_API std::string dump(const tree& t, const WriteOptions& opts = {});

    /// @ingroup Conform
    /// @brief Writes @p t as JSON text to @p os
    CONFORM_API void dump(const tree& t, std::ostream& os, const WriteOptions& opts = {});

} // namespace Conform
