#pragma once


/*
    ------------------------------------------------------
    Conform JSON bridge - Values to and from the tree form
    ------------------------------------------------------
    `JsonConverter` moves values between the runtime model and the
    serialized tree (`Conform::tree`).

    -------------
    to_serialized
    -------------
    - none, booleans, native integers, reals and text map to the matching
      tree node
    - values implementing `serializable` (records, opted-in opaque objects)
      produce their own tree
    - foreign fixed-width numbers are narrowed to integer or real nodes
    - mappings become objects. The first key decides whether every key must
      be text or every key must be integral; integral keys are written in
      decimal. Any other key fails with `invalid_key`
    - every other container becomes an array
    - anything else fails with `not_serializable`

    ---------------
    from_serialized
    ---------------
    The tree is first lifted into a runtime value (arrays become lists,
    objects become dicts with text keys), then converted to the requested
    descriptor with a `JsonTypeConverter`. At every recursion level that
    converter:
    - hands record types that support decoding the lifted data directly
    - rewrites text keys to integers when the target is a dict whose key
      type is integral; a key that is not a decimal integer fails with
      `invalid_key`, naming the whole key set rather than the bad key
    Everything else goes through the ordinary handlers.

    `DecodeOptions::lenient` holds for every record decoded in one call.
*/

/// @defgroup ConformJson JSON Bridge
/// @ingroup Conform

#include <memory_resource>

#include "conform/config.hpp"
#include "conform/converter.hpp"
#include "conform/error.hpp"
#include "conform/options.hpp"
#include "conform/tree.hpp"
#include "conform/type.hpp"
#include "conform/value.hpp"

namespace Conform {

    /// @ingroup ConformJson
    /// @brief Converter used while decoding serialized data
    class CONFORM_API JsonTypeConverter final : public TypeConverter {
    public:
        explicit JsonTypeConverter(HandlerRegistry& registry, DecodeOptions opts = {}) noexcept;

        [[nodiscard]] const DecodeOptions& options() const noexcept { return m_Options; }

        [[nodiscard]] expected_t<value> convert_recursive(const value& v, const type& t, path_t& path) const override;

    private:
        DecodeOptions m_Options;
    };

    /// @ingroup ConformJson
    /// @brief Converts values to serialized trees and back.
    class CONFORM_API JsonConverter {
    public:
        /// @param res Memory resource for every tree this converter builds
        explicit JsonConverter(HandlerRegistry& registry,
                               std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        [[nodiscard]] expected_t<tree> to_serialized(const value& v) const;

        /// @brief Recursive form used by `serializable` implementations
        [[nodiscard]] expected_t<tree> to_serialized(const value& v, path_t& path) const;

        [[nodiscard]] expected_t<value> from_serialized(const type& t, const tree& data, const DecodeOptions& opts = {}) const;

        /// @brief Lifts a tree into a runtime value without any conversion
        [[nodiscard]] static value lift(const tree& data);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        [[nodiscard]] expected_t<tree> mapping_to_serialized(const value& v, path_t& path) const;

        HandlerRegistry& m_Registry;
        std::pmr::memory_resource* m_MemRes;
    };

    /// @ingroup ConformJson
    /// @brief Process-lifetime JSON converter bound to `default_registry()`
    [[nodiscard]] CONFORM_API const JsonConverter& default_json_converter();

} // namespace Conform
