#pragma once


/*
    ------------------------------------------
    Conform handlers - Per-shape check logic
    ------------------------------------------
    A handler implements the three converter operations for one family of
    descriptors. Handlers are stateless: every call receives the converter
    (for recursion), the value, the descriptor and the current path.

    --------
    Handlers
    --------
    - `trivial_handler`:     plain instance check, pass-through conversion
    - `any_handler`:         accepts everything, returns the input untouched
    - `integral_handler`:    foreign integers narrowed to the native integer;
                             booleans pass through but are never widened
    - `real_handler`:        integers and foreign numbers converted to the
                             native real; booleans rejected
    - `union_handler`:       a value matches if at least one branch matches;
                             conversion takes the first matching branch, then
                             falls back to converting each branch in order
    - `mapping_handler`:     keys and values checked recursively; validate only
    - `dict_handler`:        converts any mapping into a native dict
    - `collection_handler`:  elements (mapping keys) checked recursively;
                             validate only
    - `list_handler`:        converts any sequence into a native list
    - `unsupported_handler`: parameterized tuples, reported as not implemented

    Identity is part of the contract: unparameterized dict and list
    conversions return the input itself when it is already native, while
    parameterized conversions always build a new container.
*/

/// @defgroup ConformHandlers Handlers
/// @ingroup ConformConverter

#include <string_view>

#include "conform/config.hpp"
#include "conform/error.hpp"
#include "conform/type.hpp"
#include "conform/value.hpp"

namespace Conform {

    class TypeConverter;

    /// @ingroup ConformHandlers
    /// @brief Base class of all handlers.
    ///
    /// @details
    /// Only `is_instance` is required. The default `ensure_is_instance`
    /// reports a `type_mismatch` when `is_instance` is false, and the
    /// default `convert` ensures and then returns the value unchanged.
    class CONFORM_API handler {
    public:
        virtual ~handler() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual bool is_instance(
            const TypeConverter& conv, const value& v, const type& t, path_t& path) const = 0;

        [[nodiscard]] virtual expected_void ensure_is_instance(
            const TypeConverter& conv, const value& v, const type& t, path_t& path) const;

        [[nodiscard]] virtual expected_t<value> convert(
            const TypeConverter& conv, const value& v, const type& t, path_t& path) const;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API trivial_handler : public handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "trivial"; }
        [[nodiscard]] bool is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API any_handler final : public handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "any"; }
        [[nodiscard]] bool is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
        [[nodiscard]] expected_t<value> convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API integral_handler final : public trivial_handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "integral"; }
        [[nodiscard]] expected_t<value> convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API real_handler final : public trivial_handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "real"; }
        [[nodiscard]] expected_t<value> convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API union_handler final : public handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "union"; }
        [[nodiscard]] bool is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
        [[nodiscard]] expected_void ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
        [[nodiscard]] expected_t<value> convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API mapping_handler : public handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "mapping"; }
        [[nodiscard]] bool is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
        [[nodiscard]] expected_void ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API dict_handler final : public mapping_handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "dict"; }
        [[nodiscard]] expected_t<value> convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API collection_handler : public handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "collection"; }
        [[nodiscard]] bool is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
        [[nodiscard]] expected_void ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API list_handler final : public collection_handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "list"; }
        [[nodiscard]] expected_t<value> convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

    /// @ingroup ConformHandlers
    class CONFORM_API unsupported_handler final : public handler {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "unsupported"; }
        [[nodiscard]] bool is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
        [[nodiscard]] expected_void ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
        [[nodiscard]] expected_t<value> convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const override;
    };

} // namespace Conform
