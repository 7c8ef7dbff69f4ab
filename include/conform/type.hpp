#pragma once


/*
    --------------------------------------------
    Conform::type - Immutable type descriptors
    --------------------------------------------
    A `Conform::type` describes the declared target of a check or
    conversion: "list of int", "mapping from int to union<int, str>",
    "record Point", ...

    ----------
    Categories
    ----------
    - `any`:        matches everything
    - `none`:       matches only the none sentinel
    - `boolean`, `integral`, `real`, `text`: native scalar classes
    - `union`:      ordered branches, first match wins on conversion
    - `mapping`:    keyed containers, optionally parameterized by key and
                    value descriptors
    - `sequence`:   ordered containers, optionally parameterized by element
    - `collection`: sized/iterable containers (set-like), optionally
                    parameterized by element
    - `tuple`:      fixed-arity or homogeneous tuples
    - `record`:     a declared, closed record schema
    - `opaque`:     a named user class

    ------------
    Runtime Base
    ------------
    Every descriptor carries the set of runtime kinds it admits (its
    runtime base). `list<int>` admits only lists, `sequence<int>` admits
    lists and tuples, `mapping` admits dicts and frozen_dicts. The handler
    registry routes on this set: a mapping descriptor whose base admits the
    native dict converts to dict, one that does not can only be validated.

    --------------------
    Equality and Hashing
    --------------------
    Descriptors are small immutable values shared through a pointer.
    Equality and hashing are structural, so descriptors key the registry's
    resolution cache directly.

    ------------
    Construction
    ------------
    - Static factories (`type::list(type::integral())`, ...)
    - `type::of<T>()` maps C++ types to descriptors at compile time
    - `type::of(kind)` maps a native runtime kind handle (list, dict, tuple,
      set, ...) to its unparameterized descriptor
    Malformed descriptors are rejected when they are built, not when they
    are first used: the factories throw `std::invalid_argument`.
*/

/// @defgroup ConformType Type Descriptors
/// @ingroup Conform

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include "conform/config.hpp"
#include "conform/value.hpp"

namespace Conform {

    class record_type;

    /// @ingroup ConformType
    /// @brief Shape category of a descriptor, used for handler dispatch
    enum class category : uint8_t {
        any,
        none,
        boolean,
        integral,
        real,
        text,
        union_,
        mapping,
        sequence,
        collection,
        tuple,
        record,
        opaque,
    };

    /// @ingroup ConformType
    /// @brief Immutable, structurally comparable type descriptor.
    class type {
    public:
        /// @brief Constructs `any`
        CONFORM_API type();

        // ------------------------------------------------------------
        // Scalars
        // ------------------------------------------------------------

        [[nodiscard]] CONFORM_API static type any();
        [[nodiscard]] CONFORM_API static type none();
        [[nodiscard]] CONFORM_API static type boolean();
        [[nodiscard]] CONFORM_API static type integral();
        [[nodiscard]] CONFORM_API static type real();
        [[nodiscard]] CONFORM_API static type text();

        // ------------------------------------------------------------
        // Unions
        // ------------------------------------------------------------

        /// @brief Builds a union of @p branches.
        ///
        /// @details
        /// Nested unions are flattened and repeated branches dropped, keeping
        /// the first occurrence. A union left with a single branch is that
        /// branch.
        ///
        /// @throws std::invalid_argument if @p branches is empty
        [[nodiscard]] CONFORM_API static type union_of(std::vector<type> branches);

        /// @brief Shorthand for `union_of({ t, none() })`
        [[nodiscard]] CONFORM_API static type optional(type t);

        // ------------------------------------------------------------
        // Containers
        // ------------------------------------------------------------
        // The overloads without arguments are unparameterized.

        /// @brief Any ordered sequence (list or tuple)
        [[nodiscard]] CONFORM_API static type sequence();
        [[nodiscard]] CONFORM_API static type sequence(type element);

        /// @brief The native list
        [[nodiscard]] CONFORM_API static type list();
        [[nodiscard]] CONFORM_API static type list(type element);

        /// @brief Any mapping (dict or frozen_dict)
        [[nodiscard]] CONFORM_API static type mapping();
        [[nodiscard]] CONFORM_API static type mapping(type key, type mapped);

        /// @brief The native dict
        [[nodiscard]] CONFORM_API static type dict();
        [[nodiscard]] CONFORM_API static type dict(type key, type mapped);

        /// @brief A read-only mapping that is not a dict
        [[nodiscard]] CONFORM_API static type frozen_dict();
        [[nodiscard]] CONFORM_API static type frozen_dict(type key, type mapped);

        /// @brief Any container (sequences, mappings and sets)
        [[nodiscard]] CONFORM_API static type collection();
        [[nodiscard]] CONFORM_API static type collection(type element);

        [[nodiscard]] CONFORM_API static type set();
        [[nodiscard]] CONFORM_API static type set(type element);
        [[nodiscard]] CONFORM_API static type frozen_set();
        [[nodiscard]] CONFORM_API static type frozen_set(type element);

        /// @brief Either set kind
        [[nodiscard]] CONFORM_API static type abstract_set();
        [[nodiscard]] CONFORM_API static type abstract_set(type element);

        /// @brief Unparameterized tuple
        [[nodiscard]] CONFORM_API static type tuple();

        /// @brief Fixed-arity tuple (`tuple<int, str>`)
        [[nodiscard]] CONFORM_API static type tuple(std::vector<type> elements);

        /// @brief Homogeneous tuple of any length (`tuple<int, ...>`)
        [[nodiscard]] CONFORM_API static type tuple_of(type element);

        // ------------------------------------------------------------
        // Records and opaque classes
        // ------------------------------------------------------------

        /// @throws std::invalid_argument if @p rt is null
        [[nodiscard]] CONFORM_API static type record(std::shared_ptr<const record_type> rt);

        /// @brief Descriptor for opaque objects whose `type_name()` is @p name
        /// @throws std::invalid_argument if @p name is empty
        [[nodiscard]] CONFORM_API static type opaque(std::string name);

        // ------------------------------------------------------------
        // Native handles
        // ------------------------------------------------------------

        /// @brief Unparameterized descriptor for a native runtime kind.
        ///
        /// @details
        /// `kind::list` gives `list`, `kind::dict` gives `dict`, and so on, so
        /// that the plain native handle dispatches exactly like the
        /// unparameterized generic form.
        ///
        /// @throws std::invalid_argument for kinds with no standalone
        ///         descriptor (fixed-width numbers, record, opaque)
        [[nodiscard]] CONFORM_API static type of(kind k);

        /// @brief Descriptor for the C++ type @p T (see type_traits below)
        template<class T>
        [[nodiscard]] static type of();

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        [[nodiscard]] CONFORM_API category shape() const noexcept;

        /// @brief Runtime kinds admitted by this descriptor
        [[nodiscard]] CONFORM_API kind_mask runtime_base() const noexcept;

        /// @brief True when element/key/value descriptors are attached
        [[nodiscard]] CONFORM_API bool is_parameterized() const noexcept;

        /// @brief True for `tuple<T, ...>`
        [[nodiscard]] CONFORM_API bool is_variadic() const noexcept;

        /// @brief Attached descriptors: union branches, element, key and
        ///        value, or tuple elements
        [[nodiscard]] CONFORM_API const std::vector<type>& args() const noexcept;

        [[nodiscard]] CONFORM_API const std::shared_ptr<const record_type>& record_schema() const noexcept;
        [[nodiscard]] CONFORM_API const std::string& opaque_name() const noexcept;

        /// @brief Plain instance check against the runtime base.
        ///
        /// @details
        /// No recursion into parameters. Records must additionally be of this
        /// exact record type and opaque objects must carry this class name.
        [[nodiscard]] CONFORM_API bool admits(const value& v) const;

        [[nodiscard]] CONFORM_API std::size_t hash() const noexcept;

        /// @brief Renders the descriptor (`list<int>`, `union<int, str>`, ...)
        [[nodiscard]] CONFORM_API std::string repr() const;

        friend bool operator==(const type& lhs, const type& rhs) noexcept;

    private:
        struct node;

        explicit type(std::shared_ptr<const node> n) noexcept;
        static type make(node n);

        std::shared_ptr<const node> m_Node;
    };

    /// @ingroup ConformType
    /// @brief Answers which shape category a descriptor belongs to
    [[nodiscard]] inline category classify(const type& t) noexcept { return t.shape(); }

    /// @brief Hash functor for unordered containers keyed by descriptors
    struct type_hash {
        std::size_t operator()(const type& t) const noexcept { return t.hash(); }
    };

    // ------------------------------------------------------------
    // type::of<T>() mapping
    // ------------------------------------------------------------

    namespace detail {

        template<class T>
        struct type_traits {
            static_assert(sizeof(T) == 0, "Conform::type::of<T>: no descriptor for this C++ type");
        };

        template<> struct type_traits<value> { static type get() { return type::any(); } };
        template<> struct type_traits<std::nullptr_t> { static type get() { return type::none(); } };
        template<> struct type_traits<bool> { static type get() { return type::boolean(); } };
        template<> struct type_traits<std::string> { static type get() { return type::text(); } };
        template<> struct type_traits<std::string_view> { static type get() { return type::text(); } };
        template<> struct type_traits<const char*> { static type get() { return type::text(); } };

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        struct type_traits<I> { static type get() { return type::integral(); } };

        template<std::floating_point F>
        struct type_traits<F> { static type get() { return type::real(); } };

        template<class T, class A>
        struct type_traits<std::vector<T, A>> {
            static type get() { return type::list(type::of<T>()); }
        };

        template<class K, class V, class C, class A>
        struct type_traits<std::map<K, V, C, A>> {
            static type get() { return type::dict(type::of<K>(), type::of<V>()); }
        };

        template<class K, class V, class H, class E, class A>
        struct type_traits<std::unordered_map<K, V, H, E, A>> {
            static type get() { return type::dict(type::of<K>(), type::of<V>()); }
        };

        template<class T, class C, class A>
        struct type_traits<std::set<T, C, A>> {
            static type get() { return type::set(type::of<T>()); }
        };

        template<class... Ts>
        struct type_traits<std::tuple<Ts...>> {
            static type get() { return type::tuple({ type::of<Ts>()... }); }
        };

        template<class T>
        struct type_traits<std::optional<T>> {
            static type get() { return type::optional(type::of<T>()); }
        };

        template<class... Ts>
        struct type_traits<std::variant<Ts...>> {
            static type get() { return type::union_of({ type::of<Ts>()... }); }
        };

    } // namespace detail

    template<class T>
    type type::of() {
        return detail::type_traits<std::remove_cvref_t<T>>::get();
    }

} // namespace Conform
