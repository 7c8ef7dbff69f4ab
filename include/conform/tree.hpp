#pragma once


/*
    ----------------------------------------
    Conform::tree - Serialized interchange tree
    ----------------------------------------
    The `Conform::tree` type is the output of `to_serialized` and the input
    of `from_serialized`. It mirrors the standard interchange format:
        - null
        - boolean
        - integer (`std::int64_t`)
        - real (`double`)
        - string
        - array
        - object (string keys only)

    Integers and reals are kept apart so integral values, including mapping
    keys written as decimal strings, round trip without loss.

    -----------------
    Memory Management
    -----------------
    - `tree` is allocator-aware and uses `std::pmr::memory_resource` for
      strings, arrays and objects
    - Copy construction/assignment deep copies into the source's resource
    - Move construction/assignment steals the resource and the storage

    ----------------
    Objects and Keys
    ----------------
    Objects are `std::pmr::map`s, so keys are unique and iterate in sorted
    order. The writer (`Conform::dump`) therefore always emits sorted keys.

    -------------------
    Indexing Operations
    -------------------
    - `tree& operator[](std::string_view)` converts to an object if needed and
      inserts null for a missing key
    - `tree& operator[](size_t)` converts to an array if needed and grows it
    - `find` and `at` look keys up without inserting

    -------------
    Thread-Safety
    -------------
    Separate trees may be used from separate threads; sharing one tree
    across threads requires external synchronization.
*/

/// @defgroup ConformTree Serialized Tree
/// @ingroup Conform

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "conform/config.hpp"

namespace Conform {

    /// @brief Enumerates the node kinds a Conform::tree can hold
    enum class tree_kind : uint8_t {
        null,       ///< Interchange null
        boolean,    ///< `true` / `false`
        integer,    ///< Integral number
        real,       ///< Floating point number
        string,     ///< UTF-8 string
        array,      ///< Ordered list of trees
        object,     ///< String-keyed map of trees
    };

    struct tree;

    /// @ingroup ConformTree
    /// @brief String type used by Conform::tree (allocator-aware)
    using tree_string = std::pmr::string;

    /// @ingroup ConformTree
    using tree_array = std::pmr::vector<tree>;

    /// @ingroup ConformTree
    using tree_object = std::pmr::map<tree_string, tree, std::less<>>;

    using tree_storage_t = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        tree_string,
        tree_array,
        tree_object
    >;

    /// @ingroup ConformTree
    /// @brief Allocator-aware serialized tree node.
    struct tree {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @brief Constructs null using @p res for nested allocations
        CONFORM_API explicit tree(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        CONFORM_API tree(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        CONFORM_API tree(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        CONFORM_API tree(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs an integer node from any non-boolean integral type
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        tree(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<std::int64_t>(i) } {}

        CONFORM_API tree(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        CONFORM_API tree(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        CONFORM_API tree(tree_string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        CONFORM_API tree(tree_array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        CONFORM_API tree(tree_object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep copy into the allocator of @p other
        CONFORM_API tree(const tree& other);
        CONFORM_API tree(tree&& other) noexcept;
        CONFORM_API tree& operator=(const tree& other);
        CONFORM_API tree& operator=(tree&& other) noexcept;

        /// @brief Empty array using @p res
        [[nodiscard]] CONFORM_API static tree make_array(std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Empty object using @p res
        [[nodiscard]] CONFORM_API static tree make_object(std::pmr::memory_resource* res = std::pmr::get_default_resource());

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        [[nodiscard]] CONFORM_API tree_kind type() const noexcept;

        [[nodiscard]] bool is_null()    const noexcept { return type() == tree_kind::null;    }
        [[nodiscard]] bool is_bool()    const noexcept { return type() == tree_kind::boolean; }
        [[nodiscard]] bool is_integer() const noexcept { return type() == tree_kind::integer; }
        [[nodiscard]] bool is_real()    const noexcept { return type() == tree_kind::real;    }
        [[nodiscard]] bool is_string()  const noexcept { return type() == tree_kind::string;  }
        [[nodiscard]] bool is_array()   const noexcept { return type() == tree_kind::array;   }
        [[nodiscard]] bool is_object()  const noexcept { return type() == tree_kind::object;  }

        // ------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------
        // Scalar accessors require the matching kind and throw
        // std::bad_variant_access otherwise. The non-const container
        // accessors replace the contents with an empty container first
        // when the kind differs.

        [[nodiscard]] CONFORM_API bool as_bool() const;
        [[nodiscard]] CONFORM_API std::int64_t as_integer() const;
        [[nodiscard]] CONFORM_API double as_real() const;
        [[nodiscard]] CONFORM_API const tree_string& as_string() const;

        [[nodiscard]] CONFORM_API tree_array& as_array();
        [[nodiscard]] CONFORM_API const tree_array& as_array() const;
        [[nodiscard]] CONFORM_API tree_object& as_object();
        [[nodiscard]] CONFORM_API const tree_object& as_object() const;

        /// @brief Number of elements or members; 0 for scalars
        [[nodiscard]] CONFORM_API std::size_t size() const noexcept;

        /// @brief Appends to an array, converting to an empty array first if needed
        CONFORM_API tree& push_back(tree t);

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        CONFORM_API tree& operator[](std::size_t idx);

        /// @brief Returns a null sentinel when out of range or not an array
        CONFORM_API const tree& operator[](std::size_t idx) const;

        CONFORM_API tree& operator[](std::string_view key);

        [[nodiscard]] CONFORM_API const tree* find(std::string_view key) const;

        /// @throws std::out_of_range if @p key is absent
        [[nodiscard]] CONFORM_API const tree& at(std::string_view key) const;

        friend bool operator==(const tree& lhs, const tree& rhs) {
            return lhs.m_Storage == rhs.m_Storage;
        }

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        [[nodiscard]] const tree_storage_t& storage() const noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        tree_storage_t m_Storage{};

        static tree_storage_t clone_storage(const tree_storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Conform
