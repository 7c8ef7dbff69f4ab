#pragma once


/*
    -------------------------------------------
    Conform::value - Dynamic runtime value model
    -------------------------------------------
    The `Conform::value` type is the subject of every check and conversion
    performed by Conform. It can hold:
        - none (the absence-of-value sentinel)
        - boolean
        - native integer (`std::int64_t`) and native real (`double`)
        - text
        - foreign fixed-width numbers (`int8` ... `uint64`, `float32`,
          `float64`) that behave like numbers but are not native
        - containers: list, tuple, dict, frozen_dict, set, frozen_set
        - record instances (see `record.hpp`)
        - opaque user objects deriving from `Conform::opaque`

    -----------------
    Reference Semantics
    -----------------
    - Scalars are stored inline and copied by value
    - Containers, records and opaque objects are shared: copying a `value`
      aliases the same underlying object. `same()` answers the identity
      question ("is this the very same container?"), `operator==` answers
      the structural one
    - The identity distinction is observable on purpose: unparameterized
      conversions of an already-native list or dict return the same object,
      parameterized conversions always build a new one

    ----------
    Containers
    ----------
    - `list` and `tuple` are ordered sequences; only `list` is native
    - `dict` is the native mapping, `frozen_dict` a read-only mapping that
      is not a dict. Both keep insertion order and unique keys (a repeated
      key keeps its first position and its last value)
    - `set` and `frozen_set` are unordered collections of unique elements
    - Text is never treated as a sequence or a collection

    ---------------------
    Equality
    ---------------------
    - Numeric kinds other than boolean compare by numeric value across kinds
      (`integer 3 == fixed int8 3 == real 3.0`)
    - Booleans only equal booleans
    - A list never equals a tuple; mappings and sets compare by content
    - Records compare by record type and field values, opaque objects by
      identity
    - `value_hash` agrees with `operator==`: numbers hash by their real
      value, mappings and sets hash independently of order. Mappings keep
      a hash index next to their ordered members, so lookup and insertion
      are constant time on average. Keys are not copied on mutation, so a
      container used as a key must not be changed afterwards

    This header defines the value type only. Type descriptors live in
    `type.hpp`, conversions in `converter.hpp`.
*/

/// @defgroup Conform Conform Type Conversion Library
/// @brief Core types and functions for Conform

/// @defgroup ConformValue Runtime Values
/// @ingroup Conform

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "conform/config.hpp"

namespace Conform {

    /// @brief Enumerates the runtime kinds a Conform::value can hold
    enum class kind : uint8_t {
        none,           ///< Absence-of-value sentinel
        boolean,        ///< `true` / `false`
        integer,        ///< Native integer (`std::int64_t`)
        real,           ///< Native real (`double`)
        text,           ///< UTF-8 text
        fixed_integer,  ///< Foreign fixed-width integer
        fixed_real,     ///< Foreign fixed-width floating point number
        list,           ///< Native ordered sequence
        tuple,          ///< Non-native ordered sequence
        dict,           ///< Native mapping
        frozen_dict,    ///< Read-only mapping that is not a dict
        set,            ///< Mutable set
        frozen_set,     ///< Immutable set
        record,         ///< Instance of a declared record type
        opaque,         ///< User object deriving from Conform::opaque
    };

    /// @brief Bit set of runtime kinds, one bit per `kind` enumerator
    using kind_mask = std::uint32_t;

    /// @brief Returns the mask containing exactly the given kinds
    template<std::same_as<kind>... K>
    [[nodiscard]] constexpr kind_mask mask_of(K... ks) noexcept {
        return (kind_mask{ 0 } | ... | (kind_mask{ 1 } << static_cast<unsigned>(ks)));
    }

    [[nodiscard]] constexpr bool mask_contains(kind_mask m, kind k) noexcept {
        return (m & mask_of(k)) != 0;
    }

    /// @brief Returns a short, stable name for a kind ("list", "int8", ...)
    [[nodiscard]] CONFORM_API std::string_view kind_name(kind k) noexcept;

    class value;
    class record;
    class opaque;
    struct mapping_storage;

    /// @ingroup ConformValue
    /// @brief Foreign fixed-width integer storage
    using fixed_integer = std::variant<
        std::int8_t, std::int16_t, std::int32_t, std::int64_t,
        std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t
    >;

    /// @ingroup ConformValue
    /// @brief Foreign fixed-width real storage
    using fixed_real = std::variant<float, double>;

    /// @ingroup ConformValue
    /// @brief Element storage shared by list, tuple, set and frozen_set
    using items = std::vector<value>;

    /// @ingroup ConformValue
    /// @brief Key/value storage shared by dict and frozen_dict
    using entries = std::vector<std::pair<value, value>>;

    /// @ingroup ConformValue
    /// @brief Variant storage used internally by Conform::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        fixed_integer,
        fixed_real,
        std::shared_ptr<items>,
        std::shared_ptr<mapping_storage>,
        std::shared_ptr<const record>,
        std::shared_ptr<const opaque>
    >;

    /// @ingroup ConformValue
    /// @brief Base class for user objects that Conform treats as opaque.
    ///
    /// @details
    /// An opaque object is matched by its class name only (see
    /// `type::opaque`). Deriving additionally from `Conform::serializable`
    /// lets `to_serialized` emit it.
    class CONFORM_API opaque {
    public:
        virtual ~opaque() = default;

        /// @brief Class name used for instance checks and diagnostics
        [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

        /// @brief Human-readable rendering used in error messages
        [[nodiscard]] virtual std::string repr() const;
    };

    /// @ingroup ConformValue
    /// @brief Dynamic runtime value checked and converted by Conform.
    class value {
    public:
        // ------------------------------------------------------------
        // Scalar constructors
        // ------------------------------------------------------------

        /// @brief Constructs none
        CONFORM_API value() noexcept;

        /// @brief Constructs none
        CONFORM_API value(std::nullptr_t) noexcept;

        /// @brief Constructs a boolean
        CONFORM_API value(bool b) noexcept;

        /// @brief Constructs a native integer from any non-boolean integral type
        ///
        /// @details
        /// The argument is converted to `std::int64_t`; use `value::fixed`
        /// to keep the foreign fixed-width representation instead.
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i) noexcept
            : m_Kind{ kind::integer }, m_Storage{ static_cast<std::int64_t>(i) } {}

        /// @brief Constructs a native real
        CONFORM_API value(double d) noexcept;

        /// @brief Constructs text from a C string
        CONFORM_API value(const char* s);

        /// @brief Constructs text from a string view
        CONFORM_API value(std::string_view sv);

        /// @brief Constructs text, taking ownership of @p s
        CONFORM_API value(std::string s);

        /// @brief Wraps a record instance
        CONFORM_API value(std::shared_ptr<const record> r);

        /// @brief Wraps an opaque user object
        CONFORM_API value(std::shared_ptr<const opaque> o);

        // ------------------------------------------------------------
        // Factories
        // ------------------------------------------------------------

        /// @brief Constructs a foreign fixed-width integer of the same width
        ///        and signedness as @p I
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        [[nodiscard]] static value fixed(I i) noexcept {
            value v;
            v.m_Kind = kind::fixed_integer;
            v.m_Storage = fixed_integer{ static_cast<fixed_width_t<I>>(i) };
            return v;
        }

        /// @brief Constructs a foreign 32-bit real
        [[nodiscard]] CONFORM_API static value fixed(float f) noexcept;

        /// @brief Constructs a foreign 64-bit real
        [[nodiscard]] CONFORM_API static value fixed(double d) noexcept;

        [[nodiscard]] CONFORM_API static value list(items elements = {});
        [[nodiscard]] CONFORM_API static value tuple(items elements = {});

        /// @brief Constructs a set; duplicate elements are dropped
        [[nodiscard]] CONFORM_API static value set(items elements = {});
        [[nodiscard]] CONFORM_API static value frozen_set(items elements = {});

        /// @brief Constructs a dict; a repeated key keeps its first position
        ///        and its last value
        [[nodiscard]] CONFORM_API static value dict(entries members = {});
        [[nodiscard]] CONFORM_API static value frozen_dict(entries members = {});

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief Returns the kind currently stored
        [[nodiscard]] kind type() const noexcept { return m_Kind; }

        [[nodiscard]] bool is_none()    const noexcept { return m_Kind == kind::none;    }
        [[nodiscard]] bool is_bool()    const noexcept { return m_Kind == kind::boolean; }
        [[nodiscard]] bool is_integer() const noexcept { return m_Kind == kind::integer; }
        [[nodiscard]] bool is_real()    const noexcept { return m_Kind == kind::real;    }
        [[nodiscard]] bool is_text()    const noexcept { return m_Kind == kind::text;    }
        [[nodiscard]] bool is_record()  const noexcept { return m_Kind == kind::record;  }
        [[nodiscard]] bool is_opaque()  const noexcept { return m_Kind == kind::opaque;  }

        /// @brief True for list and tuple
        [[nodiscard]] CONFORM_API bool is_sequence() const noexcept;

        /// @brief True for dict and frozen_dict
        [[nodiscard]] CONFORM_API bool is_mapping() const noexcept;

        /// @brief True for every container kind (sequences, mappings, sets)
        [[nodiscard]] CONFORM_API bool is_collection() const noexcept;

        /// @brief True for native and fixed-width integers, false for booleans
        [[nodiscard]] CONFORM_API bool is_integral_like() const noexcept;

        /// @brief True for every non-boolean numeric kind
        [[nodiscard]] CONFORM_API bool is_real_like() const noexcept;

        // ------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------
        // All accessors require the matching kind and throw
        // std::bad_variant_access otherwise.

        [[nodiscard]] CONFORM_API bool as_bool() const;
        [[nodiscard]] CONFORM_API std::int64_t as_integer() const;
        [[nodiscard]] CONFORM_API double as_real() const;
        [[nodiscard]] CONFORM_API const std::string& as_text() const;
        [[nodiscard]] CONFORM_API const fixed_integer& as_fixed_integer() const;
        [[nodiscard]] CONFORM_API const fixed_real& as_fixed_real() const;
        [[nodiscard]] CONFORM_API const record& as_record() const;
        [[nodiscard]] CONFORM_API std::shared_ptr<const record> record_ptr() const;
        [[nodiscard]] CONFORM_API const opaque& as_opaque() const;

        /// @brief Elements of a list, tuple, set or frozen_set
        [[nodiscard]] CONFORM_API const items& elements() const;

        /// @brief Key/value pairs of a dict or frozen_dict
        [[nodiscard]] CONFORM_API const entries& members() const;

        /// @brief Number of elements or members; 0 for non-containers
        [[nodiscard]] CONFORM_API std::size_t size() const noexcept;

        /// @brief Narrows an integral-like value to a native integer
        /// @return The integer, or nothing if the value is not integral-like
        ///         or does not fit in `std::int64_t`
        [[nodiscard]] CONFORM_API std::optional<std::int64_t> to_int64() const noexcept;

        /// @brief Narrows a real-like value to a native real
        /// @return The real, or nothing if the value is not real-like
        [[nodiscard]] CONFORM_API std::optional<double> to_double() const noexcept;

        // ------------------------------------------------------------
        // Mutation (native containers only)
        // ------------------------------------------------------------

        /// @brief Appends to a list. Visible through every alias of the list
        /// @throws std::logic_error if the value is not a list
        CONFORM_API void append(value v);

        /// @brief Inserts or replaces a dict member
        /// @throws std::logic_error if the value is not a dict
        CONFORM_API void insert(value key, value v);

        /// @brief Finds a member of a dict or frozen_dict by key
        /// @return Pointer to the mapped value, or nullptr
        [[nodiscard]] CONFORM_API const value* find(const value& key) const;

        // ------------------------------------------------------------
        // Identity, equality, rendering
        // ------------------------------------------------------------

        /// @brief Identity test.
        ///
        /// @details
        /// Shared kinds (containers, records, opaque objects) are the same
        /// when they alias the same object. Scalars are the same when they
        /// have the same kind and compare equal.
        [[nodiscard]] CONFORM_API bool same(const value& other) const noexcept;

        friend bool operator==(const value& lhs, const value& rhs);

        /// @brief Renders the value for diagnostics (`[1, "a"]`, `int8(3)`, ...)
        [[nodiscard]] CONFORM_API std::string repr() const;

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

    private:
        template<class I>
        using fixed_width_t = std::conditional_t<std::is_signed_v<I>,
            std::conditional_t<sizeof(I) == 1, std::int8_t,
            std::conditional_t<sizeof(I) == 2, std::int16_t,
            std::conditional_t<sizeof(I) == 4, std::int32_t, std::int64_t>>>,
            std::conditional_t<sizeof(I) == 1, std::uint8_t,
            std::conditional_t<sizeof(I) == 2, std::uint16_t,
            std::conditional_t<sizeof(I) == 4, std::uint32_t, std::uint64_t>>>>;

        value(kind k, storage_t s) noexcept;

        kind m_Kind{ kind::none };
        storage_t m_Storage{};
    };

    /// @ingroup ConformValue
    /// @brief Structural hash consistent with `operator==` on `value`
    struct value_hash {
        [[nodiscard]] CONFORM_API std::size_t operator()(const value& v) const noexcept;
    };

} // namespace Conform
