#pragma once


/*
    ---------------------------------------------------------
    Conform::ConversionError - Structured conversion failures
    ---------------------------------------------------------
    `Conform::ConversionError` describes why a value could not be checked,
    converted, serialized or decoded against a type descriptor.

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing the failure category:
            - `type_mismatch`
            - `no_union_branch`
            - `invalid_key`
            - `unknown_field`
            - `missing_field`
            - `not_serializable`
            - `not_implemented`
            - `out_of_range`
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for diagnostics; not stable for programmatic use
    - `value offending`:
        * The value that failed at the point of failure (not the root input)
    - `type target`:
        * The descriptor the offending value was checked against
    - `path_t path`:
        * Keys and indices leading from the root input to the offending
          value, outermost first. `[0, "key"]` renders as `$[0]["key"]`

    -----
    Usage
    -----
    - `ensure_is_instance` returns `std::expected<void, ConversionError>`
    - `convert`, `to_serialized` and `from_serialized` return
      `std::expected<T, ConversionError>`
    - Errors propagate to the caller untouched. The only places where one
      is discarded are `is_instance` (a boolean check by contract) and the
      union handler, which moves on to the next branch

    ----------
    Path Guard
    ----------
    Handlers extend the current path while they recurse into a container.
    `PathGuard` pushes a key or index on construction and pops it on scope
    exit, so early returns never leave stale entries behind.
*/

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "conform/config.hpp"
#include "conform/type.hpp"
#include "conform/value.hpp"


/// @defgroup ConformError Conversion Errors
/// @ingroup Conform
/// @brief Error codes and structures produced by checks and conversions
namespace Conform {

    /// @ingroup ConformError
    /// @brief Keys and indices from the root input to a nested value
    using path_t = std::vector<value>;

    /// @ingroup ConformError
    /// @brief Structured error information produced by every fallible
    ///        Conform operation.
    ///
    /// @details
    /// A `ConversionError` carries the failure category, a message, the
    /// offending value, the descriptor it failed against and the path to it.
    /// The combination lets callers print a precise diagnostic (see
    /// `diagnostics.hpp`) or react to the code programmatically.
    struct ConversionError {
        /// @ingroup ConformError
        /// @brief Enumeration of possible failure categories.
        ///
        /// @details
        /// - `type_mismatch`
        ///     The value's runtime shape cannot satisfy the descriptor.
        ///
        /// - `no_union_branch`
        ///     Every branch of a union was attempted and none matched.
        ///
        /// - `invalid_key`
        ///     Mapping keys are of a mixed or unsupported kind during
        ///     serialization, or serialized keys could not be reinterpreted
        ///     as integers during decoding.
        ///
        /// - `unknown_field`
        ///     A record was given (or decoded with) a field it does not
        ///     declare, in strict mode.
        ///
        /// - `missing_field`
        ///     A required record field has no value and no default.
        ///
        /// - `not_serializable`
        ///     The value has no serialized form.
        ///
        /// - `not_implemented`
        ///     The descriptor is well formed but its check is not supported
        ///     (parameterized tuples).
        ///
        /// - `out_of_range`
        ///     A foreign number cannot be narrowed without loss.
        enum class code : uint8_t {
            type_mismatch,      ///< Value does not satisfy the descriptor.
            no_union_branch,    ///< No union branch accepted the value.
            invalid_key,        ///< Unsupported or unconvertible mapping key.
            unknown_field,      ///< Undeclared record field.
            missing_field,      ///< Required record field absent.
            not_serializable,   ///< Value has no serialized form.
            not_implemented,    ///< Descriptor check is not supported.
            out_of_range,       ///< Narrowing would lose information.
        };

        code errc{};            ///< The classification of the failure.
        std::string msg{};      ///< Human-readable diagnostic message.
        value offending{};      ///< Value at the point of failure.
        type target{};          ///< Descriptor the value failed against.
        path_t path{};          ///< Location of the value within the input.

        /// @ingroup ConformError
        /// @brief Constructs a fully-populated `ConversionError`.
        ///
        /// @details
        /// The path is copied, so callers can keep extending theirs.
        ///
        /// Example internal use:
        /// @code
        /// return std::unexpected(ConversionError::make(
        ///     code::type_mismatch, v, t, path,
        ///     fmt::format("expected {}, got {}", t.repr(), v.repr())
        /// ));
        /// @endcode
        [[nodiscard]] CONFORM_API static ConversionError make(
            code c, value offending, type target, const path_t& path, std::string_view m);
    };

    /// @ingroup ConformError
    /// @brief Result of a fallible conversion
    template<class T>
    using expected_t = std::expected<T, ConversionError>;

    /// @ingroup ConformError
    /// @brief Result of a fallible check
    using expected_void = std::expected<void, ConversionError>;

    /// @ingroup ConformError
    /// @brief Stable name of an error code ("type_mismatch", ...)
    [[nodiscard]] CONFORM_API std::string_view code_name(ConversionError::code c) noexcept;

    /// @ingroup ConformError
    /// @brief Pushes one path segment for the lifetime of the guard
    class PathGuard {
    public:
        PathGuard(path_t& path, value segment)
            : m_Path{ path } {
            m_Path.push_back(std::move(segment));
        }

        ~PathGuard() { m_Path.pop_back(); }

        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;

    private:
        path_t& m_Path;
    };

} // namespace Conform
