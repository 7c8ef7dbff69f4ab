#pragma once


/*
    --------------------------------------
    Conform writing and decoding options
    --------------------------------------
    This header defines the configuration structures that control how the
    serialized tree is written as text and how serialized data is decoded
    back into typed values.

    ---------------------------------------
    Writing Options - Conform::WriteOptions
    ---------------------------------------
    `WriteOptions` tunes `Conform::dump(...)`:

    - `bool pretty`:
        * When false (default), produces compact text without extra whitespace
        * When true, outputs indented text with newlines and spaces
    - `size_t indent`:
        * Number of spaces to indent per nesting level in pretty mode
        * Ignored if `pretty == false`

    -----------------------------------------
    Decoding Options - Conform::DecodeOptions
    -----------------------------------------
    `DecodeOptions` tunes `Conform::from_serialized(...)`:

    - `bool lenient`:
        * When false (default), a record decoded from an object that carries
          keys the record does not declare fails with `unknown_field`
        * When true, such keys are discarded
        * Applies to every record decoded within one call, at any depth

    Both are plain aggregates suitable for brace-initialization.
*/

#include <cstddef>

/// @defgroup ConformOptions Writing and Decoding Options
/// @ingroup Conform
/// @brief Configuration objects controlling text output and decoding

namespace Conform {

    /// @ingroup ConformOptions
    /// @brief Configuration options controlling tree text output.
    ///
    /// @details
    /// Example:
    /// @code
    /// WriteOptions wo;
    /// wo.pretty = true;
    /// wo.indent = 4;
    /// std::string text = Conform::dump(t, wo);
    /// @endcode
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;     ///< Number of spaces per indentation level.
    };

    /// @ingroup ConformOptions
    /// @brief Configuration controlling decoding of serialized data.
    struct DecodeOptions {
        bool lenient = false;       ///< Discard undeclared record keys instead of failing.
    };

} // namespace Conform
