#pragma once


/*
    -------------------------------------------
    Conform diagnostics - Rendering errors
    -------------------------------------------
    The library never writes output on its own. These helpers turn a
    `ConversionError` into text for whoever reports it:

    - `format_path(path)`:  `$`, `$[0]`, `$["key"][2]`, ...
    - `describe(err)`:      one line, `msg (at $[0]["key"])`
    - `print_error(os, err)`:
        error[type_mismatch]: expected int, got "x"
          --> $["points"][1]["x"]
           = expected: int
           = found: "x"
*/

#include <iosfwd>
#include <string>

#include "conform/config.hpp"
#include "conform/error.hpp"

namespace Conform {

    /// @ingroup ConformError
    /// @brief Renders a path rooted at `$`; text segments are quoted
    [[nodiscard]] CONFORM_API std::string format_path(const path_t& path);

    /// @ingroup ConformError
    /// @brief Message followed by the location of the offending value
    [[nodiscard]] CONFORM_API std::string describe(const ConversionError& err);

    /// @ingroup ConformError
    /// @brief Writes a multi-line diagnostic for @p err to @p os
    CONFORM_API void print_error(std::ostream& os, const ConversionError& err);

} // namespace Conform
