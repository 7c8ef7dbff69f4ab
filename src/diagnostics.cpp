#include "conform/diagnostics.hpp"

#include <ostream>

#include <fmt/core.h>
#include <fmt/ostream.h>


namespace Conform {

    std::string format_path(const path_t& path) {
        std::string out = "$";
        for (const auto& segment : path) {
            out += '[';
            out += segment.repr();
            out += ']';
        }
        return out;
    }

    std::string describe(const ConversionError& err) {
        return fmt::format("{} (at {})", err.msg, format_path(err.path));
    }

    void print_error(std::ostream& os, const ConversionError& err) {
        fmt::print(os, "error[{}]: {}\n", code_name(err.errc), err.msg);
        fmt::print(os, "  --> {}\n", format_path(err.path));
        fmt::print(os, "   = expected: {}\n", err.target.repr());
        // a missing field has nothing to show
        if (err.errc != ConversionError::code::missing_field) {
            fmt::print(os, "   = found: {}\n", err.offending.repr());
        }
    }

} // namespace Conform
