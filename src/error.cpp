#include "conform/error.hpp"

namespace Conform {

    ConversionError ConversionError::make(code c, value offending, type target, const path_t& path, std::string_view m) {
        ConversionError e;
        e.errc = c;
        e.msg.assign(m.begin(), m.end());
        e.offending = std::move(offending);
        e.target = std::move(target);
        e.path = path;
        return e;
    }

    std::string_view code_name(ConversionError::code c) noexcept {
        using enum ConversionError::code;
        switch (c) {
        case type_mismatch: return "type_mismatch";
        case no_union_branch: return "no_union_branch";
        case invalid_key: return "invalid_key";
        case unknown_field: return "unknown_field";
        case missing_field: return "missing_field";
        case not_serializable: return "not_serializable";
        case not_implemented: return "not_implemented";
        case out_of_range: return "out_of_range";
        }
        return "unknown";
    }

} // namespace Conform
