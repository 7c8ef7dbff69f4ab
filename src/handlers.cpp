#include "conform/handlers.hpp"
#include "conform/converter.hpp"

#include <fmt/format.h>


namespace Conform {

    namespace {

        using code = ConversionError::code;

        std::unexpected<ConversionError> mismatch(const value& v, const type& t, const path_t& path) {
            return std::unexpected(ConversionError::make(
                code::type_mismatch, v, t, path,
                fmt::format("expected {}, got {}", t.repr(), v.repr())
            ));
        }

        std::unexpected<ConversionError> not_implemented(const value& v, const type& t, const path_t& path) {
            return std::unexpected(ConversionError::make(
                code::not_implemented, v, t, path,
                fmt::format("checks against {} are not implemented", t.repr())
            ));
        }

        std::string branch_list(const type& t) {
            std::string out;
            for (const auto& b : t.args()) {
                if (!out.empty()) out += ", ";
                out += b.repr();
            }
            return out;
        }

    } // namespace

    // ------------------------------------------------------------
    // handler
    // ------------------------------------------------------------

    expected_void handler::ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (!is_instance(conv, v, t, path)) return mismatch(v, t, path);
        return {};
    }

    expected_t<value> handler::convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        auto ok = ensure_is_instance(conv, v, t, path);
        if (!ok) return std::unexpected(std::move(ok.error()));
        return v;
    }

    // ------------------------------------------------------------
    // Scalars
    // ------------------------------------------------------------

    bool trivial_handler::is_instance(const TypeConverter&, const value& v, const type& t, path_t&) const {
        return t.admits(v);
    }

    bool any_handler::is_instance(const TypeConverter&, const value&, const type&, path_t&) const {
        return true;
    }

    expected_t<value> any_handler::convert(const TypeConverter&, const value& v, const type&, path_t&) const {
        return v;
    }

    expected_t<value> integral_handler::convert(const TypeConverter&, const value& v, const type& t, path_t& path) const {
        if (v.is_integer() || v.is_bool()) return v;
        if (!v.is_integral_like()) return mismatch(v, t, path);

        auto narrowed = v.to_int64();
        if (!narrowed) {
            return std::unexpected(ConversionError::make(
                code::out_of_range, v, t, path,
                fmt::format("{} does not fit in a native int", v.repr())
            ));
        }
        return value{ *narrowed };
    }

    expected_t<value> real_handler::convert(const TypeConverter&, const value& v, const type& t, path_t& path) const {
        if (v.is_real()) return v;
        auto widened = v.to_double();
        if (!widened) return mismatch(v, t, path);
        return value{ *widened };
    }

    // ------------------------------------------------------------
    // Unions
    // ------------------------------------------------------------

    bool union_handler::is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        for (const auto& branch : t.args()) {
            if (conv.is_instance_recursive(v, branch, path)) return true;
        }
        return false;
    }

    expected_void union_handler::ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (is_instance(conv, v, t, path)) return {};
        return std::unexpected(ConversionError::make(
            code::no_union_branch, v, t, path,
            fmt::format("{} matches no branch of {} (tried {})", v.repr(), t.repr(), branch_list(t))
        ));
    }

    expected_t<value> union_handler::convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        // A branch the value already belongs to wins over an earlier branch
        // that would merely accept it after conversion.
        for (const auto& branch : t.args()) {
            if (!conv.is_instance_recursive(v, branch, path)) continue;
            auto converted = conv.convert_recursive(v, branch, path);
            if (converted) return converted;
        }

        for (const auto& branch : t.args()) {
            auto converted = conv.convert_recursive(v, branch, path);
            if (converted) return converted;
        }

        return std::unexpected(ConversionError::make(
            code::no_union_branch, v, t, path,
            fmt::format("cannot convert {} to any branch of {} (tried {})", v.repr(), t.repr(), branch_list(t))
        ));
    }

    // ------------------------------------------------------------
    // Mappings
    // ------------------------------------------------------------

    bool mapping_handler::is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (!t.admits(v)) return false;
        if (!t.is_parameterized()) return true;

        const type& key_t = t.args()[0];
        const type& val_t = t.args()[1];
        for (const auto& [k, item] : v.members()) {
            PathGuard guard{ path, k };
            if (!conv.is_instance_recursive(k, key_t, path)) return false;
            if (!conv.is_instance_recursive(item, val_t, path)) return false;
        }
        return true;
    }

    expected_void mapping_handler::ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (!t.admits(v)) return mismatch(v, t, path);
        if (!t.is_parameterized()) return {};

        const type& key_t = t.args()[0];
        const type& val_t = t.args()[1];
        for (const auto& [k, item] : v.members()) {
            PathGuard guard{ path, k };
            if (auto ok = conv.ensure_recursive(k, key_t, path); !ok) return ok;
            if (auto ok = conv.ensure_recursive(item, val_t, path); !ok) return ok;
        }
        return {};
    }

    expected_t<value> dict_handler::convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (!v.is_mapping()) return mismatch(v, t, path);

        if (!t.is_parameterized()) {
            if (v.type() == kind::dict) return v;
            return value::dict(v.members());
        }

        const type& key_t = t.args()[0];
        const type& val_t = t.args()[1];
        entries out;
        out.reserve(v.size());
        for (const auto& [k, item] : v.members()) {
            PathGuard guard{ path, k };
            auto ck = conv.convert_recursive(k, key_t, path);
            if (!ck) return ck;
            auto cv = conv.convert_recursive(item, val_t, path);
            if (!cv) return cv;
            out.emplace_back(std::move(*ck), std::move(*cv));
        }
        return value::dict(std::move(out));
    }

    // ------------------------------------------------------------
    // Collections
    // ------------------------------------------------------------

    namespace {

        // Calls fn(segment, element) for every element, mapping keys standing
        // in for the elements of a mapping. Stops at the first falsy result.
        template<class R, class Fn>
        R for_each_element(const value& v, R done, Fn&& fn) {
            if (v.is_mapping()) {
                for (const auto& [k, item] : v.members()) {
                    if (R r = fn(k, k); !r) return r;
                }
                return done;
            }
            const auto& elems = v.elements();
            for (std::size_t i = 0; i < elems.size(); i++) {
                if (R r = fn(value{ i }, elems[i]); !r) return r;
            }
            return done;
        }

    } // namespace

    bool collection_handler::is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (!t.admits(v)) return false;
        if (!t.is_parameterized()) return true;

        const type& elem_t = t.args()[0];
        return for_each_element(v, true, [&](const value& segment, const value& elem) {
            PathGuard guard{ path, segment };
            return conv.is_instance_recursive(elem, elem_t, path);
        });
    }

    expected_void collection_handler::ensure_is_instance(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (!t.admits(v)) return mismatch(v, t, path);
        if (!t.is_parameterized()) return {};

        const type& elem_t = t.args()[0];
        return for_each_element(v, expected_void{}, [&](const value& segment, const value& elem) {
            PathGuard guard{ path, segment };
            return conv.ensure_recursive(elem, elem_t, path);
        });
    }

    expected_t<value> list_handler::convert(const TypeConverter& conv, const value& v, const type& t, path_t& path) const {
        if (!v.is_sequence()) return mismatch(v, t, path);

        if (!t.is_parameterized()) {
            if (v.type() == kind::list) return v;
            return value::list(v.elements());
        }

        const type& elem_t = t.args()[0];
        const auto& elems = v.elements();
        items out;
        out.reserve(elems.size());
        for (std::size_t i = 0; i < elems.size(); i++) {
            PathGuard guard{ path, value{ i } };
            auto converted = conv.convert_recursive(elems[i], elem_t, path);
            if (!converted) return converted;
            out.push_back(std::move(*converted));
        }
        return value::list(std::move(out));
    }

    // ------------------------------------------------------------
    // Tuples
    // ------------------------------------------------------------

    bool unsupported_handler::is_instance(const TypeConverter&, const value&, const type&, path_t&) const {
        return false;
    }

    expected_void unsupported_handler::ensure_is_instance(const TypeConverter&, const value& v, const type& t, path_t& path) const {
        return not_implemented(v, t, path);
    }

    expected_t<value> unsupported_handler::convert(const TypeConverter&, const value& v, const type& t, path_t& path) const {
        return not_implemented(v, t, path);
    }

} // namespace Conform
