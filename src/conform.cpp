#include "conform/conform.hpp"

#include <charconv>
#include <cmath>
#include <ostream>
#include <sstream>


namespace Conform {

    namespace detail {
        void dump_impl(const tree& t, std::ostream& os, const WriteOptions& opts, std::size_t depth);
    } // namespace detail

    bool is_instance(const value& v, const type& t) {
        return default_converter().is_instance(v, t);
    }

    expected_void ensure_is_instance(const value& v, const type& t) {
        return default_converter().ensure_is_instance(v, t);
    }

    expected_t<value> convert(const value& v, const type& t) {
        return default_converter().convert(v, t);
    }

    expected_t<tree> to_serialized(const value& v) {
        return default_json_converter().to_serialized(v);
    }

    expected_t<value> from_serialized(const type& t, const tree& data, const DecodeOptions& opts) {
        return default_json_converter().from_serialized(t, data, opts);
    }

    std::string dump(const tree& t, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::dump_impl(t, oss, opts, 0);
        return oss.str();
    }

    void dump(const tree& t, std::ostream& os, const WriteOptions& opts) {
        detail::dump_impl(t, os, opts, 0);
    }

    // ================================
    // Tree writer
    // ================================

    namespace detail {

        void dump_string(std::string_view s, std::ostream& os) {
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) {
                        static constexpr char hex[] = "0123456789ABCDEF";
                        os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    } else {
                        os.put(static_cast<char>(c));
                    }
                    break;
                }
            }
            os.put('"');
        }

        void dump_newline_indent(std::ostream& os, std::size_t depth, const WriteOptions& opts) {
            if (!opts.pretty) return;
            os.put('\n');
            for (std::size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        // Shortest text that reads back as the same double, always with a
        // fraction or exponent so it is not mistaken for an integer.
        void dump_real(double d, std::ostream& os) {
            if (!std::isfinite(d)) {
                os << "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) {
                os << "0.0";
                return;
            }
            std::string_view text{ buf, static_cast<std::size_t>(ptr - buf) };
            os << text;
            if (text.find_first_of(".eE") == std::string_view::npos) os << ".0";
        }

        void dump_impl(const tree& t, std::ostream& os, const WriteOptions& opts, std::size_t depth) {
            switch (t.type()) {
            case tree_kind::null: os << "null"; return;
            case tree_kind::boolean: os << (t.as_bool() ? "true" : "false"); return;
            case tree_kind::integer: os << t.as_integer(); return;
            case tree_kind::real: dump_real(t.as_real(), os); return;
            case tree_kind::string: dump_string(t.as_string(), os); return;
            case tree_kind::array: {
                const auto& arr = t.as_array();
                os.put('[');
                if (arr.empty()) {
                    os.put(']');
                    return;
                }
                for (std::size_t i = 0; i < arr.size(); i++) {
                    if (i) os.put(',');
                    dump_newline_indent(os, depth + 1, opts);
                    dump_impl(arr[i], os, opts, depth + 1);
                }
                dump_newline_indent(os, depth, opts);
                os.put(']');
                return;
            }
            case tree_kind::object: {
                const auto& obj = t.as_object();
                os.put('{');
                if (obj.empty()) {
                    os.put('}');
                    return;
                }
                bool first = true;
                for (const auto& [k, item] : obj) {
                    if (!first) os.put(',');
                    first = false;
                    dump_newline_indent(os, depth + 1, opts);
                    dump_string(k, os);
                    os << (opts.pretty ? ": " : ":");
                    dump_impl(item, os, opts, depth + 1);
                }
                dump_newline_indent(os, depth, opts);
                os.put('}');
                return;
            }
            }
        }

    } // namespace detail

} // namespace Conform
