#include "conform/json.hpp"
#include "conform/capability.hpp"
#include "conform/record.hpp"
#include "conform/registry.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>


namespace Conform {

    namespace {

        using code = ConversionError::code;

        constexpr std::string_view whitespace = " \t\n\r\f\v";

        // Decimal text to integer. Surrounding whitespace and a leading sign
        // are accepted; the digits must fill the rest of the string.
        std::optional<std::int64_t> parse_decimal(std::string_view s) {
            auto first_pos = s.find_first_not_of(whitespace);
            if (first_pos == std::string_view::npos) return std::nullopt;
            s = s.substr(first_pos, s.find_last_not_of(whitespace) - first_pos + 1);

            const bool plus = s.front() == '+';
            if (plus) s.remove_prefix(1);
            if (s.empty()) return std::nullopt;
            if (s.front() == '-') {
                if (plus) return std::nullopt;
            } else if (s.front() < '0' || s.front() > '9') {
                return std::nullopt;
            }

            std::int64_t out = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
            return out;
        }

        // Same mapping with every text key read as a decimal integer.
        std::optional<value> integer_keyed(const value& data) {
            entries out;
            out.reserve(data.size());
            for (const auto& [k, item] : data.members()) {
                if (k.is_integral_like()) {
                    out.emplace_back(k, item);
                    continue;
                }
                if (!k.is_text()) return std::nullopt;
                auto parsed = parse_decimal(k.as_text());
                if (!parsed) return std::nullopt;
                out.emplace_back(value{ *parsed }, item);
            }
            return value::dict(std::move(out));
        }

        bool wants_integer_keys(const type& t) {
            return t.shape() == category::mapping
                && mask_contains(t.runtime_base(), kind::dict)
                && t.is_parameterized()
                && t.args()[0].shape() == category::integral;
        }

    } // namespace

    // ------------------------------------------------------------
    // JsonTypeConverter
    // ------------------------------------------------------------

    JsonTypeConverter::JsonTypeConverter(HandlerRegistry& registry, DecodeOptions opts) noexcept
        : TypeConverter{ registry }, m_Options{ opts } {}

    expected_t<value> JsonTypeConverter::convert_recursive(const value& v, const type& t, path_t& path) const {
        if (wants_integer_keys(t) && v.is_mapping()) {
            auto rekeyed = integer_keyed(v);
            if (!rekeyed) {
                return std::unexpected(ConversionError::make(
                    code::invalid_key, v, t, path,
                    fmt::format("cannot convert object keys of {} to integers", v.repr())
                ));
            }
            return TypeConverter::convert_recursive(*rekeyed, t, path);
        }

        if (t.shape() == category::record && t.record_schema()->supports_from()) {
            if (t.admits(v)) return v;
            return t.record_schema()->from_serialized(v, *this, path);
        }

        return TypeConverter::convert_recursive(v, t, path);
    }

    // ------------------------------------------------------------
    // JsonConverter
    // ------------------------------------------------------------

    JsonConverter::JsonConverter(HandlerRegistry& registry, std::pmr::memory_resource* res) noexcept
        : m_Registry{ registry }, m_MemRes{ res } {}

    expected_t<tree> JsonConverter::to_serialized(const value& v) const {
        path_t path;
        return to_serialized(v, path);
    }

    expected_t<tree> JsonConverter::to_serialized(const value& v, path_t& path) const {
        switch (v.type()) {
        case kind::none: return tree{ nullptr, m_MemRes };
        case kind::boolean: return tree{ v.as_bool(), m_MemRes };
        case kind::integer: return tree{ v.as_integer(), m_MemRes };
        case kind::real: return tree{ v.as_real(), m_MemRes };
        case kind::text: return tree{ std::string_view{ v.as_text() }, m_MemRes };
        case kind::record: return v.as_record().to_serialized(*this, path);
        case kind::opaque:
            if (auto* s = dynamic_cast<const serializable*>(&v.as_opaque())) return s->to_serialized(*this, path);
            break;
        case kind::fixed_integer: {
            auto narrowed = v.to_int64();
            if (!narrowed) {
                return std::unexpected(ConversionError::make(
                    code::out_of_range, v, type::integral(), path,
                    fmt::format("{} does not fit in a serialized integer", v.repr())
                ));
            }
            return tree{ *narrowed, m_MemRes };
        }
        case kind::fixed_real:
            return tree{ *v.to_double(), m_MemRes };
        case kind::dict:
        case kind::frozen_dict:
            return mapping_to_serialized(v, path);
        case kind::list:
        case kind::tuple:
        case kind::set:
        case kind::frozen_set: {
            tree out = tree::make_array(m_MemRes);
            const auto& elems = v.elements();
            for (std::size_t i = 0; i < elems.size(); i++) {
                PathGuard guard{ path, value{ i } };
                auto item = to_serialized(elems[i], path);
                if (!item) return item;
                out.push_back(std::move(*item));
            }
            return out;
        }
        }

        return std::unexpected(ConversionError::make(
            code::not_serializable, v, type::any(), path,
            fmt::format("cannot serialize {}", v.repr())
        ));
    }

    expected_t<tree> JsonConverter::mapping_to_serialized(const value& v, path_t& path) const {
        enum class key_kind { unknown, text, integral };

        tree out = tree::make_object(m_MemRes);
        key_kind keys = key_kind::unknown;

        for (const auto& [k, item] : v.members()) {
            if (keys == key_kind::unknown) {
                if (k.is_text()) keys = key_kind::text;
                else if (k.is_integral_like()) keys = key_kind::integral;
            }

            std::string key;
            if (keys == key_kind::text && k.is_text()) {
                key = k.as_text();
            } else if (keys == key_kind::integral && k.is_integral_like()) {
                key = k.is_integer()
                    ? fmt::format("{}", k.as_integer())
                    : std::visit([](auto i) { return fmt::format("{}", i); }, k.as_fixed_integer());
            } else {
                return std::unexpected(ConversionError::make(
                    code::invalid_key, k, type::any(), path,
                    "mapping keys must be str or int"
                ));
            }

            PathGuard guard{ path, k };
            auto converted = to_serialized(item, path);
            if (!converted) return converted;
            out[key] = std::move(*converted);
        }
        return out;
    }

    expected_t<value> JsonConverter::from_serialized(const type& t, const tree& data, const DecodeOptions& opts) const {
        JsonTypeConverter conv{ m_Registry, opts };
        return conv.convert(lift(data), t);
    }

    value JsonConverter::lift(const tree& data) {
        switch (data.type()) {
        case tree_kind::null: return value{};
        case tree_kind::boolean: return value{ data.as_bool() };
        case tree_kind::integer: return value{ data.as_integer() };
        case tree_kind::real: return value{ data.as_real() };
        case tree_kind::string: return value{ std::string_view{ data.as_string() } };
        case tree_kind::array: {
            items out;
            out.reserve(data.size());
            for (const auto& item : data.as_array()) out.push_back(lift(item));
            return value::list(std::move(out));
        }
        case tree_kind::object: {
            entries out;
            out.reserve(data.size());
            for (const auto& [k, item] : data.as_object()) {
                out.emplace_back(value{ std::string_view{ k } }, lift(item));
            }
            return value::dict(std::move(out));
        }
        }
        return value{};
    }

    const JsonConverter& default_json_converter() {
        static const JsonConverter converter{ default_registry() };
        return converter;
    }

} // namespace Conform
