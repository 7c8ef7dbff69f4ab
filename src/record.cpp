#include "conform/record.hpp"
#include "conform/converter.hpp"
#include "conform/json.hpp"

#include <stdexcept>

#include <fmt/format.h>


namespace Conform {

    namespace {

        using code = ConversionError::code;

        const value* find_named(const named_values& args, std::string_view name) {
            for (const auto& [n, v] : args) {
                if (n == name) return std::addressof(v);
            }
            return nullptr;
        }

    } // namespace

    // ------------------------------------------------------------
    // record_type::builder
    // ------------------------------------------------------------

    record_type::builder::builder(std::string name)
        : m_Name{ std::move(name) } {}

    record_type::builder& record_type::builder::add(field f) {
        m_Fields.push_back(std::move(f));
        return *this;
    }

    record_type::builder& record_type::builder::json(json_support support) noexcept {
        m_Json = support;
        return *this;
    }

    std::shared_ptr<const record_type> record_type::builder::build() {
        if (m_Name.empty()) throw std::invalid_argument{ "Conform::record_type: record name must not be empty" };

        for (std::size_t i = 0; i < m_Fields.size(); i++) {
            if (m_Fields[i].name.empty()) {
                throw std::invalid_argument{ fmt::format("Conform::record_type: field {} of {} has no name", i, m_Name) };
            }
            for (std::size_t j = 0; j < i; j++) {
                if (m_Fields[j].name == m_Fields[i].name) {
                    throw std::invalid_argument{ fmt::format("Conform::record_type: {} declares field \"{}\" twice", m_Name, m_Fields[i].name) };
                }
            }
        }

        return std::make_shared<const record_type>(passkey{}, m_Name, m_Fields, m_Json);
    }

    // ------------------------------------------------------------
    // record_type
    // ------------------------------------------------------------

    record_type::record_type(passkey, std::string name, std::vector<field> fields, json_support json)
        : m_Name{ std::move(name) }, m_Fields{ std::move(fields) }, m_Json{ json } {}

    std::optional<std::size_t> record_type::index_of(std::string_view name) const noexcept {
        for (std::size_t i = 0; i < m_Fields.size(); i++) {
            if (m_Fields[i].name == name) return i;
        }
        return std::nullopt;
    }

    type record_type::descriptor() const {
        return type::record(shared_from_this());
    }

    expected_t<value> record_type::construct(const named_values& args) const {
        path_t path;
        return construct(args, default_converter(), path);
    }

    expected_t<value> record_type::construct(const named_values& args, const TypeConverter& conv, path_t& path) const {
        for (const auto& [name, v] : args) {
            if (index_of(name)) continue;
            return std::unexpected(ConversionError::make(
                code::unknown_field, value{ name }, descriptor(), path,
                fmt::format("{} has no field named \"{}\"", m_Name, name)
            ));
        }

        std::vector<value> values;
        values.reserve(m_Fields.size());
        for (const auto& f : m_Fields) {
            PathGuard guard{ path, value{ f.name } };

            const value* given = find_named(args, f.name);
            if (!given && f.default_value) given = std::addressof(*f.default_value);

            if (!given) {
                if (f.optional) {
                    values.emplace_back();
                    continue;
                }
                return std::unexpected(ConversionError::make(
                    code::missing_field, value{}, f.field_type, path,
                    fmt::format("{} is missing required field \"{}\"", m_Name, f.name)
                ));
            }

            auto converted = field_value(f, *given, conv, path);
            if (!converted) return converted;
            values.push_back(std::move(*converted));
        }

        return value{ std::make_shared<const record>(shared_from_this(), std::move(values)) };
    }

    expected_t<value> record_type::field_value(const field& f, const value& v, const TypeConverter& conv, path_t& path) const {
        if (f.optional && v.is_none()) return value{};
        if (f.convert_type) return conv.convert_recursive(v, f.field_type, path);
        if (f.validate_type) {
            auto ok = conv.ensure_recursive(v, f.field_type, path);
            if (!ok) return std::unexpected(std::move(ok.error()));
        }
        return v;
    }

    expected_t<value> record_type::from_serialized(const value& data, const JsonTypeConverter& conv, path_t& path) const {
        if (data.type() != kind::dict) {
            return std::unexpected(ConversionError::make(
                code::type_mismatch, data, descriptor(), path,
                fmt::format("expected an object for {}, got {}", m_Name, data.repr())
            ));
        }

        named_values args;
        args.reserve(m_Fields.size());
        for (const auto& f : m_Fields) {
            const value* item = data.find(value{ f.name });
            if (!item) continue;

            if (item->is_none() && f.optional) {
                args.emplace_back(f.name, value{});
                continue;
            }

            PathGuard guard{ path, value{ f.name } };
            auto converted = conv.convert_recursive(*item, f.field_type, path);
            if (!converted) return converted;
            args.emplace_back(f.name, std::move(*converted));
        }

        if (!conv.options().lenient) {
            for (const auto& [k, item] : data.members()) {
                if (k.is_text() && index_of(k.as_text())) continue;
                return std::unexpected(ConversionError::make(
                    code::unknown_field, k, descriptor(), path,
                    fmt::format("unknown key {} in data for {}", k.repr(), m_Name)
                ));
            }
        }

        return construct(args, conv, path);
    }

    // ------------------------------------------------------------
    // record
    // ------------------------------------------------------------

    record::record(std::shared_ptr<const record_type> schema, std::vector<value> values)
        : m_Schema{ std::move(schema) }, m_Values{ std::move(values) } {
        if (!m_Schema) throw std::invalid_argument{ "Conform::record: record type must not be null" };
        if (m_Values.size() != m_Schema->fields().size()) {
            throw std::invalid_argument{ fmt::format(
                "Conform::record: {} has {} fields, got {} values",
                m_Schema->name(), m_Schema->fields().size(), m_Values.size()) };
        }
    }

    const value* record::get(std::string_view name) const noexcept {
        auto idx = m_Schema->index_of(name);
        if (!idx) return nullptr;
        return std::addressof(m_Values[*idx]);
    }

    std::string record::repr() const {
        std::string out = m_Schema->name();
        out += '(';
        const auto& fields = m_Schema->fields();
        for (std::size_t i = 0; i < fields.size(); i++) {
            if (i) out += ", ";
            out += fields[i].name;
            out += '=';
            out += m_Values[i].repr();
        }
        out += ')';
        return out;
    }

    expected_t<tree> record::to_serialized(const JsonConverter& json, path_t& path) const {
        if (!m_Schema->supports_to()) {
            return std::unexpected(ConversionError::make(
                ConversionError::code::not_serializable, value{}, m_Schema->descriptor(), path,
                fmt::format("instances of {} cannot be serialized", m_Schema->name())
            ));
        }

        tree out = tree::make_object(json.resource());
        const auto& fields = m_Schema->fields();
        for (std::size_t i = 0; i < fields.size(); i++) {
            if (!fields[i].serialize) continue;
            PathGuard guard{ path, value{ fields[i].name } };
            auto converted = json.to_serialized(m_Values[i], path);
            if (!converted) return converted;
            out[fields[i].name] = std::move(*converted);
        }
        return out;
    }

    bool operator==(const record& lhs, const record& rhs) {
        return lhs.m_Schema == rhs.m_Schema && lhs.m_Values == rhs.m_Values;
    }

} // namespace Conform
