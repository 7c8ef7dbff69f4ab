#pragma once


/*
    -----------------------------------------------
    Conform::record_type - Declared record schemas
    -----------------------------------------------
    A record type is a named, closed, ordered list of fields. Instances
    (`Conform::record`) hold one value per field and are carried by
    `Conform::value` like any other runtime value.

    ------
    Fields
    ------
    Each `field` carries:
    - `name`: unique, non-empty
    - `field_type`: the declared descriptor
    - `default_value`: used when construction omits the field
    - `optional`: none is accepted as-is, bypassing conversion and
      validation; an optional field without a default defaults to none
    - `validate_type`: check the value against `field_type`
    - `convert_type`: convert the value to `field_type` (takes precedence
      over `validate_type`; conversion fails on incompatible values anyway)
    - `serialize`: include the field in the serialized form

    ------------
    Construction
    ------------
    `record_type::builder("Point").add(...).json(json_support::both).build()`
    validates the schema and throws `std::invalid_argument` when the name is
    empty or a field name is empty or repeated.

    `record_type::construct(named values)` builds an instance:
    - an undeclared name fails with `unknown_field`
    - a field without a value, default or optional flag fails with
      `missing_field`
    - every value (defaults included) goes through the field's conversion
      or validation

    -------------
    Serialization
    -------------
    - `json_support::to` / `both`: instances serialize to an object with one
      key per field whose `serialize` flag is set
    - `json_support::from` / `both`: the record type rebuilds instances from
      serialized objects. Absent keys fall back to defaults, an optional field
      given null stays none, and leftover keys fail with `unknown_field`
      unless decoding is lenient
    - A record type without `from` support is only matched structurally
      when decoding

    Records are equality comparable. There is no ordering.
*/

/// @defgroup ConformRecord Records
/// @ingroup Conform

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "conform/capability.hpp"
#include "conform/config.hpp"
#include "conform/error.hpp"
#include "conform/type.hpp"
#include "conform/value.hpp"

namespace Conform {

    class TypeConverter;

    /// @ingroup ConformRecord
    /// @brief Which serialization directions a record type supports
    enum class json_support : uint8_t {
        none,
        to,
        from,
        both,
    };

    /// @ingroup ConformRecord
    /// @brief Declaration of one record field
    struct field {
        std::string name;
        type field_type{};
        std::optional<value> default_value{};
        bool optional = false;
        bool validate_type = true;
        bool convert_type = true;
        bool serialize = true;
    };

    /// @ingroup ConformRecord
    /// @brief Field values passed to `record_type::construct`, by name
    using named_values = std::vector<std::pair<std::string, value>>;

    /// @ingroup ConformRecord
    /// @brief Immutable record schema. Always held by `std::shared_ptr`.
    class CONFORM_API record_type final
        : public deserializable, public std::enable_shared_from_this<record_type> {
    public:
        class builder;

    private:
        class passkey {
            friend class record_type::builder;
            passkey() = default;
        };

    public:
        class CONFORM_API builder {
        public:
            explicit builder(std::string name);

            builder& add(field f);
            builder& json(json_support support) noexcept;

            /// @throws std::invalid_argument on an empty record name or an
            ///         empty or repeated field name
            [[nodiscard]] std::shared_ptr<const record_type> build();

        private:
            std::string m_Name;
            std::vector<field> m_Fields;
            json_support m_Json = json_support::none;
        };

        /// @brief Use `builder`; the key is only available to it
        record_type(passkey, std::string name, std::vector<field> fields, json_support json);

        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }
        [[nodiscard]] const std::vector<field>& fields() const noexcept { return m_Fields; }
        [[nodiscard]] json_support json() const noexcept { return m_Json; }

        [[nodiscard]] bool supports_to() const noexcept {
            return m_Json == json_support::to || m_Json == json_support::both;
        }

        [[nodiscard]] bool supports_from() const noexcept {
            return m_Json == json_support::from || m_Json == json_support::both;
        }

        /// @return Index of the field named @p name, or nothing
        [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const noexcept;

        /// @brief Descriptor matching instances of this record type
        [[nodiscard]] type descriptor() const;

        /// @brief Builds an instance with the default converter
        [[nodiscard]] expected_t<value> construct(const named_values& args) const;

        /// @brief Builds an instance, converting field values with @p conv
        [[nodiscard]] expected_t<value> construct(const named_values& args, const TypeConverter& conv, path_t& path) const;

        [[nodiscard]] expected_t<value> from_serialized(
            const value& data, const JsonTypeConverter& conv, path_t& path) const override;

    private:
        [[nodiscard]] expected_t<value> field_value(
            const field& f, const value& v, const TypeConverter& conv, path_t& path) const;

        std::string m_Name;
        std::vector<field> m_Fields;
        json_support m_Json;
    };

    /// @ingroup ConformRecord
    /// @brief Instance of a record type
    class CONFORM_API record final : public serializable {
    public:
        /// @details Prefer `record_type::construct`, which converts and
        ///          validates. @p values must hold one value per field.
        record(std::shared_ptr<const record_type> schema, std::vector<value> values);

        [[nodiscard]] const std::shared_ptr<const record_type>& schema() const noexcept { return m_Schema; }
        [[nodiscard]] const std::vector<value>& values() const noexcept { return m_Values; }

        /// @return The value of field @p name, or nullptr if undeclared
        [[nodiscard]] const value* get(std::string_view name) const noexcept;

        /// @brief `Point(x=1, y=2)`
        [[nodiscard]] std::string repr() const;

        [[nodiscard]] expected_t<tree> to_serialized(const JsonConverter& json, path_t& path) const override;

        friend bool operator==(const record& lhs, const record& rhs);

    private:
        std::shared_ptr<const record_type> m_Schema;
        std::vector<value> m_Values;
    };

} // namespace Conform
