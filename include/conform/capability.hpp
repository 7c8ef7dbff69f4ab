#pragma once


/*
    ---------------------------------------------------
    Conform capabilities - Opt-in serialization hooks
    ---------------------------------------------------
    Types opt into the serialization bridge at definition time by deriving
    from one of two interfaces:

    - `serializable`:
        * Implemented by values that know their own serialized form
          (records, and any `Conform::opaque` subclass that wants it)
        * `to_serialized` receives the converter so nested values are
          emitted with the same rules and the same path
    - `deserializable`:
        * Implemented by descriptors' schemas that can rebuild an instance
          from lifted serialized data (record types)
        * `from_serialized` receives the decoding converter, which carries
          the `DecodeOptions` of the current call

    There is no retroactive registration: a class either derives from the
    interface or is not serializable.
*/

#include "conform/config.hpp"
#include "conform/error.hpp"
#include "conform/tree.hpp"
#include "conform/value.hpp"

namespace Conform {

    class JsonConverter;
    class JsonTypeConverter;

    /// @ingroup Conform
    /// @brief Capability of producing a serialized tree
    class CONFORM_API serializable {
    public:
        virtual ~serializable() = default;

        /// @param json  Converter used for nested values
        /// @param path  Location of this value; extend it while recursing
        [[nodiscard]] virtual expected_t<tree> to_serialized(const JsonConverter& json, path_t& path) const = 0;
    };

    /// @ingroup Conform
    /// @brief Capability of rebuilding a value from lifted serialized data
    class CONFORM_API deserializable {
    public:
        virtual ~deserializable() = default;

        /// @param data  Serialized data lifted into a runtime value
        /// @param conv  Decoding converter for nested values
        /// @param path  Location of @p data; extend it while recursing
        [[nodiscard]] virtual expected_t<value> from_serialized(
            const value& data, const JsonTypeConverter& conv, path_t& path) const = 0;
    };

} // namespace Conform
