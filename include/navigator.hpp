#ifndef DOCJSON_NAVIGATOR_HPP
#define DOCJSON_NAVIGATOR_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "guid.hpp"
#include "number64.hpp"
#include "string_dictionary.hpp"
#include "token.hpp"

namespace docjson {

    class IJsonWriter;

    // Opaque handle to a node of one navigator. Binary navigators store the
    // byte offset of the node's marker, text navigators an index into their
    // parsed node table. Handles are only meaningful to the navigator that
    // produced them.
    struct JsonNavigatorNode {
        size_t value = 0;

        bool operator==(const JsonNavigatorNode& other) const { return value == other.value; }
        bool operator!=(const JsonNavigatorNode& other) const { return value != other.value; }
    };

    struct ObjectProperty {
        JsonNavigatorNode name_node;
        JsonNavigatorNode value_node;
    };

    // Random access over a complete document. Node accessors throw
    // TypeMismatch when the node is of another type and IndexOutOfRange for
    // item indexes past the end.
    class IJsonNavigator {
    public:
        virtual ~IJsonNavigator() = default;

        // Throws InvalidArgument for an empty buffer. The buffer, and the
        // dictionary when given, must outlive the navigator.
        static std::unique_ptr<IJsonNavigator> create(std::span<const std::byte> buffer,
                                                      const JsonStringDictionary* dictionary = nullptr);

        virtual JsonSerializationFormat serialization_format() const = 0;
        virtual const JsonStringDictionary* string_dictionary() const = 0;

        virtual JsonNavigatorNode get_root_node() const = 0;
        virtual JsonNodeType get_node_type(JsonNavigatorNode node) const = 0;

        virtual Number64 get_number_value(JsonNavigatorNode node) const = 0;
        virtual std::string get_string_value(JsonNavigatorNode node) const = 0;
        virtual bool try_get_buffered_string_value(JsonNavigatorNode node, std::string_view& value) const = 0;
        virtual int8_t get_int8_value(JsonNavigatorNode node) const = 0;
        virtual int16_t get_int16_value(JsonNavigatorNode node) const = 0;
        virtual int32_t get_int32_value(JsonNavigatorNode node) const = 0;
        virtual int64_t get_int64_value(JsonNavigatorNode node) const = 0;
        virtual uint32_t get_uint32_value(JsonNavigatorNode node) const = 0;
        virtual float get_float32_value(JsonNavigatorNode node) const = 0;
        virtual double get_float64_value(JsonNavigatorNode node) const = 0;
        virtual Guid get_guid_value(JsonNavigatorNode node) const = 0;
        virtual std::vector<std::byte> get_binary_value(JsonNavigatorNode node) const = 0;
        virtual bool try_get_buffered_binary_value(JsonNavigatorNode node, std::span<const std::byte>& value) const = 0;

        virtual size_t get_array_item_count(JsonNavigatorNode node) const = 0;
        virtual JsonNavigatorNode get_array_item_at(JsonNavigatorNode node, size_t index) const = 0;
        virtual std::vector<JsonNavigatorNode> get_array_items(JsonNavigatorNode node) const = 0;

        virtual size_t get_object_property_count(JsonNavigatorNode node) const = 0;
        // First property with that name, compared after unescaping.
        virtual bool try_get_object_property(JsonNavigatorNode node, std::string_view name,
                                             ObjectProperty& property) const = 0;
        virtual std::vector<ObjectProperty> get_object_properties(JsonNavigatorNode node) const = 0;

        // Encoded bytes of the node, containers included whole.
        virtual bool try_get_buffered_raw_json(JsonNavigatorNode node, std::span<const std::byte>& raw) const = 0;

        // Writes the node and everything below it. Raw bytes are copied when
        // the writer uses this navigator's format and string dictionary.
        void write_to(JsonNavigatorNode node, IJsonWriter& writer) const;

    private:
        bool can_copy_raw(const IJsonWriter& writer) const;
        void write_field_name_to(JsonNavigatorNode name_node, IJsonWriter& writer) const;
    };

} // namespace docjson

#endif // DOCJSON_NAVIGATOR_HPP
