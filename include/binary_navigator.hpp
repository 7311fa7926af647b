#ifndef DOCJSON_BINARY_NAVIGATOR_HPP
#define DOCJSON_BINARY_NAVIGATOR_HPP

#include "navigator.hpp"

namespace docjson {

    // Navigates the binary encoding in place. Node handles are byte offsets
    // of value markers, the root sits right after the format marker.
    // Property names report JsonNodeType::String.
    class JsonBinaryNavigator : public IJsonNavigator {
    public:
        // Throws InvalidBinaryFormat unless buffer starts with the binary
        // format marker and holds a root value.
        JsonBinaryNavigator(std::span<const std::byte> buffer, const JsonStringDictionary* dictionary);

        JsonSerializationFormat serialization_format() const override { return JsonSerializationFormat::Binary; }
        const JsonStringDictionary* string_dictionary() const override { return m_dictionary; }

        JsonNavigatorNode get_root_node() const override;
        JsonNodeType get_node_type(JsonNavigatorNode node) const override;

        Number64 get_number_value(JsonNavigatorNode node) const override;
        std::string get_string_value(JsonNavigatorNode node) const override;
        bool try_get_buffered_string_value(JsonNavigatorNode node, std::string_view& value) const override;
        int8_t get_int8_value(JsonNavigatorNode node) const override;
        int16_t get_int16_value(JsonNavigatorNode node) const override;
        int32_t get_int32_value(JsonNavigatorNode node) const override;
        int64_t get_int64_value(JsonNavigatorNode node) const override;
        uint32_t get_uint32_value(JsonNavigatorNode node) const override;
        float get_float32_value(JsonNavigatorNode node) const override;
        double get_float64_value(JsonNavigatorNode node) const override;
        Guid get_guid_value(JsonNavigatorNode node) const override;
        std::vector<std::byte> get_binary_value(JsonNavigatorNode node) const override;
        bool try_get_buffered_binary_value(JsonNavigatorNode node, std::span<const std::byte>& value) const override;

        size_t get_array_item_count(JsonNavigatorNode node) const override;
        JsonNavigatorNode get_array_item_at(JsonNavigatorNode node, size_t index) const override;
        std::vector<JsonNavigatorNode> get_array_items(JsonNavigatorNode node) const override;

        size_t get_object_property_count(JsonNavigatorNode node) const override;
        bool try_get_object_property(JsonNavigatorNode node, std::string_view name,
                                     ObjectProperty& property) const override;
        std::vector<ObjectProperty> get_object_properties(JsonNavigatorNode node) const override;

        bool try_get_buffered_raw_json(JsonNavigatorNode node, std::span<const std::byte>& raw) const override;

    private:
        std::span<const std::byte> value_at(JsonNavigatorNode node) const;
        std::span<const std::byte> require_array(JsonNavigatorNode node) const;
        std::span<const std::byte> require_object(JsonNavigatorNode node) const;
        std::span<const std::byte> require_string(JsonNavigatorNode node) const;

        // Offsets of the items of the container at node, names and values
        // alike for objects.
        std::vector<size_t> child_offsets(JsonNavigatorNode node, std::span<const std::byte> container) const;

        std::span<const std::byte> m_buffer;
        const JsonStringDictionary* m_dictionary;
    };

} // namespace docjson

#endif // DOCJSON_BINARY_NAVIGATOR_HPP
