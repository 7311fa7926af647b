#ifndef DOCJSON_TEXT_NAVIGATOR_HPP
#define DOCJSON_TEXT_NAVIGATOR_HPP

#include <vector>

#include "navigator.hpp"

namespace docjson {

    // Parses the text once with JsonTextReader and keeps a table of node
    // spans. Node handles are indexes into that table, the root is 0.
    // Property names are nodes of type FieldName.
    class JsonTextNavigator : public IJsonNavigator {
    public:
        explicit JsonTextNavigator(std::span<const std::byte> buffer);

        JsonSerializationFormat serialization_format() const override { return JsonSerializationFormat::Text; }
        const JsonStringDictionary* string_dictionary() const override { return nullptr; }

        JsonNavigatorNode get_root_node() const override { return JsonNavigatorNode{0}; }
        JsonNodeType get_node_type(JsonNavigatorNode node) const override { return node_at(node).type; }

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
        struct TextNode {
            JsonNodeType type;
            size_t start;
            size_t end;
            bool escaped;
            // objects alternate name and value nodes
            std::vector<size_t> children;
        };

        const TextNode& node_at(JsonNavigatorNode node) const;
        const TextNode& require_node(JsonNavigatorNode node, JsonNodeType expected) const;
        std::string_view text_of(const TextNode& node) const;

        std::span<const std::byte> m_buffer;
        std::vector<TextNode> m_nodes;
    };

} // namespace docjson

#endif // DOCJSON_TEXT_NAVIGATOR_HPP
