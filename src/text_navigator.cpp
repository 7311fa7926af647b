#include "text_navigator.hpp"
#include "exception.hpp"
#include "text_parser.hpp"
#include "text_reader.hpp"

#include <string>

namespace docjson {

    namespace {
        JsonNodeType node_type_of(JsonTokenType token_type) {
            switch (token_type) {
                case JsonTokenType::BeginArray: return JsonNodeType::Array;
                case JsonTokenType::BeginObject: return JsonNodeType::Object;
                case JsonTokenType::String: return JsonNodeType::String;
                case JsonTokenType::Number: return JsonNodeType::Number64;
                case JsonTokenType::True: return JsonNodeType::True;
                case JsonTokenType::False: return JsonNodeType::False;
                case JsonTokenType::Null: return JsonNodeType::Null;
                case JsonTokenType::FieldName: return JsonNodeType::FieldName;
                case JsonTokenType::Int8: return JsonNodeType::Int8;
                case JsonTokenType::Int16: return JsonNodeType::Int16;
                case JsonTokenType::Int32: return JsonNodeType::Int32;
                case JsonTokenType::Int64: return JsonNodeType::Int64;
                case JsonTokenType::UInt32: return JsonNodeType::UInt32;
                case JsonTokenType::Float32: return JsonNodeType::Float32;
                case JsonTokenType::Float64: return JsonNodeType::Float64;
                case JsonTokenType::Guid: return JsonNodeType::Guid;
                case JsonTokenType::Binary: return JsonNodeType::Binary;
                default:
                    throw docjson::exception(JsonErrorCode::InvalidArgument,
                                             "token " + std::string(to_string(token_type)) + " is not a node");
            }
        }
    } // namespace

    JsonTextNavigator::JsonTextNavigator(std::span<const std::byte> buffer) : m_buffer(buffer) {
        JsonTextReader reader(buffer);
        std::vector<size_t> open;

        while (reader.read()) {
            JsonTokenType token_type = reader.current_token_type();
            if (token_type == JsonTokenType::EndArray || token_type == JsonTokenType::EndObject) {
                m_nodes[open.back()].end = reader.token_end();
                open.pop_back();
                continue;
            }

            size_t index = m_nodes.size();
            m_nodes.push_back(
                TextNode{node_type_of(token_type), reader.token_start(), reader.token_end(), reader.token_escaped(), {}});
            if (!open.empty()) {
                m_nodes[open.back()].children.push_back(index);
            }
            if (token_type == JsonTokenType::BeginArray || token_type == JsonTokenType::BeginObject) {
                open.push_back(index);
            }
        }

        if (m_nodes.empty()) {
            throw docjson::exception(JsonErrorCode::NotComplete, "document has no value");
        }
    }

    const JsonTextNavigator::TextNode& JsonTextNavigator::node_at(JsonNavigatorNode node) const {
        if (node.value >= m_nodes.size()) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "unknown node " + std::to_string(node.value));
        }
        return m_nodes[node.value];
    }

    const JsonTextNavigator::TextNode& JsonTextNavigator::require_node(JsonNavigatorNode node,
                                                                       JsonNodeType expected) const {
        const TextNode& text_node = node_at(node);
        if (text_node.type != expected) {
            throw docjson::exception(JsonErrorCode::TypeMismatch, "node is " + std::string(to_string(text_node.type)) +
                                                                      ", not " + std::string(to_string(expected)));
        }
        return text_node;
    }

    std::string_view JsonTextNavigator::text_of(const TextNode& node) const {
        return text::as_string_view(m_buffer.subspan(node.start, node.end - node.start));
    }

    Number64 JsonTextNavigator::get_number_value(JsonNavigatorNode node) const {
        return text::get_number_value(text_of(require_node(node, JsonNodeType::Number64)));
    }

    std::string JsonTextNavigator::get_string_value(JsonNavigatorNode node) const {
        const TextNode& text_node = node_at(node);
        if (text_node.type != JsonNodeType::FieldName) {
            require_node(node, JsonNodeType::String);
        }
        return text::get_string_value(text_of(text_node));
    }

    bool JsonTextNavigator::try_get_buffered_string_value(JsonNavigatorNode node, std::string_view& value) const {
        const TextNode& text_node = node_at(node);
        if (text_node.type != JsonNodeType::FieldName) {
            require_node(node, JsonNodeType::String);
        }
        if (text_node.escaped) {
            return false;
        }
        std::string_view token = text_of(text_node);
        value = token.substr(1, token.size() - 2);
        return true;
    }

    int8_t JsonTextNavigator::get_int8_value(JsonNavigatorNode node) const {
        return text::get_int8_value(text_of(require_node(node, JsonNodeType::Int8)));
    }

    int16_t JsonTextNavigator::get_int16_value(JsonNavigatorNode node) const {
        return text::get_int16_value(text_of(require_node(node, JsonNodeType::Int16)));
    }

    int32_t JsonTextNavigator::get_int32_value(JsonNavigatorNode node) const {
        return text::get_int32_value(text_of(require_node(node, JsonNodeType::Int32)));
    }

    int64_t JsonTextNavigator::get_int64_value(JsonNavigatorNode node) const {
        return text::get_int64_value(text_of(require_node(node, JsonNodeType::Int64)));
    }

    uint32_t JsonTextNavigator::get_uint32_value(JsonNavigatorNode node) const {
        return text::get_uint32_value(text_of(require_node(node, JsonNodeType::UInt32)));
    }

    float JsonTextNavigator::get_float32_value(JsonNavigatorNode node) const {
        return text::get_float32_value(text_of(require_node(node, JsonNodeType::Float32)));
    }

    double JsonTextNavigator::get_float64_value(JsonNavigatorNode node) const {
        return text::get_float64_value(text_of(require_node(node, JsonNodeType::Float64)));
    }

    Guid JsonTextNavigator::get_guid_value(JsonNavigatorNode node) const {
        return text::get_guid_value(text_of(require_node(node, JsonNodeType::Guid)));
    }

    std::vector<std::byte> JsonTextNavigator::get_binary_value(JsonNavigatorNode node) const {
        return text::get_binary_value(text_of(require_node(node, JsonNodeType::Binary)));
    }

    bool JsonTextNavigator::try_get_buffered_binary_value(JsonNavigatorNode node,
                                                          std::span<const std::byte>&) const {
        // base64 text has to be decoded
        require_node(node, JsonNodeType::Binary);
        return false;
    }

    size_t JsonTextNavigator::get_array_item_count(JsonNavigatorNode node) const {
        return require_node(node, JsonNodeType::Array).children.size();
    }

    JsonNavigatorNode JsonTextNavigator::get_array_item_at(JsonNavigatorNode node, size_t index) const {
        const TextNode& array = require_node(node, JsonNodeType::Array);
        if (index >= array.children.size()) {
            throw docjson::exception(JsonErrorCode::IndexOutOfRange,
                                     "index " + std::to_string(index) + " of " + std::to_string(array.children.size()));
        }
        return JsonNavigatorNode{array.children[index]};
    }

    std::vector<JsonNavigatorNode> JsonTextNavigator::get_array_items(JsonNavigatorNode node) const {
        const TextNode& array = require_node(node, JsonNodeType::Array);
        std::vector<JsonNavigatorNode> items;
        items.reserve(array.children.size());
        for (size_t child : array.children) {
            items.push_back(JsonNavigatorNode{child});
        }
        return items;
    }

    size_t JsonTextNavigator::get_object_property_count(JsonNavigatorNode node) const {
        return require_node(node, JsonNodeType::Object).children.size() / 2;
    }

    bool JsonTextNavigator::try_get_object_property(JsonNavigatorNode node, std::string_view name,
                                                    ObjectProperty& property) const {
        const TextNode& object = require_node(node, JsonNodeType::Object);
        for (size_t i = 0; i + 1 < object.children.size(); i += 2) {
            const TextNode& name_node = m_nodes[object.children[i]];
            bool matches;
            if (name_node.escaped) {
                matches = text::get_string_value(text_of(name_node)) == name;
            } else {
                std::string_view token = text_of(name_node);
                matches = token.substr(1, token.size() - 2) == name;
            }
            if (matches) {
                property = ObjectProperty{JsonNavigatorNode{object.children[i]}, JsonNavigatorNode{object.children[i + 1]}};
                return true;
            }
        }
        return false;
    }

    std::vector<ObjectProperty> JsonTextNavigator::get_object_properties(JsonNavigatorNode node) const {
        const TextNode& object = require_node(node, JsonNodeType::Object);
        std::vector<ObjectProperty> properties;
        properties.reserve(object.children.size() / 2);
        for (size_t i = 0; i + 1 < object.children.size(); i += 2) {
            properties.push_back(
                ObjectProperty{JsonNavigatorNode{object.children[i]}, JsonNavigatorNode{object.children[i + 1]}});
        }
        return properties;
    }

    bool JsonTextNavigator::try_get_buffered_raw_json(JsonNavigatorNode node, std::span<const std::byte>& raw) const {
        const TextNode& text_node = node_at(node);
        raw = m_buffer.subspan(text_node.start, text_node.end - text_node.start);
        return true;
    }

} // namespace docjson
