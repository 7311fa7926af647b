#include "binary_navigator.hpp"
#include "binary_encoding.hpp"
#include "exception.hpp"

#include <string>

namespace docjson {

    namespace markers = binary::type_marker;

    JsonBinaryNavigator::JsonBinaryNavigator(std::span<const std::byte> buffer, const JsonStringDictionary* dictionary)
        : m_buffer(buffer), m_dictionary(dictionary) {
        if (m_buffer.empty() ||
            std::to_integer<uint8_t>(m_buffer[0]) != static_cast<uint8_t>(JsonSerializationFormat::Binary)) {
            throw docjson::exception(JsonErrorCode::InvalidBinaryFormat, "missing binary format marker");
        }
        if (m_buffer.size() <= binary::type_marker_length) {
            throw docjson::exception(JsonErrorCode::InvalidBinaryFormat, "document has no value");
        }
    }

    JsonNavigatorNode JsonBinaryNavigator::get_root_node() const {
        return JsonNavigatorNode{binary::type_marker_length};
    }

    std::span<const std::byte> JsonBinaryNavigator::value_at(JsonNavigatorNode node) const {
        if (node.value == 0 || node.value >= m_buffer.size()) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "unknown node " + std::to_string(node.value));
        }
        std::span<const std::byte> rest = m_buffer.subspan(node.value);
        return rest.first(binary::get_value_length(rest));
    }

    JsonNodeType JsonBinaryNavigator::get_node_type(JsonNavigatorNode node) const {
        if (node.value == 0 || node.value >= m_buffer.size()) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "unknown node " + std::to_string(node.value));
        }
        return binary::get_node_type(std::to_integer<uint8_t>(m_buffer[node.value]));
    }

    std::span<const std::byte> JsonBinaryNavigator::require_array(JsonNavigatorNode node) const {
        std::span<const std::byte> value = value_at(node);
        if (!markers::is_array(std::to_integer<uint8_t>(value[0]))) {
            throw docjson::exception(JsonErrorCode::TypeMismatch,
                                     "node is " + std::string(to_string(get_node_type(node))) + ", not an array");
        }
        return value;
    }

    std::span<const std::byte> JsonBinaryNavigator::require_object(JsonNavigatorNode node) const {
        std::span<const std::byte> value = value_at(node);
        if (!markers::is_object(std::to_integer<uint8_t>(value[0]))) {
            throw docjson::exception(JsonErrorCode::TypeMismatch,
                                     "node is " + std::string(to_string(get_node_type(node))) + ", not an object");
        }
        return value;
    }

    std::span<const std::byte> JsonBinaryNavigator::require_string(JsonNavigatorNode node) const {
        std::span<const std::byte> value = value_at(node);
        if (!markers::is_string(std::to_integer<uint8_t>(value[0]))) {
            throw docjson::exception(JsonErrorCode::TypeMismatch,
                                     "node is " + std::string(to_string(get_node_type(node))) + ", not a string");
        }
        return value;
    }

    std::vector<size_t> JsonBinaryNavigator::child_offsets(JsonNavigatorNode node,
                                                           std::span<const std::byte> container) const {
        size_t offset = binary::get_first_value_offset(std::to_integer<uint8_t>(container[0]));
        std::vector<size_t> offsets;
        while (offset < container.size()) {
            size_t length = binary::get_value_length(container.subspan(offset));
            if (offset + length > container.size()) {
                throw docjson::exception(JsonErrorCode::InvalidBinaryFormat,
                                         "item crosses the end of its container at offset " +
                                             std::to_string(node.value + offset));
            }
            offsets.push_back(node.value + offset);
            offset += length;
        }
        return offsets;
    }

    Number64 JsonBinaryNavigator::get_number_value(JsonNavigatorNode node) const {
        return binary::get_number_value(value_at(node));
    }

    std::string JsonBinaryNavigator::get_string_value(JsonNavigatorNode node) const {
        return std::string(binary::get_string_value(require_string(node), m_dictionary));
    }

    bool JsonBinaryNavigator::try_get_buffered_string_value(JsonNavigatorNode node, std::string_view& value) const {
        value = binary::get_string_value(require_string(node), m_dictionary);
        return true;
    }

    int8_t JsonBinaryNavigator::get_int8_value(JsonNavigatorNode node) const {
        return binary::get_int8_value(value_at(node));
    }

    int16_t JsonBinaryNavigator::get_int16_value(JsonNavigatorNode node) const {
        return binary::get_int16_value(value_at(node));
    }

    int32_t JsonBinaryNavigator::get_int32_value(JsonNavigatorNode node) const {
        return binary::get_int32_value(value_at(node));
    }

    int64_t JsonBinaryNavigator::get_int64_value(JsonNavigatorNode node) const {
        return binary::get_int64_value(value_at(node));
    }

    uint32_t JsonBinaryNavigator::get_uint32_value(JsonNavigatorNode node) const {
        return binary::get_uint32_value(value_at(node));
    }

    float JsonBinaryNavigator::get_float32_value(JsonNavigatorNode node) const {
        return binary::get_float32_value(value_at(node));
    }

    double JsonBinaryNavigator::get_float64_value(JsonNavigatorNode node) const {
        return binary::get_float64_value(value_at(node));
    }

    Guid JsonBinaryNavigator::get_guid_value(JsonNavigatorNode node) const {
        return binary::get_guid_value(value_at(node));
    }

    std::vector<std::byte> JsonBinaryNavigator::get_binary_value(JsonNavigatorNode node) const {
        std::span<const std::byte> value = binary::get_binary_value(value_at(node));
        return std::vector<std::byte>(value.begin(), value.end());
    }

    bool JsonBinaryNavigator::try_get_buffered_binary_value(JsonNavigatorNode node,
                                                            std::span<const std::byte>& value) const {
        value = binary::get_binary_value(value_at(node));
        return true;
    }

    size_t JsonBinaryNavigator::get_array_item_count(JsonNavigatorNode node) const {
        std::span<const std::byte> array = require_array(node);
        size_t count = 0;
        if (binary::try_get_serialized_count(array, count)) {
            return count;
        }
        return child_offsets(node, array).size();
    }

    JsonNavigatorNode JsonBinaryNavigator::get_array_item_at(JsonNavigatorNode node, size_t index) const {
        std::span<const std::byte> array = require_array(node);
        size_t offset = binary::get_first_value_offset(std::to_integer<uint8_t>(array[0]));
        for (size_t i = 0; offset < array.size(); ++i) {
            if (i == index) {
                return JsonNavigatorNode{node.value + offset};
            }
            offset += binary::get_value_length(array.subspan(offset));
        }
        throw docjson::exception(JsonErrorCode::IndexOutOfRange, "index " + std::to_string(index));
    }

    std::vector<JsonNavigatorNode> JsonBinaryNavigator::get_array_items(JsonNavigatorNode node) const {
        std::vector<JsonNavigatorNode> items;
        for (size_t offset : child_offsets(node, require_array(node))) {
            items.push_back(JsonNavigatorNode{offset});
        }
        return items;
    }

    size_t JsonBinaryNavigator::get_object_property_count(JsonNavigatorNode node) const {
        std::span<const std::byte> object = require_object(node);
        size_t count = 0;
        if (binary::try_get_serialized_count(object, count)) {
            return count;
        }
        return child_offsets(node, object).size() / 2;
    }

    bool JsonBinaryNavigator::try_get_object_property(JsonNavigatorNode node, std::string_view name,
                                                      ObjectProperty& property) const {
        std::vector<size_t> offsets = child_offsets(node, require_object(node));
        for (size_t i = 0; i + 1 < offsets.size(); i += 2) {
            if (binary::get_string_value(value_at(JsonNavigatorNode{offsets[i]}), m_dictionary) == name) {
                property = ObjectProperty{JsonNavigatorNode{offsets[i]}, JsonNavigatorNode{offsets[i + 1]}};
                return true;
            }
        }
        return false;
    }

    std::vector<ObjectProperty> JsonBinaryNavigator::get_object_properties(JsonNavigatorNode node) const {
        std::vector<size_t> offsets = child_offsets(node, require_object(node));
        std::vector<ObjectProperty> properties;
        properties.reserve(offsets.size() / 2);
        for (size_t i = 0; i + 1 < offsets.size(); i += 2) {
            properties.push_back(ObjectProperty{JsonNavigatorNode{offsets[i]}, JsonNavigatorNode{offsets[i + 1]}});
        }
        return properties;
    }

    bool JsonBinaryNavigator::try_get_buffered_raw_json(JsonNavigatorNode node, std::span<const std::byte>& raw) const {
        raw = value_at(node);
        return true;
    }

} // namespace docjson
