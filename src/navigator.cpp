#include "navigator.hpp"
#include "binary_navigator.hpp"
#include "exception.hpp"
#include "observability.hpp"
#include "text_navigator.hpp"
#include "writer.hpp"

#include <chrono>
#include <string>

namespace docjson {

    std::unique_ptr<IJsonNavigator> IJsonNavigator::create(std::span<const std::byte> buffer,
                                                           const JsonStringDictionary* dictionary) {
        if (buffer.empty()) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "buffer is empty");
        }

        auto start = std::chrono::steady_clock::now();
        std::unique_ptr<IJsonNavigator> navigator;
        if (std::to_integer<uint8_t>(buffer[0]) == static_cast<uint8_t>(JsonSerializationFormat::Binary)) {
            navigator = std::make_unique<JsonBinaryNavigator>(buffer, dictionary);
        } else {
            navigator = std::make_unique<JsonTextNavigator>(buffer);
        }
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);

        log_if_enabled(LogLevel::Debug,
                       std::string("Created ") + std::string(to_string(navigator->serialization_format())) +
                           " navigator over " + std::to_string(buffer.size()) + " bytes",
                       "NavigatorCreate", duration, 0);
        record_metric([](IMetrics& m) { return m.increment_operation_count("NavigatorCreate", "success"); });
        return navigator;
    }

    bool IJsonNavigator::can_copy_raw(const IJsonWriter& writer) const {
        return writer.serialization_format() == serialization_format() &&
               writer.string_dictionary() == string_dictionary();
    }

    void IJsonNavigator::write_field_name_to(JsonNavigatorNode name_node, IJsonWriter& writer) const {
        std::span<const std::byte> raw;
        if (can_copy_raw(writer) && try_get_buffered_raw_json(name_node, raw)) {
            writer.write_raw_json_token(JsonTokenType::FieldName, raw);
            return;
        }

        std::string_view buffered;
        if (try_get_buffered_string_value(name_node, buffered)) {
            writer.write_field_name(buffered);
        } else {
            writer.write_field_name(get_string_value(name_node));
        }
    }

    void IJsonNavigator::write_to(JsonNavigatorNode node, IJsonWriter& writer) const {
        JsonNodeType node_type = get_node_type(node);
        switch (node_type) {
            case JsonNodeType::Null:
                writer.write_null_value();
                return;
            case JsonNodeType::False:
                writer.write_bool_value(false);
                return;
            case JsonNodeType::True:
                writer.write_bool_value(true);
                return;
            case JsonNodeType::FieldName:
                write_field_name_to(node, writer);
                return;
            default:
                break;
        }

        std::span<const std::byte> raw;
        if (can_copy_raw(writer) && try_get_buffered_raw_json(node, raw)) {
            writer.write_raw_json_token(to_token_type(node_type), raw);
            return;
        }

        switch (node_type) {
            case JsonNodeType::Number64:
                writer.write_number64_value(get_number_value(node));
                break;
            case JsonNodeType::String: {
                std::string_view buffered;
                if (try_get_buffered_string_value(node, buffered)) {
                    writer.write_string_value(buffered);
                } else {
                    writer.write_string_value(get_string_value(node));
                }
                break;
            }
            case JsonNodeType::Array:
                writer.write_array_start();
                for (JsonNavigatorNode item : get_array_items(node)) {
                    write_to(item, writer);
                }
                writer.write_array_end();
                break;
            case JsonNodeType::Object:
                writer.write_object_start();
                for (const ObjectProperty& property : get_object_properties(node)) {
                    write_field_name_to(property.name_node, writer);
                    write_to(property.value_node, writer);
                }
                writer.write_object_end();
                break;
            case JsonNodeType::Int8:
                writer.write_int8_value(get_int8_value(node));
                break;
            case JsonNodeType::Int16:
                writer.write_int16_value(get_int16_value(node));
                break;
            case JsonNodeType::Int32:
                writer.write_int32_value(get_int32_value(node));
                break;
            case JsonNodeType::Int64:
                writer.write_int64_value(get_int64_value(node));
                break;
            case JsonNodeType::UInt32:
                writer.write_uint32_value(get_uint32_value(node));
                break;
            case JsonNodeType::Float32:
                writer.write_float32_value(get_float32_value(node));
                break;
            case JsonNodeType::Float64:
                writer.write_float64_value(get_float64_value(node));
                break;
            case JsonNodeType::Guid:
                writer.write_guid_value(get_guid_value(node));
                break;
            case JsonNodeType::Binary: {
                std::span<const std::byte> buffered;
                if (try_get_buffered_binary_value(node, buffered)) {
                    writer.write_binary_value(buffered);
                } else {
                    std::vector<std::byte> value = get_binary_value(node);
                    writer.write_binary_value(value);
                }
                break;
            }
            default:
                throw docjson::exception(JsonErrorCode::InvalidArgument,
                                         "cannot write node " + std::string(to_string(node_type)));
        }
    }

} // namespace docjson
