#include "reader.hpp"
#include "binary_reader.hpp"
#include "exception.hpp"
#include "observability.hpp"
#include "text_reader.hpp"
#include "writer.hpp"

#include <chrono>
#include <string>

namespace docjson {

    std::unique_ptr<IJsonReader> IJsonReader::create(std::span<const std::byte> buffer,
                                                     const JsonStringDictionary* dictionary) {
        if (!buffer.empty() &&
            std::to_integer<uint8_t>(buffer[0]) == static_cast<uint8_t>(JsonSerializationFormat::Binary)) {
            return std::make_unique<JsonBinaryReader>(buffer, dictionary);
        }
        return std::make_unique<JsonTextReader>(buffer);
    }

    void IJsonReader::write_current_token(IJsonWriter& writer) const {
        JsonTokenType token_type = current_token_type();

        switch (token_type) {
            case JsonTokenType::NotStarted:
                throw docjson::exception(JsonErrorCode::InvalidArgument, "no current token");
            case JsonTokenType::BeginArray:
                writer.write_array_start();
                return;
            case JsonTokenType::EndArray:
                writer.write_array_end();
                return;
            case JsonTokenType::BeginObject:
                writer.write_object_start();
                return;
            case JsonTokenType::EndObject:
                writer.write_object_end();
                return;
            default:
                break;
        }

        if (writer.serialization_format() == serialization_format() &&
            writer.string_dictionary() == string_dictionary()) {
            writer.write_raw_json_token(token_type, get_buffered_raw_json_token());
            return;
        }

        switch (token_type) {
            case JsonTokenType::String:
            case JsonTokenType::FieldName: {
                std::string_view buffered;
                std::string unescaped;
                if (!try_get_buffered_string_value(buffered)) {
                    unescaped = get_string_value();
                    buffered = unescaped;
                }
                if (token_type == JsonTokenType::FieldName) {
                    writer.write_field_name(buffered);
                } else {
                    writer.write_string_value(buffered);
                }
                break;
            }
            case JsonTokenType::Number:
                writer.write_number64_value(get_number_value());
                break;
            case JsonTokenType::True:
                writer.write_bool_value(true);
                break;
            case JsonTokenType::False:
                writer.write_bool_value(false);
                break;
            case JsonTokenType::Null:
                writer.write_null_value();
                break;
            case JsonTokenType::Int8:
                writer.write_int8_value(get_int8_value());
                break;
            case JsonTokenType::Int16:
                writer.write_int16_value(get_int16_value());
                break;
            case JsonTokenType::Int32:
                writer.write_int32_value(get_int32_value());
                break;
            case JsonTokenType::Int64:
                writer.write_int64_value(get_int64_value());
                break;
            case JsonTokenType::UInt32:
                writer.write_uint32_value(get_uint32_value());
                break;
            case JsonTokenType::Float32:
                writer.write_float32_value(get_float32_value());
                break;
            case JsonTokenType::Float64:
                writer.write_float64_value(get_float64_value());
                break;
            case JsonTokenType::Guid:
                writer.write_guid_value(get_guid_value());
                break;
            case JsonTokenType::Binary: {
                std::vector<std::byte> value = get_binary_value();
                writer.write_binary_value(value);
                break;
            }
            default:
                throw docjson::exception(JsonErrorCode::InvalidArgument,
                                         "cannot write token " + std::string(to_string(token_type)));
        }
    }

    void IJsonReader::write_all(IJsonWriter& writer) {
        auto start = std::chrono::steady_clock::now();
        size_t tokens = 0;
        while (read()) {
            write_current_token(writer);
            ++tokens;
        }
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        log_if_enabled(LogLevel::Debug, "Copied " + std::to_string(tokens) + " tokens", "ReaderWriteAll", duration,
                       writer.current_length());
        record_metric([&](IMetrics& m) {
            return m.record_latency("ReaderWriteAll", std::chrono::duration<double>(duration).count());
        });
    }

} // namespace docjson
