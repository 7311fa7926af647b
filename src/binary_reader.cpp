#include "binary_reader.hpp"
#include "binary_encoding.hpp"
#include "exception.hpp"

#include <string>

namespace docjson {

    namespace {
        std::span<const std::byte> validated(std::span<const std::byte> buffer) {
            if (buffer.empty() ||
                std::to_integer<uint8_t>(buffer[0]) != static_cast<uint8_t>(JsonSerializationFormat::Binary)) {
                throw docjson::exception(JsonErrorCode::InvalidBinaryFormat, "missing binary format marker");
            }
            return buffer;
        }
    } // namespace

    JsonBinaryReader::JsonBinaryReader(std::span<const std::byte> buffer, const JsonStringDictionary* dictionary)
        : m_reader(validated(buffer)),
          m_state(true),
          m_dictionary(dictionary),
          m_token_start(0),
          m_token_end(0) {
        m_reader.advance(binary::type_marker_length);
    }

    bool JsonBinaryReader::read() {
        size_t position = m_reader.position();

        if (!m_scopes.empty()) {
            const ContainerScope& scope = m_scopes.back();
            if (position == scope.end) {
                bool is_array = scope.is_array;
                m_scopes.pop_back();
                m_token_start = position;
                m_token_end = position;
                m_state.register_token(is_array ? JsonTokenType::EndArray : JsonTokenType::EndObject);
                return true;
            }
            if (position > scope.end) {
                throw docjson::exception(JsonErrorCode::InvalidBinaryFormat,
                                         "value crosses the end of its container at offset " + std::to_string(position));
            }
        }

        if (m_reader.is_eof()) {
            if (!m_scopes.empty()) {
                throw docjson::exception(m_scopes.back().is_array ? JsonErrorCode::MissingEndArray
                                                                  : JsonErrorCode::MissingEndObject);
            }
            return false;
        }

        std::span<const std::byte> rest = m_reader.buffer().subspan(position);
        uint8_t marker = m_reader.peek();
        size_t length = binary::get_value_length(rest);

        if (!m_scopes.empty() && position + length > m_scopes.back().end) {
            throw docjson::exception(JsonErrorCode::InvalidBinaryFormat,
                                     "value crosses the end of its container at offset " + std::to_string(position));
        }

        m_token_start = position;
        m_token_end = position + length;

        JsonTokenType token_type;
        if (binary::type_marker::is_array(marker) || binary::type_marker::is_object(marker)) {
            bool is_array = binary::type_marker::is_array(marker);
            token_type = is_array ? JsonTokenType::BeginArray : JsonTokenType::BeginObject;
            m_state.register_token(token_type);
            m_scopes.push_back({position + length, is_array});
            m_reader.advance(binary::get_first_value_offset(marker));
            return true;
        }

        token_type = to_token_type(binary::get_node_type(marker));
        if (token_type == JsonTokenType::String && m_state.is_property_expected()) {
            token_type = JsonTokenType::FieldName;
        }
        m_state.register_token(token_type);
        m_reader.advance(length);
        return true;
    }

    Number64 JsonBinaryReader::get_number_value() const {
        require_token(JsonTokenType::Number);
        return binary::get_number_value(get_buffered_raw_json_token());
    }

    std::string JsonBinaryReader::get_string_value() const {
        require_string_token();
        return std::string(binary::get_string_value(get_buffered_raw_json_token(), m_dictionary));
    }

    bool JsonBinaryReader::try_get_buffered_string_value(std::string_view& value) const {
        require_string_token();
        value = binary::get_string_value(get_buffered_raw_json_token(), m_dictionary);
        return true;
    }

    int8_t JsonBinaryReader::get_int8_value() const {
        require_token(JsonTokenType::Int8);
        return binary::get_int8_value(get_buffered_raw_json_token());
    }

    int16_t JsonBinaryReader::get_int16_value() const {
        require_token(JsonTokenType::Int16);
        return binary::get_int16_value(get_buffered_raw_json_token());
    }

    int32_t JsonBinaryReader::get_int32_value() const {
        require_token(JsonTokenType::Int32);
        return binary::get_int32_value(get_buffered_raw_json_token());
    }

    int64_t JsonBinaryReader::get_int64_value() const {
        require_token(JsonTokenType::Int64);
        return binary::get_int64_value(get_buffered_raw_json_token());
    }

    uint32_t JsonBinaryReader::get_uint32_value() const {
        require_token(JsonTokenType::UInt32);
        return binary::get_uint32_value(get_buffered_raw_json_token());
    }

    float JsonBinaryReader::get_float32_value() const {
        require_token(JsonTokenType::Float32);
        return binary::get_float32_value(get_buffered_raw_json_token());
    }

    double JsonBinaryReader::get_float64_value() const {
        require_token(JsonTokenType::Float64);
        return binary::get_float64_value(get_buffered_raw_json_token());
    }

    Guid JsonBinaryReader::get_guid_value() const {
        require_token(JsonTokenType::Guid);
        return binary::get_guid_value(get_buffered_raw_json_token());
    }

    std::vector<std::byte> JsonBinaryReader::get_binary_value() const {
        require_token(JsonTokenType::Binary);
        std::span<const std::byte> value = binary::get_binary_value(get_buffered_raw_json_token());
        return std::vector<std::byte>(value.begin(), value.end());
    }

    std::span<const std::byte> JsonBinaryReader::get_buffered_raw_json_token() const {
        return m_reader.get_buffered_raw_json_token(m_token_start, m_token_end);
    }

    void JsonBinaryReader::require_token(JsonTokenType expected) const {
        if (current_token_type() != expected) {
            throw docjson::exception(JsonErrorCode::TypeMismatch,
                                     "current token is " + std::string(to_string(current_token_type())) + ", not " +
                                         std::string(to_string(expected)));
        }
    }

    void JsonBinaryReader::require_string_token() const {
        if (current_token_type() != JsonTokenType::FieldName) {
            require_token(JsonTokenType::String);
        }
    }

} // namespace docjson
