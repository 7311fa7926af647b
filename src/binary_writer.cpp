#include "binary_writer.hpp"
#include "binary_encoding.hpp"
#include "exception.hpp"
#include "observability.hpp"

#include <chrono>
#include <cstring>
#include <limits>
#include <string>

namespace docjson {

    namespace markers = binary::type_marker;

    JsonBinaryWriter::JsonBinaryWriter(const JsonWriterOptions& options)
        : m_writer(options.initial_capacity),
          m_state(false),
          m_serialize_count(options.serialize_count),
          m_reservation_size(binary::type_marker_length + binary::one_byte_length +
                             (options.serialize_count ? binary::one_byte_length : 0)),
          m_dictionary(options.string_dictionary) {
        // format discriminator first, then the outermost context
        m_writer.write_byte(static_cast<uint8_t>(JsonSerializationFormat::Binary));
        m_contexts.push_back({m_writer.position(), 0});
    }

    void JsonBinaryWriter::write_object_start() {
        write_container_start(false);
    }

    void JsonBinaryWriter::write_object_end() {
        write_container_end(false);
    }

    void JsonBinaryWriter::write_array_start() {
        write_container_start(true);
    }

    void JsonBinaryWriter::write_array_end() {
        write_container_end(true);
    }

    void JsonBinaryWriter::write_field_name(std::string_view field_name) {
        write_field_name_or_string(true, field_name);
    }

    void JsonBinaryWriter::write_string_value(std::string_view value) {
        write_field_name_or_string(false, value);
    }

    void JsonBinaryWriter::write_number64_value(const Number64& value) {
        if (value.is_integer()) {
            write_integer(value.to_int64());
        } else {
            write_double(value.to_double());
        }
        increment_count();
    }

    void JsonBinaryWriter::write_bool_value(bool value) {
        m_state.register_token(value ? JsonTokenType::True : JsonTokenType::False);
        m_writer.write_byte(value ? markers::true_ : markers::false_);
        increment_count();
    }

    void JsonBinaryWriter::write_null_value() {
        m_state.register_token(JsonTokenType::Null);
        m_writer.write_byte(markers::null);
        increment_count();
    }

    void JsonBinaryWriter::write_int8_value(int8_t value) {
        m_state.register_token(JsonTokenType::Int8);
        m_writer.write_byte(markers::int8);
        m_writer.write_little_endian(value);
        increment_count();
    }

    void JsonBinaryWriter::write_int16_value(int16_t value) {
        m_state.register_token(JsonTokenType::Int16);
        m_writer.write_byte(markers::int16);
        m_writer.write_little_endian(value);
        increment_count();
    }

    void JsonBinaryWriter::write_int32_value(int32_t value) {
        m_state.register_token(JsonTokenType::Int32);
        m_writer.write_byte(markers::int32);
        m_writer.write_little_endian(value);
        increment_count();
    }

    void JsonBinaryWriter::write_int64_value(int64_t value) {
        m_state.register_token(JsonTokenType::Int64);
        m_writer.write_byte(markers::int64);
        m_writer.write_little_endian(value);
        increment_count();
    }

    void JsonBinaryWriter::write_uint32_value(uint32_t value) {
        m_state.register_token(JsonTokenType::UInt32);
        m_writer.write_byte(markers::uint32);
        m_writer.write_little_endian(value);
        increment_count();
    }

    void JsonBinaryWriter::write_float32_value(float value) {
        m_state.register_token(JsonTokenType::Float32);
        m_writer.write_byte(markers::float32);
        m_writer.write_little_endian(value);
        increment_count();
    }

    void JsonBinaryWriter::write_float64_value(double value) {
        m_state.register_token(JsonTokenType::Float64);
        m_writer.write_byte(markers::float64);
        m_writer.write_little_endian(value);
        increment_count();
    }

    void JsonBinaryWriter::write_guid_value(const Guid& value) {
        m_state.register_token(JsonTokenType::Guid);
        m_writer.write_byte(markers::guid);
        m_writer.write(std::span<const std::byte>(value.bytes));
        increment_count();
    }

    void JsonBinaryWriter::write_binary_value(std::span<const std::byte> value) {
        m_state.register_token(JsonTokenType::Binary);

        size_t length = value.size();
        if (length <= std::numeric_limits<uint8_t>::max()) {
            m_writer.write_byte(markers::binary_1byte_length);
            m_writer.write_little_endian(static_cast<uint8_t>(length));
        } else if (length <= std::numeric_limits<uint16_t>::max()) {
            m_writer.write_byte(markers::binary_2byte_length);
            m_writer.write_little_endian(static_cast<uint16_t>(length));
        } else if (length <= std::numeric_limits<uint32_t>::max()) {
            m_writer.write_byte(markers::binary_4byte_length);
            m_writer.write_little_endian(static_cast<uint32_t>(length));
        } else {
            throw docjson::exception(JsonErrorCode::InvalidLength, "binary value of " + std::to_string(length) + " bytes");
        }

        m_writer.write(value);
        increment_count();
    }

    void JsonBinaryWriter::write_raw_json_token(JsonTokenType token_type, std::span<const std::byte> raw_token) {
        if (raw_token.empty()) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "raw token is empty");
        }
        if (binary::get_value_length(raw_token) != raw_token.size()) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "raw token is not exactly one binary value");
        }

        switch (token_type) {
            case JsonTokenType::BeginArray:
                m_state.register_token(JsonTokenType::BeginArray);
                m_state.register_token(JsonTokenType::EndArray);
                break;
            case JsonTokenType::BeginObject:
                m_state.register_token(JsonTokenType::BeginObject);
                m_state.register_token(JsonTokenType::EndObject);
                break;
            case JsonTokenType::String:
            case JsonTokenType::Number:
            case JsonTokenType::True:
            case JsonTokenType::False:
            case JsonTokenType::Null:
            case JsonTokenType::FieldName:
            case JsonTokenType::Int8:
            case JsonTokenType::Int16:
            case JsonTokenType::Int32:
            case JsonTokenType::Int64:
            case JsonTokenType::UInt32:
            case JsonTokenType::Float32:
            case JsonTokenType::Float64:
            case JsonTokenType::Guid:
            case JsonTokenType::Binary:
                m_state.register_token(token_type);
                break;
            default:
                throw docjson::exception(JsonErrorCode::InvalidArgument,
                                         "cannot write a raw " + std::string(to_string(token_type)) + " token");
        }

        m_writer.write(raw_token);
        if (token_type != JsonTokenType::FieldName) {
            increment_count();
        }
    }

    std::span<const std::byte> JsonBinaryWriter::get_result() const {
        if (m_contexts.size() > 1) {
            throw docjson::exception(JsonErrorCode::NotComplete);
        }
        if (m_writer.position() == binary::type_marker_length) {
            // only the format byte
            return {};
        }
        return m_writer.written();
    }

    void JsonBinaryWriter::write_container_start(bool is_array) {
        m_state.register_token(is_array ? JsonTokenType::BeginArray : JsonTokenType::BeginObject);
        m_contexts.push_back({m_writer.position(), 0});

        // marker, one byte length and optionally one byte count; patched on close
        for (size_t i = 0; i < m_reservation_size; ++i) {
            m_writer.write_byte(0);
        }
    }

    void JsonBinaryWriter::write_container_end(bool is_array) {
        m_state.register_token(is_array ? JsonTokenType::EndArray : JsonTokenType::EndObject);
        ContainerContext context = m_contexts.back();
        m_contexts.pop_back();

        size_t marker_index = context.offset;
        size_t payload_index = marker_index + m_reservation_size;
        size_t payload_length = m_writer.position() - payload_index;

        if (context.count == 0) {
            m_writer.set_position(marker_index);
            m_writer.write_byte(is_array ? markers::empty_array : markers::empty_object);
        } else if (context.count == 1) {
            // drop the reserved length bytes
            std::memmove(m_writer.data() + marker_index + binary::type_marker_length,
                         m_writer.data() + payload_index, payload_length);
            m_writer.set_position(marker_index);
            m_writer.write_byte(is_array ? markers::single_item_array : markers::single_property_object);
            m_writer.set_position(marker_index + binary::type_marker_length + payload_length);
        } else {
            size_t width = 0;
            uint8_t marker = is_array ? markers::array_1byte_length : markers::object_1byte_length;
            if (payload_length <= std::numeric_limits<uint8_t>::max()) {
                width = binary::one_byte_length;
            } else if (payload_length <= std::numeric_limits<uint16_t>::max()) {
                width = binary::two_byte_length;
                marker += 1;
            } else if (payload_length <= std::numeric_limits<uint32_t>::max()) {
                width = binary::four_byte_length;
                marker += 2;
            } else {
                throw docjson::exception(JsonErrorCode::InvalidLength,
                                         "container payload of " + std::to_string(payload_length) + " bytes");
            }
            if (m_serialize_count) {
                marker += 3;
            }

            size_t header = binary::type_marker_length + width * (m_serialize_count ? 2 : 1);
            if (header > m_reservation_size) {
                m_writer.ensure_remaining_buffer_space(header - m_reservation_size);
                std::memmove(m_writer.data() + marker_index + header, m_writer.data() + payload_index, payload_length);

                log_if_enabled(LogLevel::Debug,
                               "Shifted " + std::to_string(payload_length) + " payload bytes for a " +
                                   std::to_string(width) + " byte length.",
                               "ContainerEnd", std::chrono::microseconds(0), marker_index);
                record_metric([](IMetrics& metrics) { return metrics.increment_payload_shifts(); });
            }

            m_writer.set_position(marker_index);
            m_writer.write_byte(marker);
            switch (width) {
                case binary::one_byte_length:
                    m_writer.write_little_endian(static_cast<uint8_t>(payload_length));
                    if (m_serialize_count) m_writer.write_little_endian(static_cast<uint8_t>(context.count));
                    break;
                case binary::two_byte_length:
                    m_writer.write_little_endian(static_cast<uint16_t>(payload_length));
                    if (m_serialize_count) m_writer.write_little_endian(static_cast<uint16_t>(context.count));
                    break;
                default:
                    m_writer.write_little_endian(static_cast<uint32_t>(payload_length));
                    if (m_serialize_count) m_writer.write_little_endian(static_cast<uint32_t>(context.count));
                    break;
            }
            m_writer.set_position(marker_index + header + payload_length);
        }

        increment_count();
    }

    void JsonBinaryWriter::write_field_name_or_string(bool is_field_name, std::string_view value) {
        m_state.register_token(is_field_name ? JsonTokenType::FieldName : JsonTokenType::String);

        // the user dictionary only applies to field names
        binary::MultiByteTypeMarker multi_byte_marker;
        if (binary::try_get_encoded_string_type_marker(value, is_field_name ? m_dictionary : nullptr, multi_byte_marker)) {
            m_writer.write_byte(multi_byte_marker.one);
            if (multi_byte_marker.length == 2) {
                m_writer.write_byte(multi_byte_marker.two);
            }
        } else {
            uint8_t marker = markers::encoded_string_length_marker(value.size());
            if (marker != markers::invalid) {
                m_writer.write_byte(marker);
            } else if (value.size() < std::numeric_limits<uint8_t>::max()) {
                m_writer.write_byte(markers::string_1byte_length);
                m_writer.write_little_endian(static_cast<uint8_t>(value.size()));
            } else if (value.size() < std::numeric_limits<uint16_t>::max()) {
                m_writer.write_byte(markers::string_2byte_length);
                m_writer.write_little_endian(static_cast<uint16_t>(value.size()));
            } else if (value.size() <= std::numeric_limits<uint32_t>::max()) {
                m_writer.write_byte(markers::string_4byte_length);
                m_writer.write_little_endian(static_cast<uint32_t>(value.size()));
            } else {
                throw docjson::exception(JsonErrorCode::InvalidLength, "string of " + std::to_string(value.size()) + " bytes");
            }
            m_writer.write(value);
        }

        // a field name is counted together with its value
        if (!is_field_name) {
            increment_count();
        }
    }

    void JsonBinaryWriter::write_integer(int64_t value) {
        m_state.register_token(JsonTokenType::Number);

        if (markers::is_encoded_number_literal(value)) {
            m_writer.write_byte(static_cast<uint8_t>(markers::literal_int_min + value));
        } else if (value >= 0) {
            if (value <= std::numeric_limits<uint8_t>::max()) {
                m_writer.write_byte(markers::number_uint8);
                m_writer.write_little_endian(static_cast<uint8_t>(value));
            } else if (value <= std::numeric_limits<int16_t>::max()) {
                m_writer.write_byte(markers::number_int16);
                m_writer.write_little_endian(static_cast<int16_t>(value));
            } else if (value <= std::numeric_limits<int32_t>::max()) {
                m_writer.write_byte(markers::number_int32);
                m_writer.write_little_endian(static_cast<int32_t>(value));
            } else {
                m_writer.write_byte(markers::number_int64);
                m_writer.write_little_endian(value);
            }
        } else {
            if (value < std::numeric_limits<int32_t>::min()) {
                m_writer.write_byte(markers::number_int64);
                m_writer.write_little_endian(value);
            } else if (value < std::numeric_limits<int16_t>::min()) {
                m_writer.write_byte(markers::number_int32);
                m_writer.write_little_endian(static_cast<int32_t>(value));
            } else {
                m_writer.write_byte(markers::number_int16);
                m_writer.write_little_endian(static_cast<int16_t>(value));
            }
        }
    }

    void JsonBinaryWriter::write_double(double value) {
        m_state.register_token(JsonTokenType::Number);
        m_writer.write_byte(markers::number_double);
        m_writer.write_little_endian(value);
    }

} // namespace docjson
