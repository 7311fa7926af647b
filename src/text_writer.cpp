#include "text_writer.hpp"
#include "exception.hpp"
#include "utils/base64.hpp"

#include <charconv>
#include <cmath>
#include <cstring>
#include <string>

namespace docjson {

    namespace {
        constexpr uint64_t ones = 0x0101010101010101ULL;
        constexpr uint64_t highs = 0x8080808080808080ULL;

        // Nonzero when any byte of x is zero.
        constexpr uint64_t has_zero_byte(uint64_t x) {
            return (x - ones) & ~x & highs;
        }

        constexpr uint64_t has_byte(uint64_t x, uint8_t b) {
            return has_zero_byte(x ^ (ones * b));
        }

        // Nonzero when any byte of x is below b (b <= 128).
        constexpr uint64_t has_less(uint64_t x, uint8_t b) {
            return (x - ones * b) & ~x & highs;
        }

        constexpr bool needs_escaping(uint8_t c) {
            return c == '"' || c == '\\' || c < 0x20;
        }

        constexpr char hex_digit(unsigned value) {
            return static_cast<char>(value < 10 ? '0' + value : 'A' + value - 10);
        }

        constexpr std::string_view not_a_number = "\"NaN\"";
        constexpr std::string_view positive_infinity = "\"Infinity\"";
        constexpr std::string_view negative_infinity = "\"-Infinity\"";
    } // namespace

    size_t index_of_character_that_needs_escaping(std::string_view value) {
        size_t index = 0;
        for (; index + 8 <= value.size(); index += 8) {
            uint64_t chunk;
            std::memcpy(&chunk, value.data() + index, sizeof(chunk));
            if (has_byte(chunk, '"') | has_byte(chunk, '\\') | has_less(chunk, 0x20)) {
                break;
            }
        }
        for (; index < value.size(); ++index) {
            if (needs_escaping(static_cast<uint8_t>(value[index]))) {
                return index;
            }
        }
        return value.size();
    }

    JsonTextWriter::JsonTextWriter(const JsonWriterOptions& options)
        : m_writer(options.initial_capacity), m_state(false), m_first_value(true) {}

    void JsonTextWriter::write_object_start() {
        m_state.register_token(JsonTokenType::BeginObject);
        prefix_member_separator();
        m_writer.write_byte('{');
        m_first_value = true;
    }

    void JsonTextWriter::write_object_end() {
        m_state.register_token(JsonTokenType::EndObject);
        m_writer.write_byte('}');
        // the next value needs a separator
        m_first_value = false;
    }

    void JsonTextWriter::write_array_start() {
        m_state.register_token(JsonTokenType::BeginArray);
        prefix_member_separator();
        m_writer.write_byte('[');
        m_first_value = true;
    }

    void JsonTextWriter::write_array_end() {
        m_state.register_token(JsonTokenType::EndArray);
        m_writer.write_byte(']');
        m_first_value = false;
    }

    void JsonTextWriter::write_field_name(std::string_view field_name) {
        m_state.register_token(JsonTokenType::FieldName);
        prefix_member_separator();
        // no separator between a name and its value
        m_first_value = true;

        m_writer.write_byte('"');
        write_escaped_string(field_name);
        m_writer.write_byte('"');
        m_writer.write_byte(':');
    }

    void JsonTextWriter::write_string_value(std::string_view value) {
        m_state.register_token(JsonTokenType::String);
        prefix_member_separator();

        m_writer.write_byte('"');
        write_escaped_string(value);
        m_writer.write_byte('"');
    }

    void JsonTextWriter::write_number64_value(const Number64& value) {
        m_state.register_token(JsonTokenType::Number);
        prefix_member_separator();

        if (value.is_integer()) {
            write_integer(value.to_int64());
            return;
        }

        double d = value.to_double();
        if (std::isnan(d)) {
            m_writer.write(not_a_number);
        } else if (std::isinf(d)) {
            m_writer.write(d < 0 ? negative_infinity : positive_infinity);
        } else {
            write_float(d);
        }
    }

    void JsonTextWriter::write_bool_value(bool value) {
        m_state.register_token(value ? JsonTokenType::True : JsonTokenType::False);
        prefix_member_separator();
        m_writer.write(value ? std::string_view("true") : std::string_view("false"));
    }

    void JsonTextWriter::write_null_value() {
        m_state.register_token(JsonTokenType::Null);
        prefix_member_separator();
        m_writer.write(std::string_view("null"));
    }

    void JsonTextWriter::write_int8_value(int8_t value) {
        m_state.register_token(JsonTokenType::Int8);
        prefix_member_separator();
        m_writer.write_byte('I');
        write_integer(value);
    }

    void JsonTextWriter::write_int16_value(int16_t value) {
        m_state.register_token(JsonTokenType::Int16);
        prefix_member_separator();
        m_writer.write_byte('H');
        write_integer(value);
    }

    void JsonTextWriter::write_int32_value(int32_t value) {
        m_state.register_token(JsonTokenType::Int32);
        prefix_member_separator();
        m_writer.write_byte('L');
        write_integer(value);
    }

    void JsonTextWriter::write_int64_value(int64_t value) {
        m_state.register_token(JsonTokenType::Int64);
        prefix_member_separator();
        m_writer.write(std::string_view("LL"));
        write_integer(value);
    }

    void JsonTextWriter::write_uint32_value(uint32_t value) {
        m_state.register_token(JsonTokenType::UInt32);
        prefix_member_separator();
        m_writer.write(std::string_view("UL"));
        write_integer(value);
    }

    void JsonTextWriter::write_float32_value(float value) {
        if (!std::isfinite(value)) {
            throw docjson::exception(JsonErrorCode::InvalidNumber, "float32 value is not finite");
        }
        m_state.register_token(JsonTokenType::Float32);
        prefix_member_separator();
        m_writer.write_byte('S');
        write_float(value);
    }

    void JsonTextWriter::write_float64_value(double value) {
        if (!std::isfinite(value)) {
            throw docjson::exception(JsonErrorCode::InvalidNumber, "float64 value is not finite");
        }
        m_state.register_token(JsonTokenType::Float64);
        prefix_member_separator();
        m_writer.write_byte('D');
        write_float(value);
    }

    void JsonTextWriter::write_guid_value(const Guid& value) {
        m_state.register_token(JsonTokenType::Guid);
        prefix_member_separator();
        m_writer.write_byte('G');
        m_writer.write(value.to_string());
    }

    void JsonTextWriter::write_binary_value(std::span<const std::byte> value) {
        m_state.register_token(JsonTokenType::Binary);
        prefix_member_separator();
        m_writer.write_byte('B');
        m_writer.write(utils::base64_encode(value));
    }

    void JsonTextWriter::write_raw_json_token(JsonTokenType token_type, std::span<const std::byte> raw_token) {
        if (raw_token.empty()) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "raw token is empty");
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

        prefix_member_separator();
        m_writer.write(raw_token);
        if (token_type == JsonTokenType::FieldName) {
            m_first_value = true;
            m_writer.write_byte(':');
        }
    }

    void JsonTextWriter::prefix_member_separator() {
        if (!m_first_value) {
            m_writer.write_byte(',');
        }
        m_first_value = false;
    }

    void JsonTextWriter::write_escaped_string(std::string_view value) {
        while (!value.empty()) {
            size_t index = index_of_character_that_needs_escaping(value);
            m_writer.write(value.substr(0, index));
            if (index == value.size()) {
                return;
            }

            auto c = static_cast<uint8_t>(value[index]);
            value.remove_prefix(index + 1);

            m_writer.write_byte('\\');
            switch (c) {
                case '\\': m_writer.write_byte('\\'); break;
                case '"': m_writer.write_byte('"'); break;
                case '\b': m_writer.write_byte('b'); break;
                case '\f': m_writer.write_byte('f'); break;
                case '\n': m_writer.write_byte('n'); break;
                case '\r': m_writer.write_byte('r'); break;
                case '\t': m_writer.write_byte('t'); break;
                default: {
                    // remaining control characters
                    char escape[5] = {'u', '0', '0', hex_digit(c >> 4), hex_digit(c & 0x0F)};
                    m_writer.write(std::string_view(escape, sizeof(escape)));
                    break;
                }
            }
        }
    }

    template <typename T>
    void JsonTextWriter::write_integer(T value) {
        char buf[24];
        auto res = std::to_chars(buf, buf + sizeof(buf), value);
        m_writer.write(std::string_view(buf, static_cast<size_t>(res.ptr - buf)));
    }

    template <typename T>
    void JsonTextWriter::write_float(T value) {
        // shortest representation that reads back to the same value
        char buf[32];
        auto res = std::to_chars(buf, buf + sizeof(buf), value);
        if (res.ec != std::errc()) {
            throw docjson::exception(JsonErrorCode::InvalidNumber, "failed to format a floating point value");
        }
        m_writer.write(std::string_view(buf, static_cast<size_t>(res.ptr - buf)));
    }

} // namespace docjson
