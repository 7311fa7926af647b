#include "text_reader.hpp"
#include "exception.hpp"
#include "text_parser.hpp"
#include "utils/base64.hpp"
#include "utils/hex.hpp"

#include <string>

namespace docjson {

    namespace {
        bool is_whitespace(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        bool is_letter_or_digit(char c) {
            return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        bool is_escape_character(char c) {
            switch (c) {
                case 'b':
                case 'f':
                case 'n':
                case 'r':
                case 't':
                case '\\':
                case '"':
                case '/':
                    return true;
                default:
                    return false;
            }
        }
    } // namespace

    JsonTextReader::JsonTextReader(std::span<const std::byte> buffer)
        : m_reader(buffer),
          m_state(true),
          m_token_start(0),
          m_token_end(0),
          m_token_escaped(false),
          m_has_separator(false) {}

    bool JsonTextReader::read() {
        advance_while_whitespace();

        if (m_reader.is_eof()) {
            if (m_state.current_depth() != 0) {
                if (m_state.in_object_context()) {
                    throw docjson::exception(JsonErrorCode::MissingEndObject);
                }
                if (m_state.in_array_context()) {
                    throw docjson::exception(JsonErrorCode::MissingEndArray);
                }
                throw docjson::exception(JsonErrorCode::NotComplete);
            }
            return false;
        }

        m_token_start = m_reader.position();
        m_token_escaped = false;

        char next = peek_character();
        switch (next) {
            case '"':
                process_string();
                break;
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                process_number();
                break;
            case '[':
                process_single_byte_token(JsonTokenType::BeginArray);
                break;
            case ']':
                process_single_byte_token(JsonTokenType::EndArray);
                break;
            case '{':
                process_single_byte_token(JsonTokenType::BeginObject);
                break;
            case '}':
                process_single_byte_token(JsonTokenType::EndObject);
                break;
            case 't':
                process_literal(JsonTokenType::True, "true");
                break;
            case 'f':
                process_literal(JsonTokenType::False, "false");
                break;
            case 'n':
                process_literal(JsonTokenType::Null, "null");
                break;
            case ',':
                // separators are consumed, the token after them is returned
                process_value_separator();
                return read();
            case ':':
                process_name_separator();
                return read();
            case 'I':
            case 'H':
            case 'L':
            case 'U':
            case 'S':
            case 'D':
                process_prefixed(next);
                break;
            case 'G':
                process_guid();
                break;
            case 'B':
                process_binary();
                break;
            default:
                throw docjson::exception(JsonErrorCode::UnexpectedToken,
                                         "'" + std::string(1, next) + "' at offset " + std::to_string(m_token_start));
        }

        m_token_end = m_reader.position();
        return true;
    }

    Number64 JsonTextReader::get_number_value() const {
        require_token(JsonTokenType::Number);
        return text::get_number_value(token_text());
    }

    std::string JsonTextReader::get_string_value() const {
        JsonTokenType current = current_token_type();
        if (current != JsonTokenType::String && current != JsonTokenType::FieldName) {
            require_token(JsonTokenType::String);
        }
        return text::get_string_value(token_text());
    }

    bool JsonTextReader::try_get_buffered_string_value(std::string_view& value) const {
        JsonTokenType current = current_token_type();
        if (current != JsonTokenType::String && current != JsonTokenType::FieldName) {
            require_token(JsonTokenType::String);
        }
        if (m_token_escaped) {
            return false;
        }
        std::string_view token = token_text();
        value = token.substr(1, token.size() - 2);
        return true;
    }

    int8_t JsonTextReader::get_int8_value() const {
        require_token(JsonTokenType::Int8);
        return text::get_int8_value(token_text());
    }

    int16_t JsonTextReader::get_int16_value() const {
        require_token(JsonTokenType::Int16);
        return text::get_int16_value(token_text());
    }

    int32_t JsonTextReader::get_int32_value() const {
        require_token(JsonTokenType::Int32);
        return text::get_int32_value(token_text());
    }

    int64_t JsonTextReader::get_int64_value() const {
        require_token(JsonTokenType::Int64);
        return text::get_int64_value(token_text());
    }

    uint32_t JsonTextReader::get_uint32_value() const {
        require_token(JsonTokenType::UInt32);
        return text::get_uint32_value(token_text());
    }

    float JsonTextReader::get_float32_value() const {
        require_token(JsonTokenType::Float32);
        return text::get_float32_value(token_text());
    }

    double JsonTextReader::get_float64_value() const {
        require_token(JsonTokenType::Float64);
        return text::get_float64_value(token_text());
    }

    Guid JsonTextReader::get_guid_value() const {
        require_token(JsonTokenType::Guid);
        return text::get_guid_value(token_text());
    }

    std::vector<std::byte> JsonTextReader::get_binary_value() const {
        require_token(JsonTokenType::Binary);
        return text::get_binary_value(token_text());
    }

    std::span<const std::byte> JsonTextReader::get_buffered_raw_json_token() const {
        return m_reader.get_buffered_raw_json_token(m_token_start, m_token_end);
    }

    std::string_view JsonTextReader::token_text() const {
        return text::as_string_view(get_buffered_raw_json_token());
    }

    void JsonTextReader::require_token(JsonTokenType expected) const {
        if (current_token_type() != expected) {
            throw docjson::exception(JsonErrorCode::TypeMismatch,
                                     "current token is " + std::string(to_string(current_token_type())) + ", not " +
                                         std::string(to_string(expected)));
        }
    }

    void JsonTextReader::process_single_byte_token(JsonTokenType token_type) {
        read_character();
        register_token(token_type);
    }

    void JsonTextReader::process_literal(JsonTokenType token_type, std::string_view literal) {
        if (m_reader.size() - m_reader.position() < literal.size() ||
            text::as_string_view(m_reader.get_buffered_raw_json_token(m_reader.position(), m_reader.position() + literal.size())) != literal) {
            throw docjson::exception(JsonErrorCode::InvalidToken, "expected '" + std::string(literal) + "'");
        }
        m_reader.advance(literal.size());
        register_token(token_type);
    }

    void JsonTextReader::process_number() {
        process_number_value_token();
        register_token(JsonTokenType::Number);
    }

    void JsonTextReader::process_number_value_token() {
        if (peek_character() == '-') {
            read_character();
        }

        // at least one digit before the dot
        if (!is_digit(peek_character())) {
            throw docjson::exception(JsonErrorCode::InvalidNumber);
        }

        // no leading zeros
        if (peek_character() == '0') {
            read_character();
            if (is_digit(peek_character())) {
                throw docjson::exception(JsonErrorCode::InvalidNumber, "leading zero");
            }
        } else {
            while (is_digit(peek_character())) {
                read_character();
            }
        }

        if (peek_character() == '.') {
            read_character();
            if (!is_digit(peek_character())) {
                throw docjson::exception(JsonErrorCode::InvalidNumber, "missing digits after '.'");
            }
            while (is_digit(peek_character())) {
                read_character();
            }
        }

        if (peek_character() == 'e' || peek_character() == 'E') {
            read_character();
            if (peek_character() == '+' || peek_character() == '-') {
                read_character();
            }
            if (!is_digit(peek_character())) {
                throw docjson::exception(JsonErrorCode::InvalidNumber, "missing exponent digits");
            }
            while (is_digit(peek_character())) {
                read_character();
            }
        }

        expect_terminator();
    }

    void JsonTextReader::process_integer_token(JsonTokenType token_type) {
        if (peek_character() == '-') {
            read_character();
        }
        if (!is_digit(peek_character())) {
            throw docjson::exception(JsonErrorCode::InvalidNumber);
        }
        while (is_digit(peek_character())) {
            read_character();
        }
        expect_terminator();
        register_token(token_type);
    }

    void JsonTextReader::process_prefixed(char prefix) {
        read_character();
        switch (prefix) {
            case 'I':
                process_integer_token(JsonTokenType::Int8);
                break;
            case 'H':
                process_integer_token(JsonTokenType::Int16);
                break;
            case 'L':
                if (peek_character() == 'L') {
                    read_character();
                    process_integer_token(JsonTokenType::Int64);
                } else {
                    process_integer_token(JsonTokenType::Int32);
                }
                break;
            case 'U':
                if (read_character() != 'L') {
                    throw docjson::exception(JsonErrorCode::InvalidToken, "expected 'UL'");
                }
                // unsigned, so the first character has to be a digit
                if (!is_digit(peek_character())) {
                    throw docjson::exception(JsonErrorCode::InvalidNumber);
                }
                process_integer_token(JsonTokenType::UInt32);
                break;
            case 'S':
                process_number_value_token();
                register_token(JsonTokenType::Float32);
                break;
            case 'D':
                process_number_value_token();
                register_token(JsonTokenType::Float64);
                break;
            default:
                throw docjson::exception(JsonErrorCode::UnexpectedToken, std::string(1, prefix));
        }
    }

    void JsonTextReader::process_guid() {
        read_character();

        size_t length = 0;
        while (is_letter_or_digit(peek_character()) || peek_character() == '-') {
            read_character();
            ++length;
        }
        if (length != config::guid_string_length) {
            throw docjson::exception(JsonErrorCode::InvalidToken, "guid must be 36 characters");
        }
        register_token(JsonTokenType::Guid);
    }

    void JsonTextReader::process_binary() {
        read_character();
        while (!m_reader.is_eof() && utils::is_base64_char(peek_character())) {
            read_character();
        }
        register_token(JsonTokenType::Binary);
    }

    void JsonTextReader::process_string() {
        JsonTokenType token_type = m_state.is_property_expected() ? JsonTokenType::FieldName : JsonTokenType::String;

        // opening quote
        read_character();

        while (true) {
            char current = read_character();
            switch (current) {
                case '"':
                    register_token(token_type);
                    return;
                case '\\': {
                    m_token_escaped = true;
                    char escape = read_character();
                    if (escape == 'u') {
                        for (int i = 0; i < 4; ++i) {
                            if (utils::hex_digit_value(read_character()) < 0) {
                                throw docjson::exception(JsonErrorCode::InvalidEscapedCharacter, "invalid \\u escape");
                            }
                        }
                    } else if (!is_escape_character(escape)) {
                        if (m_reader.position() > m_reader.size()) {
                            throw docjson::exception(JsonErrorCode::MissingClosingQuote);
                        }
                        throw docjson::exception(JsonErrorCode::InvalidEscapedCharacter,
                                                 "\\" + std::string(1, escape));
                    }
                    break;
                }
                case '\0':
                    if (m_reader.position() > m_reader.size()) {
                        throw docjson::exception(JsonErrorCode::MissingClosingQuote);
                    }
                    break;
                default:
                    break;
            }
        }
    }

    void JsonTextReader::process_name_separator() {
        if (m_has_separator || m_state.current_token_type() != JsonTokenType::FieldName) {
            throw docjson::exception(JsonErrorCode::UnexpectedNameSeparator);
        }
        read_character();
        m_has_separator = true;
    }

    void JsonTextReader::process_value_separator() {
        if (m_has_separator || m_state.current_depth() == 0) {
            throw docjson::exception(JsonErrorCode::UnexpectedValueSeparator);
        }

        switch (m_state.current_token_type()) {
            case JsonTokenType::EndArray:
            case JsonTokenType::EndObject:
            case JsonTokenType::String:
            case JsonTokenType::Number:
            case JsonTokenType::True:
            case JsonTokenType::False:
            case JsonTokenType::Null:
            case JsonTokenType::Int8:
            case JsonTokenType::Int16:
            case JsonTokenType::Int32:
            case JsonTokenType::Int64:
            case JsonTokenType::UInt32:
            case JsonTokenType::Float32:
            case JsonTokenType::Float64:
            case JsonTokenType::Guid:
            case JsonTokenType::Binary:
                m_has_separator = true;
                break;
            default:
                throw docjson::exception(JsonErrorCode::UnexpectedValueSeparator);
        }

        read_character();
    }

    void JsonTextReader::register_token(JsonTokenType token_type) {
        JsonTokenType previous = m_state.current_token_type();

        // grammar checks live in the object state, separators are checked here
        m_state.register_token(token_type);

        switch (token_type) {
            case JsonTokenType::EndArray:
                if (m_has_separator) {
                    throw docjson::exception(JsonErrorCode::UnexpectedEndArray);
                }
                break;
            case JsonTokenType::EndObject:
                if (m_has_separator) {
                    throw docjson::exception(JsonErrorCode::UnexpectedEndObject);
                }
                break;
            default:
                switch (previous) {
                    case JsonTokenType::NotStarted:
                    case JsonTokenType::BeginArray:
                    case JsonTokenType::BeginObject:
                        break;
                    case JsonTokenType::FieldName:
                        if (!m_has_separator) {
                            throw docjson::exception(JsonErrorCode::MissingNameSeparator);
                        }
                        break;
                    default:
                        if (!m_has_separator) {
                            throw docjson::exception(JsonErrorCode::UnexpectedToken);
                        }
                        break;
                }
                m_has_separator = false;
                break;
        }
    }

    void JsonTextReader::advance_while_whitespace() {
        while (!m_reader.is_eof() && is_whitespace(peek_character())) {
            read_character();
        }
    }

    void JsonTextReader::expect_terminator() {
        if (m_reader.is_eof()) {
            return;
        }
        char current = peek_character();
        if (!(is_whitespace(current) || current == '}' || current == ',' || current == ']')) {
            throw docjson::exception(JsonErrorCode::InvalidNumber, "unexpected '" + std::string(1, current) + "' after number");
        }
    }

} // namespace docjson
