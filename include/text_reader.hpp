#ifndef DOCJSON_TEXT_READER_HPP
#define DOCJSON_TEXT_READER_HPP

#include "memory_reader.hpp"
#include "object_state.hpp"
#include "reader.hpp"

namespace docjson {

    class JsonTextReader : public IJsonReader {
    public:
        explicit JsonTextReader(std::span<const std::byte> buffer);

        JsonSerializationFormat serialization_format() const override { return JsonSerializationFormat::Text; }
        const JsonStringDictionary* string_dictionary() const override { return nullptr; }
        int current_depth() const override { return m_state.current_depth(); }
        JsonTokenType current_token_type() const override { return m_state.current_token_type(); }

        bool read() override;

        Number64 get_number_value() const override;
        std::string get_string_value() const override;
        bool try_get_buffered_string_value(std::string_view& value) const override;
        int8_t get_int8_value() const override;
        int16_t get_int16_value() const override;
        int32_t get_int32_value() const override;
        int64_t get_int64_value() const override;
        uint32_t get_uint32_value() const override;
        float get_float32_value() const override;
        double get_float64_value() const override;
        Guid get_guid_value() const override;
        std::vector<std::byte> get_binary_value() const override;

        std::span<const std::byte> get_buffered_raw_json_token() const override;

        // Offsets of the current token, prefix and quotes included.
        size_t token_start() const { return m_token_start; }
        size_t token_end() const { return m_token_end; }
        // True when the current string or field name contains escapes.
        bool token_escaped() const { return m_token_escaped; }

    private:
        std::string_view token_text() const;
        void require_token(JsonTokenType expected) const;

        void process_single_byte_token(JsonTokenType token_type);
        void process_literal(JsonTokenType token_type, std::string_view literal);
        void process_number();
        void process_number_value_token();
        void process_integer_token(JsonTokenType token_type);
        void process_prefixed(char prefix);
        void process_guid();
        void process_binary();
        void process_string();
        void process_name_separator();
        void process_value_separator();
        void register_token(JsonTokenType token_type);

        char peek_character() const { return static_cast<char>(m_reader.peek()); }
        char read_character() { return static_cast<char>(m_reader.read()); }
        void advance_while_whitespace();
        void expect_terminator();

        JsonMemoryReader m_reader;
        JsonObjectState m_state;
        size_t m_token_start;
        size_t m_token_end;
        bool m_token_escaped;
        bool m_has_separator;
    };

} // namespace docjson

#endif // DOCJSON_TEXT_READER_HPP
