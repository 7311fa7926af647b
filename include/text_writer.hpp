#ifndef DOCJSON_TEXT_WRITER_HPP
#define DOCJSON_TEXT_WRITER_HPP

#include "memory_writer.hpp"
#include "object_state.hpp"
#include "writer.hpp"

namespace docjson {

    // Emits JSON plus the typed prefixes: I int8, H int16, L int32, LL int64,
    // UL uint32, S float32, D float64, G guid, B base64 binary.
    class JsonTextWriter : public IJsonWriter {
    public:
        explicit JsonTextWriter(const JsonWriterOptions& options = {});

        JsonSerializationFormat serialization_format() const override { return JsonSerializationFormat::Text; }
        size_t current_length() const override { return m_writer.position(); }
        int current_depth() const override { return m_state.current_depth(); }
        const JsonStringDictionary* string_dictionary() const override { return nullptr; }

        void write_object_start() override;
        void write_object_end() override;
        void write_array_start() override;
        void write_array_end() override;

        void write_field_name(std::string_view field_name) override;
        void write_string_value(std::string_view value) override;
        void write_number64_value(const Number64& value) override;
        void write_bool_value(bool value) override;
        void write_null_value() override;

        void write_int8_value(int8_t value) override;
        void write_int16_value(int16_t value) override;
        void write_int32_value(int32_t value) override;
        void write_int64_value(int64_t value) override;
        void write_uint32_value(uint32_t value) override;
        void write_float32_value(float value) override;
        void write_float64_value(double value) override;
        void write_guid_value(const Guid& value) override;
        void write_binary_value(std::span<const std::byte> value) override;

        void write_raw_json_token(JsonTokenType token_type, std::span<const std::byte> raw_token) override;

        std::span<const std::byte> get_result() const override { return m_writer.written(); }

    private:
        void prefix_member_separator();
        void write_escaped_string(std::string_view value);

        template <typename T>
        void write_integer(T value);
        template <typename T>
        void write_float(T value);

        JsonMemoryWriter m_writer;
        JsonObjectState m_state;
        bool m_first_value;
    };

    // Index of the first byte that needs escaping in a JSON string, or
    // value.size() when there is none.
    size_t index_of_character_that_needs_escaping(std::string_view value);

} // namespace docjson

#endif // DOCJSON_TEXT_WRITER_HPP
