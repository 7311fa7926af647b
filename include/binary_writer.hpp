#ifndef DOCJSON_BINARY_WRITER_HPP
#define DOCJSON_BINARY_WRITER_HPP

#include <vector>

#include "memory_writer.hpp"
#include "object_state.hpp"
#include "writer.hpp"

namespace docjson {

    // Single pass encoder. Containers reserve a one byte length up front and
    // are patched, and shifted when the length needs more room, on close.
    class JsonBinaryWriter : public IJsonWriter {
    public:
        explicit JsonBinaryWriter(const JsonWriterOptions& options = {});

        JsonSerializationFormat serialization_format() const override { return JsonSerializationFormat::Binary; }
        size_t current_length() const override { return m_writer.position(); }
        int current_depth() const override { return m_state.current_depth(); }
        const JsonStringDictionary* string_dictionary() const override { return m_dictionary; }

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

        std::span<const std::byte> get_result() const override;

    private:
        struct ContainerContext {
            size_t offset;
            size_t count;
        };

        void write_container_start(bool is_array);
        void write_container_end(bool is_array);
        void write_field_name_or_string(bool is_field_name, std::string_view value);
        void write_integer(int64_t value);
        void write_double(double value);
        void increment_count() { ++m_contexts.back().count; }

        JsonMemoryWriter m_writer;
        JsonObjectState m_state;
        std::vector<ContainerContext> m_contexts;
        bool m_serialize_count;
        size_t m_reservation_size;
        JsonStringDictionary* m_dictionary;
    };

} // namespace docjson

#endif // DOCJSON_BINARY_WRITER_HPP
