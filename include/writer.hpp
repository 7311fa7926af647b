#ifndef DOCJSON_WRITER_HPP
#define DOCJSON_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "config.hpp"
#include "guid.hpp"
#include "number64.hpp"
#include "string_dictionary.hpp"
#include "token.hpp"

namespace docjson {

    struct JsonWriterOptions {
        size_t initial_capacity = config::initial_buffer_capacity;

        // Binary only: emit item counts next to container lengths.
        bool serialize_count = false;

        // Binary only: field names are dictionary encoded through it. Not
        // owned; must outlive the writer and every reader of its output.
        JsonStringDictionary* string_dictionary = nullptr;
    };

    // Token sink producing one serialized document. Every call is validated
    // by the writer's JsonObjectState; a violation throws docjson::exception
    // and leaves the writer unusable.
    class IJsonWriter {
    public:
        virtual ~IJsonWriter() = default;

        static std::unique_ptr<IJsonWriter> create(JsonSerializationFormat format,
                                                   const JsonWriterOptions& options = {});

        virtual JsonSerializationFormat serialization_format() const = 0;
        virtual size_t current_length() const = 0;
        virtual int current_depth() const = 0;
        virtual const JsonStringDictionary* string_dictionary() const = 0;

        virtual void write_object_start() = 0;
        virtual void write_object_end() = 0;
        virtual void write_array_start() = 0;
        virtual void write_array_end() = 0;

        virtual void write_field_name(std::string_view field_name) = 0;
        virtual void write_string_value(std::string_view value) = 0;
        virtual void write_number64_value(const Number64& value) = 0;
        virtual void write_bool_value(bool value) = 0;
        virtual void write_null_value() = 0;

        virtual void write_int8_value(int8_t value) = 0;
        virtual void write_int16_value(int16_t value) = 0;
        virtual void write_int32_value(int32_t value) = 0;
        virtual void write_int64_value(int64_t value) = 0;
        virtual void write_uint32_value(uint32_t value) = 0;
        virtual void write_float32_value(float value) = 0;
        virtual void write_float64_value(double value) = 0;
        virtual void write_guid_value(const Guid& value) = 0;
        virtual void write_binary_value(std::span<const std::byte> value) = 0;

        // Copies an already encoded token in this writer's format. Accepts
        // scalars, field names and whole arrays or objects (BeginArray /
        // BeginObject with the complete container bytes).
        virtual void write_raw_json_token(JsonTokenType token_type, std::span<const std::byte> raw_token) = 0;

        // View of the encoded document, valid until the next write.
        virtual std::span<const std::byte> get_result() const = 0;
    };

} // namespace docjson

#endif // DOCJSON_WRITER_HPP
