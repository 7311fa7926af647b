#ifndef DOCJSON_TOKEN_HPP
#define DOCJSON_TOKEN_HPP

#include <cstdint>
#include <string_view>

namespace docjson {

    // Events emitted by readers and consumed by writers.
    enum class JsonTokenType : uint8_t {
        NotStarted,
        BeginArray,
        EndArray,
        BeginObject,
        EndObject,
        String,
        Number,
        True,
        False,
        Null,
        FieldName,
        Int8,
        Int16,
        Int32,
        Int64,
        UInt32,
        Float32,
        Float64,
        Guid,
        Binary,
    };

    // Node kinds reported by navigators.
    enum class JsonNodeType : uint8_t {
        Null,
        False,
        True,
        Number64,
        String,
        Array,
        Object,
        FieldName,
        Int8,
        Int16,
        Int32,
        Int64,
        UInt32,
        Float32,
        Float64,
        Guid,
        Binary,
    };

    // The value doubles as the first byte of a binary buffer.
    enum class JsonSerializationFormat : uint8_t {
        Text = 0x00,
        Binary = 0x80,
    };

    std::string_view to_string(JsonTokenType type);
    std::string_view to_string(JsonNodeType type);
    std::string_view to_string(JsonSerializationFormat format);

    // The token a navigator node of this type starts with.
    JsonTokenType to_token_type(JsonNodeType type);

} // namespace docjson

#endif // DOCJSON_TOKEN_HPP
