#include "token.hpp"
#include "exception.hpp"

namespace docjson {

    std::string_view to_string(JsonTokenType type) {
        switch (type) {
            case JsonTokenType::NotStarted: return "NotStarted";
            case JsonTokenType::BeginArray: return "BeginArray";
            case JsonTokenType::EndArray: return "EndArray";
            case JsonTokenType::BeginObject: return "BeginObject";
            case JsonTokenType::EndObject: return "EndObject";
            case JsonTokenType::String: return "String";
            case JsonTokenType::Number: return "Number";
            case JsonTokenType::True: return "True";
            case JsonTokenType::False: return "False";
            case JsonTokenType::Null: return "Null";
            case JsonTokenType::FieldName: return "FieldName";
            case JsonTokenType::Int8: return "Int8";
            case JsonTokenType::Int16: return "Int16";
            case JsonTokenType::Int32: return "Int32";
            case JsonTokenType::Int64: return "Int64";
            case JsonTokenType::UInt32: return "UInt32";
            case JsonTokenType::Float32: return "Float32";
            case JsonTokenType::Float64: return "Float64";
            case JsonTokenType::Guid: return "Guid";
            case JsonTokenType::Binary: return "Binary";
        }
        return "Unknown";
    }

    std::string_view to_string(JsonNodeType type) {
        switch (type) {
            case JsonNodeType::Null: return "Null";
            case JsonNodeType::False: return "False";
            case JsonNodeType::True: return "True";
            case JsonNodeType::Number64: return "Number64";
            case JsonNodeType::String: return "String";
            case JsonNodeType::Array: return "Array";
            case JsonNodeType::Object: return "Object";
            case JsonNodeType::FieldName: return "FieldName";
            case JsonNodeType::Int8: return "Int8";
            case JsonNodeType::Int16: return "Int16";
            case JsonNodeType::Int32: return "Int32";
            case JsonNodeType::Int64: return "Int64";
            case JsonNodeType::UInt32: return "UInt32";
            case JsonNodeType::Float32: return "Float32";
            case JsonNodeType::Float64: return "Float64";
            case JsonNodeType::Guid: return "Guid";
            case JsonNodeType::Binary: return "Binary";
        }
        return "Unknown";
    }

    std::string_view to_string(JsonSerializationFormat format) {
        switch (format) {
            case JsonSerializationFormat::Text: return "Text";
            case JsonSerializationFormat::Binary: return "Binary";
        }
        return "Unknown";
    }

    JsonTokenType to_token_type(JsonNodeType type) {
        switch (type) {
            case JsonNodeType::Null: return JsonTokenType::Null;
            case JsonNodeType::False: return JsonTokenType::False;
            case JsonNodeType::True: return JsonTokenType::True;
            case JsonNodeType::Number64: return JsonTokenType::Number;
            case JsonNodeType::String: return JsonTokenType::String;
            case JsonNodeType::Array: return JsonTokenType::BeginArray;
            case JsonNodeType::Object: return JsonTokenType::BeginObject;
            case JsonNodeType::FieldName: return JsonTokenType::FieldName;
            case JsonNodeType::Int8: return JsonTokenType::Int8;
            case JsonNodeType::Int16: return JsonTokenType::Int16;
            case JsonNodeType::Int32: return JsonTokenType::Int32;
            case JsonNodeType::Int64: return JsonTokenType::Int64;
            case JsonNodeType::UInt32: return JsonTokenType::UInt32;
            case JsonNodeType::Float32: return JsonTokenType::Float32;
            case JsonNodeType::Float64: return JsonTokenType::Float64;
            case JsonNodeType::Guid: return JsonTokenType::Guid;
            case JsonNodeType::Binary: return JsonTokenType::Binary;
        }
        throw docjson::exception(JsonErrorCode::InvalidArgument, "unknown node type");
    }

} // namespace docjson
