#include "exception.hpp"

namespace docjson {

    std::string_view to_string(JsonErrorCode code) {
        switch (code) {
            case JsonErrorCode::MissingProperty: return "MissingProperty";
            case JsonErrorCode::PropertyArrayOrObjectNotStarted: return "PropertyArrayOrObjectNotStarted";
            case JsonErrorCode::ArrayNotStarted: return "ArrayNotStarted";
            case JsonErrorCode::ObjectNotStarted: return "ObjectNotStarted";
            case JsonErrorCode::PropertyAlreadyAdded: return "PropertyAlreadyAdded";
            case JsonErrorCode::MaxNestingExceeded: return "MaxNestingExceeded";
            case JsonErrorCode::NotComplete: return "NotComplete";
            case JsonErrorCode::UnexpectedEndArray: return "UnexpectedEndArray";
            case JsonErrorCode::UnexpectedEndObject: return "UnexpectedEndObject";
            case JsonErrorCode::UnexpectedToken: return "UnexpectedToken";
            case JsonErrorCode::InvalidToken: return "InvalidToken";
            case JsonErrorCode::InvalidNumber: return "InvalidNumber";
            case JsonErrorCode::InvalidEscapedCharacter: return "InvalidEscapedCharacter";
            case JsonErrorCode::MissingClosingQuote: return "MissingClosingQuote";
            case JsonErrorCode::MissingNameSeparator: return "MissingNameSeparator";
            case JsonErrorCode::UnexpectedNameSeparator: return "UnexpectedNameSeparator";
            case JsonErrorCode::UnexpectedValueSeparator: return "UnexpectedValueSeparator";
            case JsonErrorCode::MissingEndArray: return "MissingEndArray";
            case JsonErrorCode::MissingEndObject: return "MissingEndObject";
            case JsonErrorCode::InvalidLength: return "InvalidLength";
            case JsonErrorCode::InvalidBinaryFormat: return "InvalidBinaryFormat";
            case JsonErrorCode::NotSupported: return "NotSupported";
            case JsonErrorCode::TypeMismatch: return "TypeMismatch";
            case JsonErrorCode::IndexOutOfRange: return "IndexOutOfRange";
            case JsonErrorCode::InvalidArgument: return "InvalidArgument";
        }
        return "Unknown";
    }

    exception::exception(JsonErrorCode code)
        : std::runtime_error(std::string(to_string(code))), m_code(code) {}

    exception::exception(JsonErrorCode code, const std::string& what)
        : std::runtime_error(std::string(to_string(code)) + ": " + what), m_code(code) {}

} // namespace docjson
