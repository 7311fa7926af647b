#ifndef DOCJSON_EXCEPTION_HPP
#define DOCJSON_EXCEPTION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docjson {

    enum class JsonErrorCode : uint8_t {
        // Grammar violations raised by JsonObjectState
        MissingProperty,
        PropertyArrayOrObjectNotStarted,
        ArrayNotStarted,
        ObjectNotStarted,
        PropertyAlreadyAdded,
        MaxNestingExceeded,
        NotComplete,
        UnexpectedEndArray,
        UnexpectedEndObject,

        // Token form violations raised by the text reader
        UnexpectedToken,
        InvalidToken,
        InvalidNumber,
        InvalidEscapedCharacter,
        MissingClosingQuote,
        MissingNameSeparator,
        UnexpectedNameSeparator,
        UnexpectedValueSeparator,

        // End of buffer while still nested
        MissingEndArray,
        MissingEndObject,

        // Range and format violations
        InvalidLength,
        InvalidBinaryFormat,
        NotSupported,

        // Caller errors
        TypeMismatch,
        IndexOutOfRange,
        InvalidArgument,
    };

    std::string_view to_string(JsonErrorCode code);

    class exception : public std::runtime_error {
    public:
        explicit exception(JsonErrorCode code);
        exception(JsonErrorCode code, const std::string& what);

        JsonErrorCode code() const noexcept { return m_code; }

    private:
        JsonErrorCode m_code;
    };

} // namespace docjson

#endif // DOCJSON_EXCEPTION_HPP
