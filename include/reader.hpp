#ifndef DOCJSON_READER_HPP
#define DOCJSON_READER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "guid.hpp"
#include "number64.hpp"
#include "string_dictionary.hpp"
#include "token.hpp"

namespace docjson {

    class IJsonWriter;

    // Sequential token scanner over a borrowed buffer.
    class IJsonReader {
    public:
        virtual ~IJsonReader() = default;

        // Picks the binary reader when the first byte is the binary format
        // marker and the text reader otherwise. The dictionary is needed to
        // decode binary field names written with one.
        static std::unique_ptr<IJsonReader> create(std::span<const std::byte> buffer,
                                                   const JsonStringDictionary* dictionary = nullptr);

        virtual JsonSerializationFormat serialization_format() const = 0;
        virtual const JsonStringDictionary* string_dictionary() const = 0;
        virtual int current_depth() const = 0;
        virtual JsonTokenType current_token_type() const = 0;

        // Advances to the next token. Returns false at the clean end of the
        // document and throws docjson::exception on malformed input.
        virtual bool read() = 0;

        virtual Number64 get_number_value() const = 0;
        virtual std::string get_string_value() const = 0;
        // Succeeds when the string is stored verbatim (no escapes to undo).
        virtual bool try_get_buffered_string_value(std::string_view& value) const = 0;
        virtual int8_t get_int8_value() const = 0;
        virtual int16_t get_int16_value() const = 0;
        virtual int32_t get_int32_value() const = 0;
        virtual int64_t get_int64_value() const = 0;
        virtual uint32_t get_uint32_value() const = 0;
        virtual float get_float32_value() const = 0;
        virtual double get_float64_value() const = 0;
        virtual Guid get_guid_value() const = 0;
        virtual std::vector<std::byte> get_binary_value() const = 0;

        // Encoded bytes of the current token.
        virtual std::span<const std::byte> get_buffered_raw_json_token() const = 0;

        // Writes the current token. Same format scalars are copied raw.
        void write_current_token(IJsonWriter& writer) const;

        // Reads to the end of the document, writing every token.
        void write_all(IJsonWriter& writer);
    };

} // namespace docjson

#endif // DOCJSON_READER_HPP
