#ifndef DOCJSON_BINARY_READER_HPP
#define DOCJSON_BINARY_READER_HPP

#include <vector>

#include "memory_reader.hpp"
#include "object_state.hpp"
#include "reader.hpp"

namespace docjson {

    // Walks a binary buffer marker by marker. Container ends are not stored
    // in the encoding, so EndArray / EndObject are produced when the cursor
    // reaches the end offset recorded for the enclosing container.
    class JsonBinaryReader : public IJsonReader {
    public:
        // Throws InvalidBinaryFormat unless buffer starts with the binary
        // format marker.
        JsonBinaryReader(std::span<const std::byte> buffer, const JsonStringDictionary* dictionary);

        JsonSerializationFormat serialization_format() const override { return JsonSerializationFormat::Binary; }
        const JsonStringDictionary* string_dictionary() const override { return m_dictionary; }
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

        // For BeginArray / BeginObject this is the whole container.
        std::span<const std::byte> get_buffered_raw_json_token() const override;

    private:
        struct ContainerScope {
            size_t end;
            bool is_array;
        };

        void require_token(JsonTokenType expected) const;
        void require_string_token() const;

        JsonMemoryReader m_reader;
        JsonObjectState m_state;
        const JsonStringDictionary* m_dictionary;
        std::vector<ContainerScope> m_scopes;
        size_t m_token_start;
        size_t m_token_end;
    };

} // namespace docjson

#endif // DOCJSON_BINARY_READER_HPP
