#ifndef DOCJSON_BINARY_ENCODING_HPP
#define DOCJSON_BINARY_ENCODING_HPP

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

#include "guid.hpp"
#include "number64.hpp"
#include "string_dictionary.hpp"
#include "token.hpp"

namespace docjson::binary {

    // One byte at the start of every binary value. Ranges are [min, max).
    namespace type_marker {
        // Integers 0..31 stored in the marker itself
        constexpr uint8_t literal_int_min = 0x00;
        constexpr uint8_t literal_int_max = 0x20;

        // Dictionary encoded strings
        constexpr uint8_t system_string_1byte_min = 0x20;
        constexpr uint8_t system_string_1byte_max = 0x40;
        constexpr uint8_t user_string_1byte_min = 0x40;
        constexpr uint8_t user_string_1byte_max = 0x60;
        constexpr uint8_t user_string_2byte_min = 0x60;
        constexpr uint8_t user_string_2byte_max = 0x80;

        // Strings with the length in the marker
        constexpr uint8_t encoded_string_length_min = 0x80;
        constexpr uint8_t encoded_string_length_max = 0xC0;

        constexpr uint8_t string_1byte_length = 0xC0;
        constexpr uint8_t string_2byte_length = 0xC1;
        constexpr uint8_t string_4byte_length = 0xC2;
        constexpr uint8_t reference_string_1byte_offset = 0xC3;
        constexpr uint8_t reference_string_2byte_offset = 0xC4;
        constexpr uint8_t reference_string_3byte_offset = 0xC5;
        constexpr uint8_t reference_string_4byte_offset = 0xC6;

        constexpr uint8_t number_uint8 = 0xC8;
        constexpr uint8_t number_int16 = 0xC9;
        constexpr uint8_t number_int32 = 0xCA;
        constexpr uint8_t number_int64 = 0xCB;
        constexpr uint8_t number_double = 0xCC;
        constexpr uint8_t float32 = 0xCD;
        constexpr uint8_t float64 = 0xCE;
        constexpr uint8_t float16 = 0xCF;

        constexpr uint8_t null = 0xD0;
        constexpr uint8_t false_ = 0xD1;
        constexpr uint8_t true_ = 0xD2;
        constexpr uint8_t guid = 0xD3;

        constexpr uint8_t int8 = 0xD8;
        constexpr uint8_t int16 = 0xD9;
        constexpr uint8_t int32 = 0xDA;
        constexpr uint8_t int64 = 0xDB;
        constexpr uint8_t uint32 = 0xDC;
        constexpr uint8_t binary_1byte_length = 0xDD;
        constexpr uint8_t binary_2byte_length = 0xDE;
        constexpr uint8_t binary_4byte_length = 0xDF;

        constexpr uint8_t empty_array = 0xE0;
        constexpr uint8_t single_item_array = 0xE1;
        constexpr uint8_t array_1byte_length = 0xE2;
        constexpr uint8_t array_2byte_length = 0xE3;
        constexpr uint8_t array_4byte_length = 0xE4;
        constexpr uint8_t array_1byte_length_and_count = 0xE5;
        constexpr uint8_t array_2byte_length_and_count = 0xE6;
        constexpr uint8_t array_4byte_length_and_count = 0xE7;

        constexpr uint8_t empty_object = 0xE8;
        constexpr uint8_t single_property_object = 0xE9;
        constexpr uint8_t object_1byte_length = 0xEA;
        constexpr uint8_t object_2byte_length = 0xEB;
        constexpr uint8_t object_4byte_length = 0xEC;
        constexpr uint8_t object_1byte_length_and_count = 0xED;
        constexpr uint8_t object_2byte_length_and_count = 0xEE;
        constexpr uint8_t object_4byte_length_and_count = 0xEF;

        constexpr uint8_t invalid = 0xFF;

        constexpr bool in_range(uint8_t marker, uint8_t min, uint8_t max) { return marker >= min && marker < max; }

        constexpr bool is_encoded_number_literal(int64_t value) {
            return value >= literal_int_min && value < literal_int_max;
        }

        constexpr bool is_string(uint8_t marker) {
            return in_range(marker, system_string_1byte_min, encoded_string_length_max) ||
                   (marker >= string_1byte_length && marker <= reference_string_4byte_offset);
        }

        constexpr bool is_array(uint8_t marker) { return marker >= empty_array && marker <= array_4byte_length_and_count; }
        constexpr bool is_object(uint8_t marker) { return marker >= empty_object && marker <= object_4byte_length_and_count; }

        // invalid when the length does not fit in the marker
        constexpr uint8_t encoded_string_length_marker(size_t length) {
            return length < static_cast<size_t>(encoded_string_length_max - encoded_string_length_min)
                       ? static_cast<uint8_t>(encoded_string_length_min + length)
                       : invalid;
        }
    } // namespace type_marker

    constexpr size_t type_marker_length = 1;
    constexpr size_t one_byte_length = 1;
    constexpr size_t two_byte_length = 2;
    constexpr size_t four_byte_length = 4;

    // Marker plus an optional second byte, used for dictionary encoded strings.
    struct MultiByteTypeMarker {
        uint8_t length = 0;
        uint8_t one = type_marker::invalid;
        uint8_t two = 0;
    };

    bool try_get_system_string_id(std::string_view value, size_t& id);
    bool try_get_system_string(size_t id, std::string_view& value);

    // System strings are tried for every string; the user dictionary, when
    // given, is tried next and grows as new strings are seen.
    bool try_get_encoded_string_type_marker(std::string_view value, JsonStringDictionary* dictionary,
                                            MultiByteTypeMarker& marker);

    template <typename T>
    T read_little_endian(const std::byte* source) {
        T value;
        if constexpr (std::endian::native == std::endian::big) {
            std::byte raw[sizeof(T)];
            for (size_t i = 0; i < sizeof(T); ++i) {
                raw[i] = source[sizeof(T) - 1 - i];
            }
            std::memcpy(&value, raw, sizeof(T));
        } else {
            std::memcpy(&value, source, sizeof(T));
        }
        return value;
    }

    // Throws InvalidBinaryFormat for unassigned markers and NotSupported for
    // reference strings and float16.
    JsonNodeType get_node_type(uint8_t marker);

    // Total size of the value starting at buffer[0], marker included.
    // Throws InvalidBinaryFormat when the value runs past the end of buffer.
    size_t get_value_length(std::span<const std::byte> buffer);

    // Offset of the first item relative to a container's marker.
    size_t get_first_value_offset(uint8_t marker);

    // Only meaningful for the *_and_count container markers.
    bool try_get_serialized_count(std::span<const std::byte> container, size_t& count);

    // Scalar accessors. Each takes the span starting at the value's marker
    // and throws TypeMismatch when the marker is of another kind.
    Number64 get_number_value(std::span<const std::byte> token);
    int8_t get_int8_value(std::span<const std::byte> token);
    int16_t get_int16_value(std::span<const std::byte> token);
    int32_t get_int32_value(std::span<const std::byte> token);
    int64_t get_int64_value(std::span<const std::byte> token);
    uint32_t get_uint32_value(std::span<const std::byte> token);
    float get_float32_value(std::span<const std::byte> token);
    double get_float64_value(std::span<const std::byte> token);
    Guid get_guid_value(std::span<const std::byte> token);
    std::span<const std::byte> get_binary_value(std::span<const std::byte> token);

    // The view points into the buffer, the system string table or the
    // dictionary.
    std::string_view get_string_value(std::span<const std::byte> token, const JsonStringDictionary* dictionary);

} // namespace docjson::binary

#endif // DOCJSON_BINARY_ENCODING_HPP
