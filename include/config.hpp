#ifndef DOCJSON_CONFIG_HPP
#define DOCJSON_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

namespace docjson::config {
    // Nesting depth supported by JsonObjectState. One bit per level is kept in a
    // byte array, so the value has to be a multiple of 8 and fit in 15 bits.
    constexpr size_t max_nesting_depth = 256;
    static_assert(max_nesting_depth % 8 == 0, "max_nesting_depth must be a multiple of 8");
    static_assert(max_nesting_depth < (1u << 15), "max_nesting_depth must be less than 2^15");

    constexpr size_t initial_buffer_capacity = 256;
    constexpr size_t max_buffer_capacity = static_cast<size_t>(std::numeric_limits<std::ptrdiff_t>::max());

    // Binary encoding limits
    constexpr size_t literal_int_count = 32;
    constexpr size_t system_string_count = 32;
    constexpr size_t user_string_1byte_count = 32;
    constexpr size_t user_string_2byte_marker_count = 32;
    constexpr size_t encoded_string_length_count = 64;
    constexpr size_t max_user_string_count = user_string_1byte_count + user_string_2byte_marker_count * 256;

    constexpr size_t guid_length = 16;
    constexpr size_t guid_string_length = 36;
}

#endif // DOCJSON_CONFIG_HPP
