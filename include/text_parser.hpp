#ifndef DOCJSON_TEXT_PARSER_HPP
#define DOCJSON_TEXT_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "guid.hpp"
#include "number64.hpp"

namespace docjson::text {

    // Value extraction from a single raw text token, prefix and quotes
    // included. Shared by JsonTextReader and the text navigator.
    Number64 get_number_value(std::string_view token);
    int8_t get_int8_value(std::string_view token);
    int16_t get_int16_value(std::string_view token);
    int32_t get_int32_value(std::string_view token);
    int64_t get_int64_value(std::string_view token);
    uint32_t get_uint32_value(std::string_view token);
    float get_float32_value(std::string_view token);
    double get_float64_value(std::string_view token);
    Guid get_guid_value(std::string_view token);
    std::vector<std::byte> get_binary_value(std::string_view token);

    // Unescapes a quoted string token. \uXXXX escapes, surrogate pairs
    // included, are re-encoded as UTF-8.
    std::string get_string_value(std::string_view token);

    inline std::string_view as_string_view(std::span<const std::byte> bytes) {
        return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

} // namespace docjson::text

#endif // DOCJSON_TEXT_PARSER_HPP
