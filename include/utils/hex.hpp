#ifndef DOCJSON_UTILS_HEX_HPP
#define DOCJSON_UTILS_HEX_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docjson::utils {

// Decodes a hex string into a vector of bytes.
// Throws docjson::exception (InvalidArgument) if the input is not valid hex.
std::vector<std::byte> hex_decode(std::string_view hex_string);

// Lowercase hex, two characters per byte.
std::string hex_encode(std::span<const std::byte> bytes);

// Value of a single hex digit, or -1.
int hex_digit_value(char c) noexcept;

} // namespace docjson::utils

#endif // DOCJSON_UTILS_HEX_HPP
