#ifndef DOCJSON_UTILS_BASE64_HPP
#define DOCJSON_UTILS_BASE64_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docjson::utils {

// Standard alphabet, '=' padded.
std::string base64_encode(std::span<const std::byte> bytes);
void base64_encode(std::span<const std::byte> bytes, std::string& out);

// Throws docjson::exception (InvalidToken) on a malformed input.
std::vector<std::byte> base64_decode(std::string_view text);

bool is_base64_char(char c) noexcept;

} // namespace docjson::utils

#endif // DOCJSON_UTILS_BASE64_HPP
