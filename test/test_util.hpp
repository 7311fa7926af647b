#ifndef DOCJSON_TEST_UTIL_HPP
#define DOCJSON_TEST_UTIL_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

inline std::span<const std::byte> bytes_of(std::string_view text) {
  return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

inline std::string text_of(std::span<const std::byte> bytes) {
  return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
}

inline std::vector<std::byte> make_bytes(std::initializer_list<uint8_t> values) {
  std::vector<std::byte> out;
  out.reserve(values.size());
  for (uint8_t v : values) {
    out.push_back(static_cast<std::byte>(v));
  }
  return out;
}

inline std::vector<std::byte> copy_of(std::span<const std::byte> bytes) {
  return std::vector<std::byte>(bytes.begin(), bytes.end());
}

#endif // DOCJSON_TEST_UTIL_HPP
