#ifndef DOCJSON_GUID_HPP
#define DOCJSON_GUID_HPP

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "config.hpp"

namespace docjson {

    // 16 bytes in the database's layout: the first three groups are stored
    // little-endian, the last two in textual order.
    struct Guid {
        std::array<std::byte, config::guid_length> bytes{};

        // Accepts the 36 character hyphenated form, any hex case.
        static bool try_parse(std::string_view text, Guid& out);
        static Guid parse(std::string_view text);
        static Guid from_bytes(std::span<const std::byte> data);

        // Lowercase hyphenated form.
        std::string to_string() const;

        bool operator==(const Guid& other) const { return bytes == other.bytes; }
        bool operator!=(const Guid& other) const { return bytes != other.bytes; }
    };

} // namespace docjson

#endif // DOCJSON_GUID_HPP
