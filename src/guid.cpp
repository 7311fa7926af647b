#include "guid.hpp"
#include "exception.hpp"
#include "utils/hex.hpp"

#include <cstring>

namespace docjson {

    namespace {
        // Byte index for each pair of hex digits in textual order.
        constexpr size_t text_order[config::guid_length] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};

        constexpr bool is_hyphen_position(size_t i) {
            return i == 8 || i == 13 || i == 18 || i == 23;
        }
    }

    bool Guid::try_parse(std::string_view text, Guid& out) {
        if (text.size() != config::guid_string_length) {
            return false;
        }

        Guid result;
        size_t pair = 0;
        for (size_t i = 0; i < text.size();) {
            if (is_hyphen_position(i)) {
                if (text[i] != '-') return false;
                ++i;
                continue;
            }
            int high = utils::hex_digit_value(text[i]);
            int low = utils::hex_digit_value(text[i + 1]);
            if (high < 0 || low < 0) return false;
            result.bytes[text_order[pair++]] = static_cast<std::byte>((high << 4) | low);
            i += 2;
        }
        out = result;
        return true;
    }

    Guid Guid::parse(std::string_view text) {
        Guid result;
        if (!try_parse(text, result)) {
            throw docjson::exception(JsonErrorCode::InvalidToken, "malformed guid '" + std::string(text) + "'");
        }
        return result;
    }

    Guid Guid::from_bytes(std::span<const std::byte> data) {
        if (data.size() != config::guid_length) {
            throw docjson::exception(JsonErrorCode::InvalidLength, "guid must be 16 bytes");
        }
        Guid result;
        std::memcpy(result.bytes.data(), data.data(), config::guid_length);
        return result;
    }

    std::string Guid::to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(config::guid_string_length);
        for (size_t pair = 0; pair < config::guid_length; ++pair) {
            if (pair == 4 || pair == 6 || pair == 8 || pair == 10) {
                out.push_back('-');
            }
            auto v = std::to_integer<unsigned>(bytes[text_order[pair]]);
            out.push_back(digits[v >> 4]);
            out.push_back(digits[v & 0x0F]);
        }
        return out;
    }

} // namespace docjson
