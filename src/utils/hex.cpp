#include "utils/hex.hpp"
#include "exception.hpp"

namespace docjson::utils {

    namespace {
        constexpr char hex_digits[] = "0123456789abcdef";
    } // namespace

    int hex_digit_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::vector<std::byte> hex_decode(std::string_view hex_string) {
        if (hex_string.length() % 2 != 0) {
            throw docjson::exception(JsonErrorCode::InvalidArgument, "Hex string length must be even.");
        }

        std::vector<std::byte> bytes;
        bytes.reserve(hex_string.length() / 2);

        for (size_t i = 0; i < hex_string.length(); i += 2) {
            int high_nibble = hex_digit_value(hex_string[i]);
            int low_nibble = hex_digit_value(hex_string[i + 1]);
            if (high_nibble < 0 || low_nibble < 0) {
                throw docjson::exception(JsonErrorCode::InvalidArgument, "Invalid hex character");
            }
            bytes.push_back(static_cast<std::byte>((high_nibble << 4) | low_nibble));
        }
        return bytes;
    }

    std::string hex_encode(std::span<const std::byte> bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);
        for (std::byte b : bytes) {
            auto v = std::to_integer<unsigned>(b);
            out.push_back(hex_digits[v >> 4]);
            out.push_back(hex_digits[v & 0x0F]);
        }
        return out;
    }

} // namespace docjson::utils
