#include "utils/base64.hpp"
#include "exception.hpp"
#include <cstdint>

namespace docjson::utils {

    namespace {
        constexpr char alphabet[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        int decode_char(char c) noexcept {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '+') return 62;
            if (c == '/') return 63;
            return -1;
        }
    } // namespace

    bool is_base64_char(char c) noexcept {
        return decode_char(c) >= 0 || c == '=';
    }

    void base64_encode(std::span<const std::byte> bytes, std::string& out) {
        out.reserve(out.size() + ((bytes.size() + 2) / 3) * 4);
        size_t i = 0;
        for (; i + 3 <= bytes.size(); i += 3) {
            uint32_t v = (std::to_integer<uint32_t>(bytes[i]) << 16) |
                         (std::to_integer<uint32_t>(bytes[i + 1]) << 8) |
                         std::to_integer<uint32_t>(bytes[i + 2]);
            out.push_back(alphabet[(v >> 18) & 0x3F]);
            out.push_back(alphabet[(v >> 12) & 0x3F]);
            out.push_back(alphabet[(v >> 6) & 0x3F]);
            out.push_back(alphabet[v & 0x3F]);
        }
        size_t rest = bytes.size() - i;
        if (rest == 1) {
            uint32_t v = std::to_integer<uint32_t>(bytes[i]) << 16;
            out.push_back(alphabet[(v >> 18) & 0x3F]);
            out.push_back(alphabet[(v >> 12) & 0x3F]);
            out.append("==");
        } else if (rest == 2) {
            uint32_t v = (std::to_integer<uint32_t>(bytes[i]) << 16) |
                         (std::to_integer<uint32_t>(bytes[i + 1]) << 8);
            out.push_back(alphabet[(v >> 18) & 0x3F]);
            out.push_back(alphabet[(v >> 12) & 0x3F]);
            out.push_back(alphabet[(v >> 6) & 0x3F]);
            out.push_back('=');
        }
    }

    std::string base64_encode(std::span<const std::byte> bytes) {
        std::string out;
        base64_encode(bytes, out);
        return out;
    }

    std::vector<std::byte> base64_decode(std::string_view text) {
        if (text.size() % 4 != 0) {
            throw docjson::exception(JsonErrorCode::InvalidToken, "base64 length must be a multiple of 4");
        }

        size_t padding = 0;
        if (!text.empty() && text.back() == '=') {
            padding = (text.size() >= 2 && text[text.size() - 2] == '=') ? 2 : 1;
        }

        std::vector<std::byte> bytes;
        bytes.reserve(text.size() / 4 * 3);

        for (size_t i = 0; i < text.size(); i += 4) {
            bool last = i + 4 == text.size();
            uint32_t v = 0;
            for (size_t j = 0; j < 4; ++j) {
                char c = text[i + j];
                int d = decode_char(c);
                if (d < 0) {
                    if (c == '=' && last && j >= 4 - padding) {
                        d = 0;
                    } else {
                        throw docjson::exception(JsonErrorCode::InvalidToken, "invalid base64 character");
                    }
                }
                v = (v << 6) | static_cast<uint32_t>(d);
            }
            bytes.push_back(static_cast<std::byte>((v >> 16) & 0xFF));
            if (!last || padding < 2) bytes.push_back(static_cast<std::byte>((v >> 8) & 0xFF));
            if (!last || padding < 1) bytes.push_back(static_cast<std::byte>(v & 0xFF));
        }
        return bytes;
    }

} // namespace docjson::utils
