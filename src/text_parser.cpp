#include "text_parser.hpp"
#include "exception.hpp"
#include "utils/base64.hpp"
#include "utils/hex.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace docjson::text {

    namespace {
        std::string_view strip_prefix(std::string_view token, std::string_view prefix) {
            if (token.substr(0, prefix.size()) != prefix) {
                throw docjson::exception(JsonErrorCode::InvalidToken,
                                         "expected prefix '" + std::string(prefix) + "' on '" + std::string(token) + "'");
            }
            return token.substr(prefix.size());
        }

        template <typename T>
        T parse_integer(std::string_view digits) {
            int64_t value = 0;
            auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (res.ec != std::errc() || res.ptr != digits.data() + digits.size() ||
                value < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                value > static_cast<int64_t>(std::numeric_limits<T>::max())) {
                throw docjson::exception(JsonErrorCode::InvalidNumber, "'" + std::string(digits) + "'");
            }
            return static_cast<T>(value);
        }

        template <typename T>
        T parse_floating(std::string_view digits) {
            T value = 0;
            auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (res.ec != std::errc() || res.ptr != digits.data() + digits.size() || !std::isfinite(value)) {
                throw docjson::exception(JsonErrorCode::InvalidNumber, "'" + std::string(digits) + "'");
            }
            return value;
        }

        // Decimal exponent of the leading significant digit of a valid JSON number.
        int64_t decimal_magnitude(std::string_view token) {
            size_t i = token.substr(0, 1) == "-" ? 1 : 0;
            int64_t integer_digits = 0;
            int64_t leading_zeros = 0;
            bool fraction = false;
            bool significant = false;
            for (; i < token.size() && token[i] != 'e' && token[i] != 'E'; ++i) {
                if (token[i] == '.') {
                    fraction = true;
                    continue;
                }
                if (!significant && token[i] == '0') {
                    leading_zeros += fraction ? 1 : 0;
                    continue;
                }
                significant = true;
                integer_digits += fraction ? 0 : 1;
            }
            if (!significant) {
                return std::numeric_limits<int32_t>::min();
            }

            int64_t exponent = 0;
            if (i < token.size()) {
                std::string_view digits = token.substr(i + 1);
                bool negative = !digits.empty() && digits[0] == '-';
                if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
                    digits.remove_prefix(1);
                }
                auto res = std::from_chars(digits.data(), digits.data() + digits.size(), exponent);
                if (res.ec == std::errc::result_out_of_range) {
                    exponent = std::numeric_limits<int32_t>::max();
                }
                exponent = negative ? -exponent : exponent;
            }
            return (integer_digits > 0 ? integer_digits - 1 : -(leading_zeros + 1)) + exponent;
        }

        // A number token outside the double range overflows to infinity and underflows to zero.
        double parse_general_double(std::string_view token) {
            double value = 0;
            auto res = std::from_chars(token.data(), token.data() + token.size(), value);
            if (res.ptr != token.data() + token.size() ||
                (res.ec != std::errc() && res.ec != std::errc::result_out_of_range)) {
                throw docjson::exception(JsonErrorCode::InvalidNumber, "'" + std::string(token) + "'");
            }
            if (res.ec == std::errc::result_out_of_range) {
                bool negative = token.substr(0, 1) == "-";
                if (decimal_magnitude(token) > 0) {
                    value = std::numeric_limits<double>::infinity();
                } else {
                    value = 0.0;
                }
                value = negative ? -value : value;
            }
            return value;
        }

        void append_utf8(std::string& out, uint32_t code_point) {
            if (code_point < 0x80) {
                out.push_back(static_cast<char>(code_point));
            } else if (code_point < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            } else if (code_point < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
        }

        uint32_t read_hex4(std::string_view s, size_t pos) {
            if (pos + 4 > s.size()) {
                throw docjson::exception(JsonErrorCode::InvalidEscapedCharacter, "truncated \\u escape");
            }
            uint32_t value = 0;
            for (size_t i = 0; i < 4; ++i) {
                int digit = utils::hex_digit_value(s[pos + i]);
                if (digit < 0) {
                    throw docjson::exception(JsonErrorCode::InvalidEscapedCharacter, "invalid \\u escape");
                }
                value = (value << 4) | static_cast<uint32_t>(digit);
            }
            return value;
        }
    } // namespace

    Number64 get_number_value(std::string_view token) {
        bool is_integer = token.find_first_of(".eE") == std::string_view::npos;
        if (is_integer) {
            int64_t value = 0;
            auto res = std::from_chars(token.data(), token.data() + token.size(), value);
            if (res.ec == std::errc() && res.ptr == token.data() + token.size()) {
                return Number64(value);
            }
            if (res.ec != std::errc::result_out_of_range) {
                throw docjson::exception(JsonErrorCode::InvalidNumber, "'" + std::string(token) + "'");
            }
            // integers beyond 64 bits fall back to double precision
        }
        return Number64(parse_general_double(token));
    }

    int8_t get_int8_value(std::string_view token) {
        return parse_integer<int8_t>(strip_prefix(token, "I"));
    }

    int16_t get_int16_value(std::string_view token) {
        return parse_integer<int16_t>(strip_prefix(token, "H"));
    }

    int32_t get_int32_value(std::string_view token) {
        return parse_integer<int32_t>(strip_prefix(token, "L"));
    }

    int64_t get_int64_value(std::string_view token) {
        std::string_view digits = strip_prefix(token, "LL");
        int64_t value = 0;
        auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (res.ec != std::errc() || res.ptr != digits.data() + digits.size()) {
            throw docjson::exception(JsonErrorCode::InvalidNumber, "'" + std::string(digits) + "'");
        }
        return value;
    }

    uint32_t get_uint32_value(std::string_view token) {
        return parse_integer<uint32_t>(strip_prefix(token, "UL"));
    }

    float get_float32_value(std::string_view token) {
        return parse_floating<float>(strip_prefix(token, "S"));
    }

    double get_float64_value(std::string_view token) {
        return parse_floating<double>(strip_prefix(token, "D"));
    }

    Guid get_guid_value(std::string_view token) {
        return Guid::parse(strip_prefix(token, "G"));
    }

    std::vector<std::byte> get_binary_value(std::string_view token) {
        return utils::base64_decode(strip_prefix(token, "B"));
    }

    std::string get_string_value(std::string_view token) {
        if (token.size() < 2 || token.front() != '"' || token.back() != '"') {
            throw docjson::exception(JsonErrorCode::InvalidToken, "string token must be quoted");
        }
        std::string_view body = token.substr(1, token.size() - 2);

        std::string out;
        out.reserve(body.size());
        for (size_t i = 0; i < body.size(); ++i) {
            char c = body[i];
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (++i >= body.size()) {
                throw docjson::exception(JsonErrorCode::InvalidEscapedCharacter, "dangling backslash");
            }
            switch (body[i]) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    uint32_t code_point = read_hex4(body, i + 1);
                    i += 4;
                    // high surrogate followed by a low one
                    if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < body.size() &&
                        body[i + 1] == '\\' && body[i + 2] == 'u') {
                        uint32_t low = read_hex4(body, i + 3);
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
                            i += 6;
                        }
                    }
                    append_utf8(out, code_point);
                    break;
                }
                default:
                    throw docjson::exception(JsonErrorCode::InvalidEscapedCharacter,
                                             std::string("\\") + body[i]);
            }
        }
        return out;
    }

} // namespace docjson::text
