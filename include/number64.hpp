#ifndef DOCJSON_NUMBER64_HPP
#define DOCJSON_NUMBER64_HPP

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace docjson {

    // Value of the general "number" token: an exact 64-bit integer or a double.
    class Number64 {
    public:
        Number64() : m_is_integer(true), m_int(0), m_double(0) {}

        // Unsigned values beyond the int64 range take the double form.
        template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        Number64(T value) : m_is_integer(true), m_int(0), m_double(0) {
            if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
                if (value > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                    m_is_integer = false;
                    m_double = static_cast<double>(value);
                    return;
                }
            }
            m_int = static_cast<int64_t>(value);
        }

        template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
        Number64(T value) : m_is_integer(false), m_int(0), m_double(static_cast<double>(value)) {}

        bool is_integer() const { return m_is_integer; }
        bool is_double() const { return !m_is_integer; }

        // Truncates a double.
        int64_t to_int64() const;
        double to_double() const;

        bool is_finite() const;

        // Decimal for integers, shortest round-trip form for doubles,
        // "NaN", "Infinity" or "-Infinity" for the non-finite values.
        std::string to_string() const;

        friend bool operator==(const Number64& lhs, const Number64& rhs);
        friend bool operator!=(const Number64& lhs, const Number64& rhs) { return !(lhs == rhs); }

    private:
        bool m_is_integer;
        int64_t m_int;
        double m_double;
    };

} // namespace docjson

#endif // DOCJSON_NUMBER64_HPP
