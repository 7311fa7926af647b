#include "number64.hpp"
#include <charconv>
#include <cmath>

namespace docjson {

    int64_t Number64::to_int64() const {
        if (m_is_integer) {
            return m_int;
        }
        return static_cast<int64_t>(m_double);
    }

    double Number64::to_double() const {
        if (m_is_integer) {
            return static_cast<double>(m_int);
        }
        return m_double;
    }

    bool Number64::is_finite() const {
        return m_is_integer || std::isfinite(m_double);
    }

    std::string Number64::to_string() const {
        char buf[32];
        if (m_is_integer) {
            auto res = std::to_chars(buf, buf + sizeof(buf), m_int);
            return std::string(buf, res.ptr);
        }
        if (std::isnan(m_double)) {
            return "NaN";
        }
        if (std::isinf(m_double)) {
            return m_double > 0 ? "Infinity" : "-Infinity";
        }
        auto res = std::to_chars(buf, buf + sizeof(buf), m_double);
        return std::string(buf, res.ptr);
    }

    bool operator==(const Number64& lhs, const Number64& rhs) {
        if (lhs.m_is_integer && rhs.m_is_integer) {
            return lhs.m_int == rhs.m_int;
        }
        if (!lhs.m_is_integer && !rhs.m_is_integer) {
            return lhs.m_double == rhs.m_double;
        }

        const Number64& i = lhs.m_is_integer ? lhs : rhs;
        const Number64& d = lhs.m_is_integer ? rhs : lhs;
        // 2^63 is exactly representable; anything at or beyond it can't match an int64.
        if (!(d.m_double >= -9223372036854775808.0 && d.m_double < 9223372036854775808.0)) {
            return false;
        }
        if (d.m_double != std::trunc(d.m_double)) {
            return false;
        }
        return static_cast<int64_t>(d.m_double) == i.m_int;
    }

} // namespace docjson
