#ifndef DOCJSON_MEMORY_WRITER_HPP
#define DOCJSON_MEMORY_WRITER_HPP

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "config.hpp"

namespace docjson {

    // Growable, exclusively owned output buffer with a write cursor.
    class JsonMemoryWriter {
    public:
        explicit JsonMemoryWriter(size_t initial_capacity = config::initial_buffer_capacity);

        size_t position() const { return m_position; }
        void set_position(size_t position);
        size_t capacity() const { return m_buffer.size(); }

        std::byte* data() { return m_buffer.data(); }
        const std::byte* data() const { return m_buffer.data(); }
        std::byte* cursor() { return m_buffer.data() + m_position; }

        // Bytes [0, position).
        std::span<const std::byte> written() const { return {m_buffer.data(), m_position}; }

        void write(std::span<const std::byte> value);
        void write(std::string_view value);
        void write_byte(uint8_t value);

        // Little-endian, any integral or floating point type.
        template <typename T>
        void write_little_endian(T value) {
            static_assert(std::is_arithmetic_v<T>, "arithmetic types only");
            ensure_remaining_buffer_space(sizeof(T));
            store_little_endian(m_buffer.data() + m_position, value);
            m_position += sizeof(T);
        }

        template <typename T>
        static void store_little_endian(std::byte* dest, T value) {
            static_assert(std::is_arithmetic_v<T>, "arithmetic types only");
            std::byte raw[sizeof(T)];
            std::memcpy(raw, &value, sizeof(T));
            if constexpr (std::endian::native == std::endian::big) {
                for (size_t i = 0; i < sizeof(T); ++i) {
                    dest[i] = raw[sizeof(T) - 1 - i];
                }
            } else {
                std::memcpy(dest, raw, sizeof(T));
            }
        }

        // Grows the buffer so at least `size` more bytes fit past the cursor.
        void ensure_remaining_buffer_space(size_t size);

    private:
        void resize(size_t min_new_size);

        std::vector<std::byte> m_buffer;
        size_t m_position;
    };

} // namespace docjson

#endif // DOCJSON_MEMORY_WRITER_HPP
