#ifndef DOCJSON_MEMORY_READER_HPP
#define DOCJSON_MEMORY_READER_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace docjson {

    // Read cursor over a borrowed buffer. The buffer must outlive the reader.
    class JsonMemoryReader {
    public:
        explicit JsonMemoryReader(std::span<const std::byte> buffer) : m_buffer(buffer), m_position(0) {}

        bool is_eof() const { return m_position >= m_buffer.size(); }
        size_t position() const { return m_position; }
        size_t size() const { return m_buffer.size(); }
        std::span<const std::byte> buffer() const { return m_buffer; }

        // Reads past the end yield 0 and still advance the cursor.
        uint8_t read() {
            uint8_t value = peek();
            ++m_position;
            return value;
        }

        uint8_t peek() const {
            return m_position < m_buffer.size() ? std::to_integer<uint8_t>(m_buffer[m_position]) : 0;
        }

        uint8_t peek(size_t ahead) const {
            size_t pos = m_position + ahead;
            return pos < m_buffer.size() ? std::to_integer<uint8_t>(m_buffer[pos]) : 0;
        }

        void advance(size_t count) { m_position += count; }

        std::span<const std::byte> get_buffered_raw_json_token(size_t start) const {
            return m_buffer.subspan(start);
        }

        std::span<const std::byte> get_buffered_raw_json_token(size_t start, size_t end) const {
            return m_buffer.subspan(start, end - start);
        }

    protected:
        std::span<const std::byte> m_buffer;
        size_t m_position;
    };

} // namespace docjson

#endif // DOCJSON_MEMORY_READER_HPP
