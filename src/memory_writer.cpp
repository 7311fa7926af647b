#include "memory_writer.hpp"
#include "exception.hpp"
#include "observability.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace docjson {

    JsonMemoryWriter::JsonMemoryWriter(size_t initial_capacity) : m_position(0) {
        m_buffer.resize(std::max<size_t>(initial_capacity, 1));
    }

    void JsonMemoryWriter::set_position(size_t position) {
        if (position > m_buffer.size()) {
            throw docjson::exception(JsonErrorCode::IndexOutOfRange, "position past the end of the buffer");
        }
        m_position = position;
    }

    void JsonMemoryWriter::write(std::span<const std::byte> value) {
        if (value.empty()) {
            return;
        }
        ensure_remaining_buffer_space(value.size());
        std::memcpy(m_buffer.data() + m_position, value.data(), value.size());
        m_position += value.size();
    }

    void JsonMemoryWriter::write(std::string_view value) {
        write(std::as_bytes(std::span<const char>(value.data(), value.size())));
    }

    void JsonMemoryWriter::write_byte(uint8_t value) {
        ensure_remaining_buffer_space(1);
        m_buffer[m_position++] = static_cast<std::byte>(value);
    }

    void JsonMemoryWriter::ensure_remaining_buffer_space(size_t size) {
        if (size > config::max_buffer_capacity - m_position) {
            throw docjson::exception(JsonErrorCode::InvalidLength, "buffer would exceed the maximum capacity");
        }
        if (m_position + size >= m_buffer.size()) {
            resize(m_position + size);
        }
    }

    void JsonMemoryWriter::resize(size_t min_new_size) {
        size_t new_size = min_new_size > config::max_buffer_capacity / 2 ? config::max_buffer_capacity : min_new_size * 2;

        log_if_enabled(LogLevel::Debug,
                       "Growing writer buffer from " + std::to_string(m_buffer.size()) + " to " + std::to_string(new_size) + " bytes.",
                       "BufferResize", std::chrono::microseconds(0), m_position);
        record_metric([&](IMetrics& metrics) {
            metrics.increment_buffer_resizes();
            return metrics.set_buffer_capacity(new_size);
        });

        m_buffer.resize(new_size);
    }

} // namespace docjson
