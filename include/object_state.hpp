#ifndef DOCJSON_OBJECT_STATE_HPP
#define DOCJSON_OBJECT_STATE_HPP

#include <array>
#include <cstdint>

#include "config.hpp"
#include "token.hpp"

namespace docjson {

    // Grammar tracker shared by every reader and writer. Validates the order
    // of tokens and tracks whether each enclosing scope is an array or an
    // object (one bit per nesting level).
    class JsonObjectState {
    public:
        // read_mode selects the reader flavour of the end-token errors
        // (UnexpectedEndArray / UnexpectedEndObject) over the writer flavour
        // (ArrayNotStarted / ObjectNotStarted / NotComplete).
        explicit JsonObjectState(bool read_mode);

        // Throws docjson::exception when the token is not legal here.
        void register_token(JsonTokenType token_type);

        int current_depth() const { return m_nesting_index + 1; }
        JsonTokenType current_token_type() const { return m_current_token; }

        bool is_property_expected() const {
            return m_current_token != JsonTokenType::FieldName && m_context == Context::Object;
        }
        bool in_array_context() const { return m_context == Context::Array; }
        bool in_object_context() const { return m_context == Context::Object; }

    private:
        enum class Context : uint8_t { None, Array, Object };

        void push(bool is_array);
        void pop();
        uint8_t mask() const { return static_cast<uint8_t>(1u << (m_nesting_index % 8)); }
        Context context_at_top() const;

        void register_value(JsonTokenType token_type);
        void register_begin_array();
        void register_end_array();
        void register_begin_object();
        void register_end_object();
        void register_field_name();

        bool m_read_mode;
        std::array<uint8_t, config::max_nesting_depth / 8> m_nesting_bitmap{};
        int m_nesting_index;
        Context m_context;
        JsonTokenType m_current_token;
    };

} // namespace docjson

#endif // DOCJSON_OBJECT_STATE_HPP
