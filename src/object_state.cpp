#include "object_state.hpp"
#include "exception.hpp"

#include <string>

namespace docjson {

    JsonObjectState::JsonObjectState(bool read_mode)
        : m_read_mode(read_mode),
          m_nesting_index(-1),
          m_context(Context::None),
          m_current_token(JsonTokenType::NotStarted) {}

    void JsonObjectState::register_token(JsonTokenType token_type) {
        switch (token_type) {
            case JsonTokenType::String:
            case JsonTokenType::Number:
            case JsonTokenType::True:
            case JsonTokenType::False:
            case JsonTokenType::Null:
            case JsonTokenType::Int8:
            case JsonTokenType::Int16:
            case JsonTokenType::Int32:
            case JsonTokenType::Int64:
            case JsonTokenType::UInt32:
            case JsonTokenType::Float32:
            case JsonTokenType::Float64:
            case JsonTokenType::Guid:
            case JsonTokenType::Binary:
                register_value(token_type);
                break;
            case JsonTokenType::BeginArray:
                register_begin_array();
                break;
            case JsonTokenType::EndArray:
                register_end_array();
                break;
            case JsonTokenType::BeginObject:
                register_begin_object();
                break;
            case JsonTokenType::EndObject:
                register_end_object();
                break;
            case JsonTokenType::FieldName:
                register_field_name();
                break;
            default:
                throw docjson::exception(JsonErrorCode::InvalidArgument,
                                         "cannot register token " + std::string(to_string(token_type)));
        }
    }

    void JsonObjectState::push(bool is_array) {
        if (m_nesting_index + 1 >= static_cast<int>(config::max_nesting_depth)) {
            throw docjson::exception(JsonErrorCode::MaxNestingExceeded);
        }

        ++m_nesting_index;
        if (is_array) {
            m_nesting_bitmap[m_nesting_index / 8] &= static_cast<uint8_t>(~mask());
            m_context = Context::Array;
        } else {
            m_nesting_bitmap[m_nesting_index / 8] |= mask();
            m_context = Context::Object;
        }
    }

    void JsonObjectState::pop() {
        --m_nesting_index;
        m_context = context_at_top();
    }

    JsonObjectState::Context JsonObjectState::context_at_top() const {
        if (m_nesting_index < 0) {
            return Context::None;
        }
        return (m_nesting_bitmap[m_nesting_index / 8] & mask()) == 0 ? Context::Array : Context::Object;
    }

    void JsonObjectState::register_value(JsonTokenType token_type) {
        if (m_context == Context::Object && m_current_token != JsonTokenType::FieldName) {
            throw docjson::exception(JsonErrorCode::MissingProperty);
        }
        if (m_context == Context::None && m_current_token != JsonTokenType::NotStarted) {
            throw docjson::exception(JsonErrorCode::PropertyArrayOrObjectNotStarted);
        }
        m_current_token = token_type;
    }

    void JsonObjectState::register_begin_array() {
        // an array start is also a value
        register_value(JsonTokenType::BeginArray);
        push(true);
    }

    void JsonObjectState::register_end_array() {
        if (m_context != Context::Array) {
            throw docjson::exception(m_read_mode ? JsonErrorCode::UnexpectedEndArray : JsonErrorCode::ArrayNotStarted);
        }
        pop();
        m_current_token = JsonTokenType::EndArray;
    }

    void JsonObjectState::register_begin_object() {
        register_value(JsonTokenType::BeginObject);
        push(false);
    }

    void JsonObjectState::register_end_object() {
        if (m_context != Context::Object) {
            throw docjson::exception(m_read_mode ? JsonErrorCode::UnexpectedEndObject : JsonErrorCode::ObjectNotStarted);
        }
        // field name without a value
        if (m_current_token == JsonTokenType::FieldName) {
            throw docjson::exception(m_read_mode ? JsonErrorCode::UnexpectedEndObject : JsonErrorCode::NotComplete);
        }
        pop();
        m_current_token = JsonTokenType::EndObject;
    }

    void JsonObjectState::register_field_name() {
        if (m_context != Context::Object) {
            throw docjson::exception(JsonErrorCode::ObjectNotStarted);
        }
        if (m_current_token == JsonTokenType::FieldName) {
            throw docjson::exception(JsonErrorCode::PropertyAlreadyAdded);
        }
        m_current_token = JsonTokenType::FieldName;
    }

} // namespace docjson
