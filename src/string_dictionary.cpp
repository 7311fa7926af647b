#include "string_dictionary.hpp"
#include "config.hpp"
#include "exception.hpp"

namespace docjson {

    JsonStringDictionary::JsonStringDictionary(size_t capacity) : m_capacity(capacity) {
        if (capacity > config::max_user_string_count) {
            throw docjson::exception(JsonErrorCode::InvalidArgument,
                                     "string dictionary capacity exceeds " + std::to_string(config::max_user_string_count));
        }
        m_ids.reserve(capacity);
    }

    bool JsonStringDictionary::try_add_string(std::string_view value, size_t& id) {
        if (try_get_string_id(value, id)) {
            return true;
        }
        if (m_strings.size() >= m_capacity) {
            return false;
        }

        id = m_strings.size();
        // deque keeps element addresses stable, so the map can key on views
        const std::string& stored = m_strings.emplace_back(value);
        m_ids.emplace(std::string_view(stored), id);
        return true;
    }

    bool JsonStringDictionary::try_get_string_id(std::string_view value, size_t& id) const {
        auto it = m_ids.find(value);
        if (it == m_ids.end()) {
            return false;
        }
        id = it->second;
        return true;
    }

    bool JsonStringDictionary::try_get_string_at_index(size_t id, std::string_view& value) const {
        if (id >= m_strings.size()) {
            return false;
        }
        value = m_strings[id];
        return true;
    }

} // namespace docjson
