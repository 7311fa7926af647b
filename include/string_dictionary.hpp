#ifndef DOCJSON_STRING_DICTIONARY_HPP
#define DOCJSON_STRING_DICTIONARY_HPP

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

#include "utils/hash.hpp"

namespace docjson {

    // User string table for binary field names. A writer adds names as it
    // encodes them; readers and navigators decoding that output look them up.
    // Ids are dense and assigned in insertion order.
    class JsonStringDictionary {
    public:
        explicit JsonStringDictionary(size_t capacity);

        // Returns the existing id when the string is already present. Fails
        // only when the dictionary is full.
        bool try_add_string(std::string_view value, size_t& id);
        bool try_get_string_id(std::string_view value, size_t& id) const;

        // The returned view stays valid for the lifetime of the dictionary.
        bool try_get_string_at_index(size_t id, std::string_view& value) const;

        size_t size() const { return m_strings.size(); }
        size_t capacity() const { return m_capacity; }

    private:
        size_t m_capacity;
        std::deque<std::string> m_strings;
        std::unordered_map<std::string_view, size_t, utils::djb2_hasher> m_ids;
    };

} // namespace docjson

#endif // DOCJSON_STRING_DICTIONARY_HPP
