#ifndef DOCJSON_UTILS_HASH_HPP
#define DOCJSON_UTILS_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace docjson::utils {

    // hash * 33 + c over the bytes of key
    constexpr uint32_t djb2_hash(std::string_view key) {
        uint32_t hash = 5381;
        for (char c : key) {
            hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
        }
        return hash;
    }

    // Hasher for the string dictionary's id map.
    struct djb2_hasher {
        size_t operator()(std::string_view key) const noexcept { return djb2_hash(key); }
    };

} // namespace docjson::utils

#endif // DOCJSON_UTILS_HASH_HPP
