#ifndef DOCJSON_JSON_HPP
#define DOCJSON_JSON_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "string_dictionary.hpp"
#include "token.hpp"
#include "writer.hpp"

namespace docjson::json {

    // Renders a text or binary buffer as strict JSON. Typed numbers become
    // plain numbers, GUIDs canonical strings, binary values lowercase hex and
    // non-finite numbers null.
    std::string to_json_string(std::span<const std::byte> buffer, const JsonStringDictionary* dictionary = nullptr);

    // Parses strict JSON and encodes it in the requested format. Throws
    // InvalidArgument when the input is not valid JSON.
    std::vector<std::byte> from_json_string(std::string_view json, JsonSerializationFormat format,
                                            const JsonWriterOptions& options = {});

} // namespace docjson::json

#endif // DOCJSON_JSON_HPP
