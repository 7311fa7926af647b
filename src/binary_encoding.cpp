#include "binary_encoding.hpp"
#include "config.hpp"
#include "exception.hpp"

#include <array>
#include <string>

namespace docjson::binary {

    namespace {
        constexpr std::array<std::string_view, config::system_string_count> system_strings = {
            "$s",
            "$t",
            "$v",
            "_attachments",
            "_etag",
            "_rid",
            "_self",
            "_ts",
            "attachments/",
            "coordinates",
            "geometry",
            "GeometryCollection",
            "id",
            "inE",
            "inV",
            "label",
            "LineString",
            "link",
            "MultiLineString",
            "MultiPoint",
            "MultiPolygon",
            "name",
            "outE",
            "outV",
            "Point",
            "Polygon",
            "properties",
            "type",
            "value",
            "Feature",
            "FeatureCollection",
            "_id",
        };

        void require(std::span<const std::byte> buffer, size_t length) {
            if (buffer.size() < length) {
                throw docjson::exception(JsonErrorCode::InvalidBinaryFormat,
                                         "value needs " + std::to_string(length) + " bytes, " +
                                             std::to_string(buffer.size()) + " available");
            }
        }

        uint8_t marker_of(std::span<const std::byte> token) {
            require(token, type_marker_length);
            return std::to_integer<uint8_t>(token[0]);
        }

        template <typename T>
        T payload(std::span<const std::byte> token, size_t offset = type_marker_length) {
            require(token, offset + sizeof(T));
            return read_little_endian<T>(token.data() + offset);
        }

        [[noreturn]] void type_mismatch(uint8_t marker, std::string_view expected) {
            throw docjson::exception(JsonErrorCode::TypeMismatch,
                                     "marker " + std::to_string(marker) + " is not " + std::string(expected));
        }

        // Header size plus payload size for a length-prefixed value.
        size_t prefixed_length(std::span<const std::byte> buffer, size_t width, size_t header) {
            require(buffer, type_marker_length + width);
            switch (width) {
                case one_byte_length: return header + payload<uint8_t>(buffer);
                case two_byte_length: return header + payload<uint16_t>(buffer);
                default: return header + payload<uint32_t>(buffer);
            }
        }
    } // namespace

    bool try_get_system_string_id(std::string_view value, size_t& id) {
        for (size_t i = 0; i < system_strings.size(); ++i) {
            if (system_strings[i] == value) {
                id = i;
                return true;
            }
        }
        return false;
    }

    bool try_get_system_string(size_t id, std::string_view& value) {
        if (id >= system_strings.size()) {
            return false;
        }
        value = system_strings[id];
        return true;
    }

    bool try_get_encoded_string_type_marker(std::string_view value, JsonStringDictionary* dictionary,
                                            MultiByteTypeMarker& marker) {
        size_t id = 0;
        if (try_get_system_string_id(value, id)) {
            marker.length = 1;
            marker.one = static_cast<uint8_t>(type_marker::system_string_1byte_min + id);
            return true;
        }

        if (dictionary != nullptr && dictionary->try_add_string(value, id)) {
            if (id < config::user_string_1byte_count) {
                marker.length = 1;
                marker.one = static_cast<uint8_t>(type_marker::user_string_1byte_min + id);
                return true;
            }
            size_t two_byte_id = id - config::user_string_1byte_count;
            if (two_byte_id < config::user_string_2byte_marker_count * 256) {
                marker.length = 2;
                marker.one = static_cast<uint8_t>(type_marker::user_string_2byte_min + two_byte_id / 256);
                marker.two = static_cast<uint8_t>(two_byte_id % 256);
                return true;
            }
        }

        return false;
    }

    JsonNodeType get_node_type(uint8_t marker) {
        using namespace type_marker;

        if (in_range(marker, literal_int_min, literal_int_max)) return JsonNodeType::Number64;
        if (in_range(marker, system_string_1byte_min, encoded_string_length_max)) return JsonNodeType::String;

        switch (marker) {
            case string_1byte_length:
            case string_2byte_length:
            case string_4byte_length:
                return JsonNodeType::String;
            case reference_string_1byte_offset:
            case reference_string_2byte_offset:
            case reference_string_3byte_offset:
            case reference_string_4byte_offset:
            case float16:
                throw docjson::exception(JsonErrorCode::NotSupported, "marker " + std::to_string(marker));
            case number_uint8:
            case number_int16:
            case number_int32:
            case number_int64:
            case number_double:
                return JsonNodeType::Number64;
            case float32: return JsonNodeType::Float32;
            case float64: return JsonNodeType::Float64;
            case null: return JsonNodeType::Null;
            case false_: return JsonNodeType::False;
            case true_: return JsonNodeType::True;
            case guid: return JsonNodeType::Guid;
            case int8: return JsonNodeType::Int8;
            case int16: return JsonNodeType::Int16;
            case int32: return JsonNodeType::Int32;
            case int64: return JsonNodeType::Int64;
            case uint32: return JsonNodeType::UInt32;
            case binary_1byte_length:
            case binary_2byte_length:
            case binary_4byte_length:
                return JsonNodeType::Binary;
            default:
                break;
        }

        if (is_array(marker)) return JsonNodeType::Array;
        if (is_object(marker)) return JsonNodeType::Object;

        throw docjson::exception(JsonErrorCode::InvalidBinaryFormat, "unknown marker " + std::to_string(marker));
    }

    namespace {
        // Length of a value that is not a single-item container.
        size_t get_leaf_value_length(std::span<const std::byte> buffer) {
            using namespace type_marker;

            uint8_t marker = marker_of(buffer);
            size_t length = 0;

            if (in_range(marker, literal_int_min, user_string_1byte_max)) {
                length = type_marker_length;
            } else if (in_range(marker, user_string_2byte_min, user_string_2byte_max)) {
                length = type_marker_length + 1;
            } else if (in_range(marker, encoded_string_length_min, encoded_string_length_max)) {
                length = type_marker_length + (marker - encoded_string_length_min);
            } else {
                switch (marker) {
                    case string_1byte_length:
                    case binary_1byte_length:
                        length = prefixed_length(buffer, one_byte_length, type_marker_length + one_byte_length);
                        break;
                    case string_2byte_length:
                    case binary_2byte_length:
                        length = prefixed_length(buffer, two_byte_length, type_marker_length + two_byte_length);
                        break;
                    case string_4byte_length:
                    case binary_4byte_length:
                        length = prefixed_length(buffer, four_byte_length, type_marker_length + four_byte_length);
                        break;

                    case number_uint8:
                    case int8:
                        length = type_marker_length + 1;
                        break;
                    case number_int16:
                    case int16:
                        length = type_marker_length + 2;
                        break;
                    case number_int32:
                    case int32:
                    case uint32:
                    case float32:
                        length = type_marker_length + 4;
                        break;
                    case number_int64:
                    case number_double:
                    case int64:
                    case float64:
                        length = type_marker_length + 8;
                        break;

                    case null:
                    case false_:
                    case true_:
                    case empty_array:
                    case empty_object:
                        length = type_marker_length;
                        break;
                    case guid:
                        length = type_marker_length + config::guid_length;
                        break;

                    case array_1byte_length:
                    case object_1byte_length:
                        length = prefixed_length(buffer, one_byte_length, type_marker_length + one_byte_length);
                        break;
                    case array_2byte_length:
                    case object_2byte_length:
                        length = prefixed_length(buffer, two_byte_length, type_marker_length + two_byte_length);
                        break;
                    case array_4byte_length:
                    case object_4byte_length:
                        length = prefixed_length(buffer, four_byte_length, type_marker_length + four_byte_length);
                        break;
                    case array_1byte_length_and_count:
                    case object_1byte_length_and_count:
                        length = prefixed_length(buffer, one_byte_length, type_marker_length + 2 * one_byte_length);
                        break;
                    case array_2byte_length_and_count:
                    case object_2byte_length_and_count:
                        length = prefixed_length(buffer, two_byte_length, type_marker_length + 2 * two_byte_length);
                        break;
                    case array_4byte_length_and_count:
                    case object_4byte_length_and_count:
                        length = prefixed_length(buffer, four_byte_length, type_marker_length + 2 * four_byte_length);
                        break;

                    default:
                        // throws with the precise reason
                        get_node_type(marker);
                        throw docjson::exception(JsonErrorCode::InvalidBinaryFormat, "unknown marker " + std::to_string(marker));
                }
            }

            require(buffer, length);
            return length;
        }
    } // namespace

    size_t get_value_length(std::span<const std::byte> buffer) {
        using namespace type_marker;

        // Single-item containers carry no length, so walk the chain of their
        // headers, keeping a count of the values still owed.
        size_t offset = 0;
        size_t pending = 1;
        size_t depth = 0;
        while (pending > 0) {
            std::span<const std::byte> rest = buffer.subspan(offset);
            uint8_t marker = marker_of(rest);
            if (marker == single_item_array || marker == single_property_object) {
                if (++depth > config::max_nesting_depth) {
                    throw docjson::exception(JsonErrorCode::MaxNestingExceeded,
                                             "single-item containers nested past " +
                                                 std::to_string(config::max_nesting_depth));
                }
                offset += type_marker_length;
                if (marker == single_property_object) {
                    ++pending;
                }
                continue;
            }
            offset += get_leaf_value_length(rest);
            --pending;
        }
        return offset;
    }

    size_t get_first_value_offset(uint8_t marker) {
        using namespace type_marker;
        switch (marker) {
            case empty_array:
            case empty_object:
            case single_item_array:
            case single_property_object:
                return type_marker_length;
            case array_1byte_length:
            case object_1byte_length:
                return type_marker_length + one_byte_length;
            case array_2byte_length:
            case object_2byte_length:
                return type_marker_length + two_byte_length;
            case array_4byte_length:
            case object_4byte_length:
                return type_marker_length + four_byte_length;
            case array_1byte_length_and_count:
            case object_1byte_length_and_count:
                return type_marker_length + 2 * one_byte_length;
            case array_2byte_length_and_count:
            case object_2byte_length_and_count:
                return type_marker_length + 2 * two_byte_length;
            case array_4byte_length_and_count:
            case object_4byte_length_and_count:
                return type_marker_length + 2 * four_byte_length;
            default:
                type_mismatch(marker, "an array or object");
        }
    }

    bool try_get_serialized_count(std::span<const std::byte> container, size_t& count) {
        using namespace type_marker;
        uint8_t marker = marker_of(container);
        switch (marker) {
            case array_1byte_length_and_count:
            case object_1byte_length_and_count:
                count = payload<uint8_t>(container, type_marker_length + one_byte_length);
                return true;
            case array_2byte_length_and_count:
            case object_2byte_length_and_count:
                count = payload<uint16_t>(container, type_marker_length + two_byte_length);
                return true;
            case array_4byte_length_and_count:
            case object_4byte_length_and_count:
                count = payload<uint32_t>(container, type_marker_length + four_byte_length);
                return true;
            default:
                return false;
        }
    }

    Number64 get_number_value(std::span<const std::byte> token) {
        using namespace type_marker;
        uint8_t marker = marker_of(token);
        if (in_range(marker, literal_int_min, literal_int_max)) {
            return Number64(static_cast<int64_t>(marker - literal_int_min));
        }
        switch (marker) {
            case number_uint8: return Number64(payload<uint8_t>(token));
            case number_int16: return Number64(payload<int16_t>(token));
            case number_int32: return Number64(payload<int32_t>(token));
            case number_int64: return Number64(payload<int64_t>(token));
            case number_double: return Number64(payload<double>(token));
            default: type_mismatch(marker, "a number");
        }
    }

    int8_t get_int8_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::int8) type_mismatch(marker, "an int8");
        return payload<int8_t>(token);
    }

    int16_t get_int16_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::int16) type_mismatch(marker, "an int16");
        return payload<int16_t>(token);
    }

    int32_t get_int32_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::int32) type_mismatch(marker, "an int32");
        return payload<int32_t>(token);
    }

    int64_t get_int64_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::int64) type_mismatch(marker, "an int64");
        return payload<int64_t>(token);
    }

    uint32_t get_uint32_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::uint32) type_mismatch(marker, "a uint32");
        return payload<uint32_t>(token);
    }

    float get_float32_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::float32) type_mismatch(marker, "a float32");
        return payload<float>(token);
    }

    double get_float64_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::float64) type_mismatch(marker, "a float64");
        return payload<double>(token);
    }

    Guid get_guid_value(std::span<const std::byte> token) {
        uint8_t marker = marker_of(token);
        if (marker != type_marker::guid) type_mismatch(marker, "a guid");
        require(token, type_marker_length + config::guid_length);
        return Guid::from_bytes(token.subspan(type_marker_length, config::guid_length));
    }

    std::span<const std::byte> get_binary_value(std::span<const std::byte> token) {
        using namespace type_marker;
        uint8_t marker = marker_of(token);
        size_t header = 0;
        switch (marker) {
            case binary_1byte_length: header = type_marker_length + one_byte_length; break;
            case binary_2byte_length: header = type_marker_length + two_byte_length; break;
            case binary_4byte_length: header = type_marker_length + four_byte_length; break;
            default: type_mismatch(marker, "binary");
        }
        size_t length = get_value_length(token);
        return token.subspan(header, length - header);
    }

    std::string_view get_string_value(std::span<const std::byte> token, const JsonStringDictionary* dictionary) {
        using namespace type_marker;
        uint8_t marker = marker_of(token);

        auto as_view = [&](size_t header, size_t length) {
            require(token, header + length);
            return std::string_view(reinterpret_cast<const char*>(token.data() + header), length);
        };

        auto user_string = [&](size_t id) {
            std::string_view value;
            if (dictionary == nullptr || !dictionary->try_get_string_at_index(id, value)) {
                throw docjson::exception(JsonErrorCode::InvalidBinaryFormat,
                                         "user string " + std::to_string(id) + " is not in the dictionary");
            }
            return value;
        };

        if (in_range(marker, system_string_1byte_min, system_string_1byte_max)) {
            std::string_view value;
            try_get_system_string(marker - system_string_1byte_min, value);
            return value;
        }
        if (in_range(marker, user_string_1byte_min, user_string_1byte_max)) {
            return user_string(marker - user_string_1byte_min);
        }
        if (in_range(marker, user_string_2byte_min, user_string_2byte_max)) {
            size_t id = config::user_string_1byte_count + (marker - user_string_2byte_min) * 256 + payload<uint8_t>(token);
            return user_string(id);
        }
        if (in_range(marker, encoded_string_length_min, encoded_string_length_max)) {
            return as_view(type_marker_length, marker - encoded_string_length_min);
        }

        switch (marker) {
            case string_1byte_length:
                return as_view(type_marker_length + one_byte_length, payload<uint8_t>(token));
            case string_2byte_length:
                return as_view(type_marker_length + two_byte_length, payload<uint16_t>(token));
            case string_4byte_length:
                return as_view(type_marker_length + four_byte_length, payload<uint32_t>(token));
            case reference_string_1byte_offset:
            case reference_string_2byte_offset:
            case reference_string_3byte_offset:
            case reference_string_4byte_offset:
                throw docjson::exception(JsonErrorCode::NotSupported, "reference strings");
            default:
                type_mismatch(marker, "a string");
        }
    }

} // namespace docjson::binary
