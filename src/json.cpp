#include "json.hpp"
#include "exception.hpp"
#include "navigator.hpp"
#include "observability.hpp"
#include "utils/hex.hpp"
#include "yyjson.h"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <new>
#include <string>

namespace docjson::json {

    namespace {

        yyjson_mut_val* copy_string(yyjson_mut_doc* doc, std::string_view value) {
            return yyjson_mut_strncpy(doc, value.data(), value.size());
        }

        yyjson_mut_val* real_or_null(yyjson_mut_doc* doc, double value) {
            return std::isfinite(value) ? yyjson_mut_real(doc, value) : yyjson_mut_null(doc);
        }

        yyjson_mut_val* to_yyjson_val(const IJsonNavigator& navigator, JsonNavigatorNode node, yyjson_mut_doc* doc) {
            switch (navigator.get_node_type(node)) {
                case JsonNodeType::Null:
                    return yyjson_mut_null(doc);
                case JsonNodeType::False:
                    return yyjson_mut_bool(doc, false);
                case JsonNodeType::True:
                    return yyjson_mut_bool(doc, true);
                case JsonNodeType::Number64: {
                    Number64 value = navigator.get_number_value(node);
                    if (value.is_integer()) {
                        return yyjson_mut_sint(doc, value.to_int64());
                    }
                    return real_or_null(doc, value.to_double());
                }
                case JsonNodeType::String:
                case JsonNodeType::FieldName:
                    return copy_string(doc, navigator.get_string_value(node));
                case JsonNodeType::Int8:
                    return yyjson_mut_sint(doc, navigator.get_int8_value(node));
                case JsonNodeType::Int16:
                    return yyjson_mut_sint(doc, navigator.get_int16_value(node));
                case JsonNodeType::Int32:
                    return yyjson_mut_sint(doc, navigator.get_int32_value(node));
                case JsonNodeType::Int64:
                    return yyjson_mut_sint(doc, navigator.get_int64_value(node));
                case JsonNodeType::UInt32:
                    return yyjson_mut_uint(doc, navigator.get_uint32_value(node));
                case JsonNodeType::Float32:
                    return real_or_null(doc, navigator.get_float32_value(node));
                case JsonNodeType::Float64:
                    return real_or_null(doc, navigator.get_float64_value(node));
                case JsonNodeType::Guid:
                    return copy_string(doc, navigator.get_guid_value(node).to_string());
                case JsonNodeType::Binary: {
                    std::vector<std::byte> bytes = navigator.get_binary_value(node);
                    return copy_string(doc, utils::hex_encode(bytes));
                }
                case JsonNodeType::Array: {
                    yyjson_mut_val* arr = yyjson_mut_arr(doc);
                    for (JsonNavigatorNode item : navigator.get_array_items(node)) {
                        yyjson_mut_arr_append(arr, to_yyjson_val(navigator, item, doc));
                    }
                    return arr;
                }
                case JsonNodeType::Object: {
                    yyjson_mut_val* obj = yyjson_mut_obj(doc);
                    for (const ObjectProperty& property : navigator.get_object_properties(node)) {
                        yyjson_mut_val* key = copy_string(doc, navigator.get_string_value(property.name_node));
                        yyjson_mut_obj_add(obj, key, to_yyjson_val(navigator, property.value_node, doc));
                    }
                    return obj;
                }
            }
            throw docjson::exception(JsonErrorCode::InvalidArgument, "unknown node type");
        }

        void from_yyjson_val(yyjson_val* val, IJsonWriter& writer) {
            switch (yyjson_get_type(val)) {
                case YYJSON_TYPE_NULL:
                    writer.write_null_value();
                    break;
                case YYJSON_TYPE_BOOL:
                    writer.write_bool_value(yyjson_get_bool(val));
                    break;
                case YYJSON_TYPE_NUM:
                    if (yyjson_is_sint(val)) {
                        writer.write_number64_value(Number64(yyjson_get_sint(val)));
                    } else if (yyjson_is_uint(val)) {
                        writer.write_number64_value(Number64(yyjson_get_uint(val)));
                    } else {
                        writer.write_number64_value(Number64(yyjson_get_real(val)));
                    }
                    break;
                case YYJSON_TYPE_STR:
                    writer.write_string_value(std::string_view(yyjson_get_str(val), yyjson_get_len(val)));
                    break;
                case YYJSON_TYPE_ARR: {
                    writer.write_array_start();
                    yyjson_arr_iter iter;
                    yyjson_arr_iter_init(val, &iter);
                    yyjson_val* item;
                    while ((item = yyjson_arr_iter_next(&iter))) {
                        from_yyjson_val(item, writer);
                    }
                    writer.write_array_end();
                    break;
                }
                case YYJSON_TYPE_OBJ: {
                    writer.write_object_start();
                    yyjson_obj_iter iter;
                    yyjson_obj_iter_init(val, &iter);
                    yyjson_val* key;
                    while ((key = yyjson_obj_iter_next(&iter))) {
                        writer.write_field_name(std::string_view(yyjson_get_str(key), yyjson_get_len(key)));
                        from_yyjson_val(yyjson_obj_iter_get_val(key), writer);
                    }
                    writer.write_object_end();
                    break;
                }
                default:
                    throw docjson::exception(JsonErrorCode::NotSupported, "unsupported yyjson value");
            }
        }

        std::chrono::microseconds elapsed_since(std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        }

    } // namespace

    std::string to_json_string(std::span<const std::byte> buffer, const JsonStringDictionary* dictionary) {
        auto start = std::chrono::steady_clock::now();

        std::unique_ptr<IJsonNavigator> navigator = IJsonNavigator::create(buffer, dictionary);

        std::unique_ptr<yyjson_mut_doc, decltype(&yyjson_mut_doc_free)> doc(yyjson_mut_doc_new(nullptr),
                                                                            &yyjson_mut_doc_free);
        if (!doc) {
            throw std::bad_alloc();
        }
        yyjson_mut_doc_set_root(doc.get(), to_yyjson_val(*navigator, navigator->get_root_node(), doc.get()));

        size_t length = 0;
        char* json_str = yyjson_mut_write(doc.get(), 0, &length);
        if (!json_str) {
            throw std::bad_alloc();
        }
        std::string result(json_str, length);
        free(json_str);

        auto duration = elapsed_since(start);
        log_if_enabled(LogLevel::Debug, "Converted buffer to JSON", "ToJson", duration, buffer.size());
        record_metric([&](IMetrics& m) {
            return m.record_latency("ToJson", std::chrono::duration<double>(duration).count());
        });
        return result;
    }

    std::vector<std::byte> from_json_string(std::string_view json, JsonSerializationFormat format,
                                            const JsonWriterOptions& options) {
        auto start = std::chrono::steady_clock::now();

        yyjson_read_err err;
        // without YYJSON_READ_INSITU the input is left untouched
        std::unique_ptr<yyjson_doc, decltype(&yyjson_doc_free)> doc(
            yyjson_read_opts(const_cast<char*>(json.data()), json.size(), 0, nullptr, &err), &yyjson_doc_free);
        if (!doc) {
            std::string message = std::string("Invalid JSON: ") + (err.msg ? err.msg : "unknown error");
            log_if_enabled(LogLevel::Warn, message, "FromJson", elapsed_since(start), err.pos);
            record_metric([](IMetrics& m) { return m.increment_operation_count("FromJson", "failure"); });
            throw docjson::exception(JsonErrorCode::InvalidArgument, message + " at offset " + std::to_string(err.pos));
        }

        std::unique_ptr<IJsonWriter> writer = IJsonWriter::create(format, options);
        from_yyjson_val(yyjson_doc_get_root(doc.get()), *writer);
        std::span<const std::byte> result = writer->get_result();

        auto duration = elapsed_since(start);
        log_if_enabled(LogLevel::Debug, "Converted JSON to " + std::string(to_string(format)), "FromJson", duration,
                       result.size());
        record_metric([&](IMetrics& m) {
            m.increment_operation_count("FromJson", "success");
            return m.record_latency("FromJson", std::chrono::duration<double>(duration).count());
        });
        return std::vector<std::byte>(result.begin(), result.end());
    }

} // namespace docjson::json
