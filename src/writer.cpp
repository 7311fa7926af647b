#include "writer.hpp"
#include "binary_writer.hpp"
#include "exception.hpp"
#include "text_writer.hpp"

namespace docjson {

    std::unique_ptr<IJsonWriter> IJsonWriter::create(JsonSerializationFormat format, const JsonWriterOptions& options) {
        switch (format) {
            case JsonSerializationFormat::Text:
                return std::make_unique<JsonTextWriter>(options);
            case JsonSerializationFormat::Binary:
                return std::make_unique<JsonBinaryWriter>(options);
        }
        throw docjson::exception(JsonErrorCode::NotSupported, "unknown serialization format");
    }

} // namespace docjson
