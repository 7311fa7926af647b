#include "observability.hpp"
#include "binary_writer.hpp"
#include "exception.hpp"
#include "json.hpp"
#include "text_writer.hpp"
#include <iostream>
#include <string>

class ConsoleLogger : public docjson::ILogger {
public:
    bool log(docjson::LogLevel level,
           std::string_view message,
           std::string_view operation,
           std::chrono::microseconds duration,
           size_t buffer_offset,
           std::string_view key) override {
        std::cout << "[" << docjson::to_string(level) << "] "
                  << message << " | "
                  << "operation: " << operation << " | "
                  << "duration: " << duration.count() << "us | "
                  << "offset: " << buffer_offset << " | "
                  << "key: " << key
                  << std::endl;
        return true;
    }
};


class ConsoleMetrics : public docjson::IMetrics {
public:
    bool record_latency(std::string_view operation, double seconds) override {
        std::cout << "Metric: " << operation << " latency: " << seconds << "s" << std::endl;
        return true;
    }
    bool increment_operation_count(std::string_view operation, std::string_view status) override {
        std::cout << "Metric: " << operation << " count: 1, status: " << status << std::endl;
        return true;
    }
    bool set_buffer_capacity(size_t capacity_bytes) override {
        std::cout << "Metric: buffer capacity: " << capacity_bytes << " bytes" << std::endl;
        return true;
    }
    bool increment_buffer_resizes() override {
        std::cout << "Metric: buffer resizes: 1" << std::endl;
        return true;
    }
    bool increment_payload_shifts() override {
        std::cout << "Metric: payload shifts: 1" << std::endl;
        return true;
    }
};

int main() {
    ConsoleLogger logger;
    ConsoleMetrics metrics;
    docjson::set_logger(&logger);
    docjson::set_metrics(&metrics);

    std::cout << "--- Converting JSON at the default Info threshold (Debug is filtered) ---" << std::endl;
    std::vector<std::byte> binary =
        docjson::json::from_json_string(R"({"id":"a1","tags":["x","y"]})", docjson::JsonSerializationFormat::Binary);
    std::cout << "binary size: " << binary.size() << " bytes" << std::endl;

    std::cout << "\n--- Invalid JSON is reported at Warn ---" << std::endl;
    try {
        docjson::json::from_json_string("{\"id\":", docjson::JsonSerializationFormat::Text);
    } catch (const docjson::exception& e) {
        std::cout << "caught: " << e.what() << std::endl;
    }

    std::cout << "\n--- Setting log level to Debug ---" << std::endl;
    docjson::set_log_level_threshold(docjson::LogLevel::Debug);

    std::cout << "Writing a text document into a 4 byte buffer (should log BufferResize)" << std::endl;
    docjson::JsonWriterOptions options;
    options.initial_capacity = 4;
    docjson::JsonTextWriter text_writer(options);
    text_writer.write_string_value("a string longer than four bytes");

    std::cout << "Closing an array whose payload outgrows one length byte (should log ContainerEnd)" << std::endl;
    docjson::JsonBinaryWriter binary_writer;
    binary_writer.write_array_start();
    binary_writer.write_string_value(std::string(200, 'a'));
    binary_writer.write_string_value(std::string(100, 'b'));
    binary_writer.write_array_end();

    std::cout << "Rendering the binary document back to JSON" << std::endl;
    std::cout << docjson::json::to_json_string(binary) << std::endl;

    docjson::set_logger(nullptr);
    docjson::set_metrics(nullptr);
    return 0;
}
