#include "binary_writer.hpp"
#include "json.hpp"
#include "navigator.hpp"
#include "reader.hpp"
#include "text_writer.hpp"
#include <iostream>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace {

// A flat object with 10000 integer properties and a nested array of strings.
std::string make_sample_json() {
    std::string json = "{";
    for (int i = 0; i < 10000; ++i) {
        json += "\"key" + std::to_string(i) + "\":" + std::to_string(i) + ",";
    }
    json += "\"names\":[";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) json += ",";
        json += "\"value" + std::to_string(i) + "\"";
    }
    json += "]}";
    return json;
}

std::span<const std::byte> as_bytes(const std::string& text) {
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

} // namespace

void benchmark_binary_write() {
    auto start = std::chrono::high_resolution_clock::now();
    docjson::JsonBinaryWriter writer;
    writer.write_object_start();
    for (int i = 0; i < 10000; ++i) {
        writer.write_field_name("key" + std::to_string(i));
        writer.write_number64_value(docjson::Number64(i));
    }
    writer.write_object_end();
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_binary_write: " << diff.count() << " s (" << writer.get_result().size() << " bytes)"
              << std::endl;
}

void benchmark_text_to_binary() {
    std::string json = make_sample_json();
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < 10; ++i) {
        std::unique_ptr<docjson::IJsonReader> reader = docjson::IJsonReader::create(as_bytes(json));
        docjson::JsonBinaryWriter writer;
        reader->write_all(writer);
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_text_to_binary: " << diff.count() << " s" << std::endl;
}

void benchmark_navigator_lookup() {
    std::string json = make_sample_json();
    std::vector<std::byte> binary = docjson::json::from_json_string(json, docjson::JsonSerializationFormat::Binary);
    std::unique_ptr<docjson::IJsonNavigator> navigator = docjson::IJsonNavigator::create(binary);
    docjson::JsonNavigatorNode root = navigator->get_root_node();

    auto start = std::chrono::high_resolution_clock::now();
    int64_t sum = 0;
    for (int i = 0; i < 1000; ++i) {
        docjson::ObjectProperty property;
        if (navigator->try_get_object_property(root, "key" + std::to_string(i * 10), property)) {
            sum += navigator->get_number_value(property.value_node).to_int64();
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_navigator_lookup: " << diff.count() << " s (sum " << sum << ")" << std::endl;
}

void benchmark_binary_to_text() {
    std::string json = make_sample_json();
    std::vector<std::byte> binary = docjson::json::from_json_string(json, docjson::JsonSerializationFormat::Binary);
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < 10; ++i) {
        std::unique_ptr<docjson::IJsonNavigator> navigator = docjson::IJsonNavigator::create(binary);
        docjson::JsonTextWriter writer;
        navigator->write_to(navigator->get_root_node(), writer);
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_binary_to_text: " << diff.count() << " s" << std::endl;
}

void benchmark_json_serialization() {
    std::string json = make_sample_json();
    std::vector<std::byte> binary = docjson::json::from_json_string(json, docjson::JsonSerializationFormat::Binary);
    auto start = std::chrono::high_resolution_clock::now();
    std::string json_str = docjson::json::to_json_string(binary);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_json_serialization: " << diff.count() << " s" << std::endl;
}

void benchmark_json_deserialization() {
    std::string json_str = "{\"key0\":0,\"key1\":1,\"key2\":2,\"key3\":3,\"key4\":4,\"key5\":5,\"key6\":6,\"key7\":7,\"key8\":8,\"key9\":9}";
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < 1000; ++i) {
        std::vector<std::byte> binary = docjson::json::from_json_string(json_str, docjson::JsonSerializationFormat::Binary);
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_json_deserialization: " << diff.count() << " s" << std::endl;
}

int main() {
    try {
        benchmark_binary_write();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_binary_write failed: " << e.what() << std::endl;
    }
    try {
        benchmark_text_to_binary();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_text_to_binary failed: " << e.what() << std::endl;
    }
    try {
        benchmark_navigator_lookup();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_navigator_lookup failed: " << e.what() << std::endl;
    }
    try {
        benchmark_binary_to_text();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_binary_to_text failed: " << e.what() << std::endl;
    }
    try {
        benchmark_json_serialization();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_json_serialization failed: " << e.what() << std::endl;
    }
    try {
        benchmark_json_deserialization();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_json_deserialization failed: " << e.what() << std::endl;
    }
    return 0;
}
