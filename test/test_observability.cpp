#include <gtest/gtest.h>
#include "binary_writer.hpp"
#include "exception.hpp"
#include "json.hpp"
#include "navigator.hpp"
#include "observability.hpp"
#include "text_writer.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Mock Logger and Metrics for testing
class MockLogger : public docjson::ILogger {
public:
    struct Entry {
        docjson::LogLevel level;
        std::string operation;
    };

    std::atomic<int> log_call_count{0};

    bool log(docjson::LogLevel level, std::string_view, std::string_view operation, std::chrono::microseconds, size_t,
             std::string_view) override {
        log_call_count++;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back({level, std::string(operation)});
        return true;
    }

    bool saw(std::string_view operation, docjson::LogLevel level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(m_entries.begin(), m_entries.end(),
                           [&](const Entry& e) { return e.operation == operation && e.level == level; });
    }

private:
    std::mutex m_mutex;
    std::vector<Entry> m_entries;
};

class MockMetrics : public docjson::IMetrics {
public:
    std::atomic<int> metric_call_count{0};
    std::atomic<int> buffer_resizes{0};
    std::atomic<int> payload_shifts{0};
    std::atomic<size_t> last_capacity{0};
    std::atomic<int> failures{0};
    std::atomic<int> navigators{0};

    bool record_latency(std::string_view, double) override { metric_call_count++; return true; }
    bool increment_operation_count(std::string_view operation, std::string_view status) override {
        metric_call_count++;
        if (status == "failure") failures++;
        if (operation == "NavigatorCreate") navigators++;
        return true;
    }
    bool set_buffer_capacity(size_t capacity) override {
        metric_call_count++;
        last_capacity = capacity;
        return true;
    }
    bool increment_buffer_resizes() override { metric_call_count++; buffer_resizes++; return true; }
    bool increment_payload_shifts() override { metric_call_count++; payload_shifts++; return true; }
};

// Test fixture to reset global state
struct ObservabilityTest : public ::testing::Test {
    void SetUp() override {
        // Ensure globals are reset to null implementations before each test
        docjson::set_logger(nullptr);
        docjson::set_metrics(nullptr);
        docjson::set_log_level_threshold(docjson::LogLevel::Info);
    }

    void TearDown() override {
        docjson::set_logger(nullptr);
        docjson::set_metrics(nullptr);
        docjson::set_log_level_threshold(docjson::LogLevel::Info);
    }
};

TEST_F(ObservabilityTest, BufferResizeIsReported) {
    MockLogger logger;
    MockMetrics metrics;
    docjson::set_logger(&logger);
    docjson::set_metrics(&metrics);
    docjson::set_log_level_threshold(docjson::LogLevel::Debug);

    docjson::JsonWriterOptions options;
    options.initial_capacity = 4;
    docjson::JsonTextWriter writer(options);
    writer.write_string_value(std::string(100, 'x'));

    ASSERT_GE(metrics.buffer_resizes.load(), 1);
    ASSERT_GE(metrics.last_capacity.load(), 102u);
    ASSERT_TRUE(logger.saw("BufferResize", docjson::LogLevel::Debug));
}

TEST_F(ObservabilityTest, DebugMessagesAreFilteredByDefault) {
    MockLogger logger;
    MockMetrics metrics;
    docjson::set_logger(&logger);
    docjson::set_metrics(&metrics);

    docjson::JsonWriterOptions options;
    options.initial_capacity = 4;
    docjson::JsonTextWriter writer(options);
    writer.write_string_value(std::string(100, 'x'));

    // metrics are not subject to the threshold
    ASSERT_GE(metrics.buffer_resizes.load(), 1);
    ASSERT_FALSE(logger.saw("BufferResize", docjson::LogLevel::Debug));
    ASSERT_EQ(logger.log_call_count.load(), 0);
}

TEST_F(ObservabilityTest, PayloadShiftIsReported) {
    MockLogger logger;
    MockMetrics metrics;
    docjson::set_logger(&logger);
    docjson::set_metrics(&metrics);
    docjson::set_log_level_threshold(docjson::LogLevel::Debug);

    docjson::JsonBinaryWriter small;
    small.write_array_start();
    small.write_string_value(std::string(10, 'a'));
    small.write_string_value(std::string(10, 'b'));
    small.write_array_end();
    ASSERT_EQ(metrics.payload_shifts.load(), 0);

    docjson::JsonBinaryWriter large;
    large.write_array_start();
    large.write_string_value(std::string(200, 'a'));
    large.write_string_value(std::string(53, 'b'));
    large.write_array_end();
    ASSERT_EQ(metrics.payload_shifts.load(), 1);
    ASSERT_TRUE(logger.saw("ContainerEnd", docjson::LogLevel::Debug));
}

TEST_F(ObservabilityTest, InvalidJsonIsLoggedAsWarning) {
    MockLogger logger;
    MockMetrics metrics;
    docjson::set_logger(&logger);
    docjson::set_metrics(&metrics);

    ASSERT_THROW(docjson::json::from_json_string("[1,", docjson::JsonSerializationFormat::Text), docjson::exception);
    ASSERT_TRUE(logger.saw("FromJson", docjson::LogLevel::Warn));
    ASSERT_EQ(metrics.failures.load(), 1);
}

TEST_F(ObservabilityTest, NavigatorCreationIsCounted) {
    MockMetrics metrics;
    docjson::set_metrics(&metrics);

    std::string text = "[1,2]";
    auto bytes = std::as_bytes(std::span<const char>(text.data(), text.size()));
    auto navigator = docjson::IJsonNavigator::create(bytes);
    ASSERT_EQ(navigator->get_array_item_count(navigator->get_root_node()), 2u);
    ASSERT_EQ(metrics.navigators.load(), 1);
}

TEST_F(ObservabilityTest, NullptrRestoresNullImplementations) {
    MockLogger logger;
    docjson::set_logger(&logger);
    ASSERT_EQ(docjson::g_logger.load(std::memory_order_acquire), &logger);
    docjson::set_logger(nullptr);
    ASSERT_NE(docjson::g_logger.load(std::memory_order_acquire), &logger);
    ASSERT_NE(docjson::g_logger.load(std::memory_order_acquire), nullptr);
}

TEST_F(ObservabilityTest, LogLevelNames) {
    ASSERT_EQ(docjson::to_string(docjson::LogLevel::Debug), "Debug");
    ASSERT_EQ(docjson::to_string(docjson::LogLevel::Warn), "Warn");
}

TEST_F(ObservabilityTest, ThreadSafetySetLogger) {
    MockLogger mock_logger1;
    MockLogger mock_logger2;
    const int num_threads = 100;
    std::vector<std::thread> threads;

    std::atomic<int> ready_threads = 0;
    std::atomic<bool> start_test = false;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            ready_threads++;
            while (!start_test) {
                std::this_thread::yield(); // Wait for signal to start
            }
            if (i % 2 == 0) {
                docjson::set_logger(&mock_logger1);
            } else {
                docjson::set_logger(&mock_logger2);
            }
        });
    }

    // Wait for all threads to be ready
    while (ready_threads < num_threads) {
        std::this_thread::yield();
    }

    // Signal all threads to start concurrently
    start_test = true;

    for (auto& t : threads) {
        t.join();
    }

    ASSERT_NE(docjson::g_logger.load(std::memory_order_acquire), nullptr);
}

TEST_F(ObservabilityTest, ThreadSafetySetMetrics) {
    MockMetrics mock_metrics1;
    MockMetrics mock_metrics2;
    const int num_threads = 100;
    std::vector<std::thread> threads;

    std::atomic<int> ready_threads = 0;
    std::atomic<bool> start_test = false;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            ready_threads++;
            while (!start_test) {
                std::this_thread::yield();
            }
            if (i % 2 == 0) {
                docjson::set_metrics(&mock_metrics1);
            } else {
                docjson::set_metrics(&mock_metrics2);
            }
        });
    }

    while (ready_threads < num_threads) {
        std::this_thread::yield();
    }

    start_test = true;

    for (auto& t : threads) {
        t.join();
    }

    ASSERT_NE(docjson::g_metrics.load(std::memory_order_acquire), nullptr);
}

TEST_F(ObservabilityTest, ConcurrentWritersReportThroughSharedMetrics) {
    MockMetrics metrics;
    docjson::set_metrics(&metrics);
    const int num_threads = 8;
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([]() {
            docjson::JsonBinaryWriter writer;
            writer.write_array_start();
            writer.write_string_value(std::string(200, 'a'));
            writer.write_string_value(std::string(100, 'b'));
            writer.write_array_end();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(metrics.payload_shifts.load(), num_threads);
}
