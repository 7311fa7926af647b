#include "observability.hpp"

namespace docjson {

    std::string_view to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "Debug";
            case LogLevel::Info: return "Info";
            case LogLevel::Warn: return "Warn";
            case LogLevel::Error: return "Error";
        }
        return "Unknown";
    }

#ifndef DOCJSON_DISABLE_OBSERVABILITY

    namespace {

        // Installed whenever no logger or metrics collector is set, so the
        // hooks never see a null pointer.
        class DiscardingLogger : public ILogger {
        public:
            bool log(LogLevel, std::string_view, std::string_view, std::chrono::microseconds, size_t,
                     std::string_view) override {
                return true;
            }
        };

        class DiscardingMetrics : public IMetrics {
        public:
            bool record_latency(std::string_view, double) override { return true; }
            bool increment_operation_count(std::string_view, std::string_view) override { return true; }
            bool set_buffer_capacity(size_t) override { return true; }
            bool increment_buffer_resizes() override { return true; }
            bool increment_payload_shifts() override { return true; }
        };

        DiscardingLogger discarding_logger;
        DiscardingMetrics discarding_metrics;

    } // namespace

    std::atomic<ILogger*> g_logger = &discarding_logger;
    std::atomic<IMetrics*> g_metrics = &discarding_metrics;
    std::atomic<LogLevel> g_log_level_threshold = LogLevel::Info;

    void set_logger(ILogger* logger) {
        g_logger.store(logger ? logger : &discarding_logger, std::memory_order_release);
    }

    void set_metrics(IMetrics* metrics) {
        g_metrics.store(metrics ? metrics : &discarding_metrics, std::memory_order_release);
    }

    void set_log_level_threshold(LogLevel level) {
        g_log_level_threshold.store(level, std::memory_order_release);
    }

#endif // DOCJSON_DISABLE_OBSERVABILITY

} // namespace docjson
