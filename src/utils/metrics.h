#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <string>
#include <map>
#include <mutex>
#include <ostream>
#include <vector>

namespace mimeid {

/**
 * CloudWatch Embedded Metric Format (EMF) metrics publisher
 * Emits one JSON line per metric to the configured stream (stderr by default)
 *
 * Publishing never waits on the stream. A caller that finds another thread
 * writing queues its line and returns; the writing thread drains the queue
 * before it lets go of the stream.
 *
 * Reference: https://docs.aws.amazon.com/AmazonCloudWatch/latest/monitoring/CloudWatch_Embedded_Metric_Format.html
 */
class Metrics {
public:
    using DimensionMap = std::map<std::string, std::string>;

    /**
     * Initialize metrics with service configuration
     * @param namespace_name Metric namespace (e.g., "MimeId")
     * @param service_name Service name for default dimension
     * @param environment Environment name (e.g., "production")
     * @param enabled Whether metrics are enabled
     * @param out Destination stream; must outlive every metric published to it
     *
     * Reconfigures the process-wide instance in place.
     */
    static void initialize(
        const std::string& namespace_name,
        const std::string& service_name,
        const std::string& environment = "production",
        bool enabled = true,
        std::ostream* out = nullptr
    );

    /**
     * Get the singleton metrics instance
     */
    static Metrics& get();

    /**
     * Publish a counter metric
     * @param name Metric name (e.g., "BoundaryTokensGenerated")
     * @param value Counter value (default 1)
     * @param unit Metric unit (None, Count, Percent, etc.)
     * @param dimensions Additional dimensions beyond default
     */
    void publish_count(
        const std::string& name,
        double value = 1.0,
        const std::string& unit = "Count",
        const DimensionMap& dimensions = {}
    );

    /**
     * Build the EMF document for a single metric without emitting it
     */
    nlohmann::json create_emf_log(
        const std::string& name,
        double value,
        const std::string& unit,
        const DimensionMap& dimensions
    ) const;

    bool is_enabled() const { return enabled_.load(std::memory_order_relaxed); }

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

private:
    Metrics();

    struct PendingLine {
        std::ostream* out;
        std::string line;
    };

    // Writes queued lines until the queue stays empty with the stream released
    void drain();

    std::atomic<bool> enabled_{false};

    mutable std::mutex config_mutex_;
    std::string namespace_;
    std::string service_name_;
    std::string environment_;
    std::ostream* out_;

    std::mutex pending_mutex_;
    std::vector<PendingLine> pending_;

    // Held by the one thread currently writing; others only try_lock it
    std::mutex write_mutex_;
};

#define METRICS_COUNT(name, ...) \
    if (auto& m = mimeid::Metrics::get(); m.is_enabled()) { \
        m.publish_count(name, ##__VA_ARGS__); \
    }

} // namespace mimeid
