#include "utils/metrics.h"
#include "utils/logger.h"
#include <chrono>
#include <iostream>
#include <utility>

namespace mimeid {

void Metrics::initialize(
    const std::string& namespace_name,
    const std::string& service_name,
    const std::string& environment,
    bool enabled,
    std::ostream* out
) {
    Metrics& metrics = get();
    {
        std::lock_guard<std::mutex> lock(metrics.config_mutex_);
        metrics.namespace_ = namespace_name;
        metrics.service_name_ = service_name;
        metrics.environment_ = environment;
        metrics.out_ = out ? out : &std::cerr;
    }
    metrics.enabled_.store(enabled);

    if (enabled) {
        LOG_DEBUG("Metrics initialized: namespace={}, service={}, environment={}",
                  namespace_name, service_name, environment);
    } else {
        LOG_DEBUG("Metrics disabled");
    }
}

Metrics& Metrics::get() {
    // A library linked into someone else's process stays quiet unless asked
    static Metrics instance;
    return instance;
}

Metrics::Metrics()
    : namespace_("MimeId")
    , service_name_("mimeid")
    , environment_("production")
    , out_(&std::cerr)
{}

void Metrics::publish_count(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    if (!is_enabled()) return;

    std::string line = create_emf_log(name, value, unit, dimensions).dump();

    std::ostream* out;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        out = out_;
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.push_back(PendingLine{out, std::move(line)});
    }

    drain();
}

void Metrics::drain() {
    while (true) {
        std::unique_lock<std::mutex> writer(write_mutex_, std::try_to_lock);
        if (!writer.owns_lock()) {
            // The thread holding the stream picks up our line
            return;
        }

        while (true) {
            std::vector<PendingLine> batch;
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                batch.swap(pending_);
            }
            if (batch.empty()) break;

            for (const auto& pending : batch) {
                *pending.out << pending.line << std::endl;
            }
        }

        writer.unlock();

        // A line queued after the last swap but before the unlock saw the
        // stream busy and left it to us
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.empty()) return;
    }
}

nlohmann::json Metrics::create_emf_log(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) const {
    std::string namespace_name;
    std::string service_name;
    std::string environment;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        namespace_name = namespace_;
        service_name = service_name_;
        environment = environment_;
    }

    std::vector<std::vector<std::string>> dimension_sets;
    std::vector<std::string> dimension_names = {"ServiceName", "Environment"};

    for (const auto& [key, val] : dimensions) {
        dimension_names.push_back(key);
    }

    dimension_sets.push_back(dimension_names);

    nlohmann::json emf_log = {
        {"_aws", {
            {"Timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()},
            {"CloudWatchMetrics", {
                {
                    {"Namespace", namespace_name},
                    {"Dimensions", dimension_sets},
                    {"Metrics", {
                        {
                            {"Name", name},
                            {"Unit", unit}
                        }
                    }}
                }
            }}
        }},
        {"ServiceName", service_name},
        {"Environment", environment},
        {name, value}
    };

    for (const auto& [key, val] : dimensions) {
        emf_log[key] = val;
    }

    return emf_log;
}

} // namespace mimeid
