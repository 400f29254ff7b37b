#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace strongbox {

// Names of the counters and gauges the key store records.
namespace metric {
inline constexpr const char* LOADS = "keystore_loads_total";
inline constexpr const char* LOAD_FAILURES = "keystore_load_failures_total";
inline constexpr const char* PERSISTS = "keystore_persists_total";
inline constexpr const char* PERSIST_FAILURES = "keystore_persist_failures_total";
inline constexpr const char* LOOKUP_HITS = "key_lookup_hits_total";
inline constexpr const char* LOOKUP_MISSES = "key_lookup_misses_total";
inline constexpr const char* RECOVERY_FAILURES = "key_recovery_failures_total";
inline constexpr const char* DECODE_FALLBACKS = "key_decode_fallbacks_total";
inline constexpr const char* ENTRIES = "keystore_entries";
}

// Process-wide registry of key store counters and gauges.
// Exported in Prometheus text format for whoever embeds the library.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    // Clears every recorded value. Used between test cases.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, val] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << val << "\n";
        }

        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            ss << name << " " << val << "\n";
        }

        return ss.str();
    }

private:
    MetricsRegistry() = default;

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

}
