#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace clusterlb {

struct MetricLabels {
    std::map<std::string, std::string> kv;

    // {k="v",...} with keys sanitized and values escaped; empty when no labels.
    std::string ToPrometheusLabelText() const;
};

// Replaces characters outside [a-zA-Z0-9_:] with '_' and prefixes a leading
// digit, so any string can be used as a metric or label name.
std::string SanitizeMetricName(std::string_view name);

class Counter {
public:
    // Thread-safe
    void Inc(std::int64_t v = 1) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

class Gauge {
public:
    // Thread-safe
    void Set(double v) { value_.store(v, std::memory_order_relaxed); }
    double Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0.0};
};

// Series are grouped into families by name and exported in name order, with
// one HELP/TYPE header per family.
class MetricsRegistry {
public:
    // Thread-safe. The returned reference stays valid for the registry's
    // lifetime; do not prune the series it belongs to.
    Counter& CounterMetric(std::string_view name, std::string_view help, MetricLabels labels = {});
    Gauge& GaugeMetric(std::string_view name, std::string_view help, MetricLabels labels = {});

    // Thread-safe. Increments a counter series under the registry lock, for
    // series that RetainCounterSeries may drop.
    void AddToCounterSeries(std::string_view name, std::string_view help, const MetricLabels& labels, std::int64_t v = 1);

    // Thread-safe. 0 for an unknown series.
    std::int64_t CounterSeriesValue(std::string_view name, const MetricLabels& labels) const;

    // Thread-safe. Drops series of counter family `name` whose `label` value
    // is not in keep. Returns the number of series dropped.
    std::size_t RetainCounterSeries(std::string_view name, std::string_view label, const std::set<std::string>& keep);

    // Thread-safe
    std::string ToPrometheusText() const;

private:
    template <class Metric>
    struct Family {
        std::string help;
        std::map<std::string, std::pair<MetricLabels, std::unique_ptr<Metric>>> series;
    };

    template <class Metric>
    static Metric& SeriesLocked(std::map<std::string, Family<Metric>>& families, std::string_view name,
                                std::string_view help, MetricLabels labels);

    mutable std::mutex mu_;
    std::map<std::string, Family<Counter>> counters_;
    std::map<std::string, Family<Gauge>> gauges_;
};

// Global default registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace clusterlb
