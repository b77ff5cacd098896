#include <clusterlb/core/metrics.h>

#include <sstream>

namespace clusterlb {
namespace {

bool IsNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == ':';
}

void AppendLabelValue(std::string& out, std::string_view value) {
    for (char c : value) {
        switch (c) {
            case '\\': out.append("\\\\"); break;
            case '"': out.append("\\\""); break;
            case '\n': out.append("\\n"); break;
            default: out.push_back(c); break;
        }
    }
}

template <class Family, class Emit>
void WriteFamilies(std::ostringstream& oss, const std::map<std::string, Family>& families, const char* type, Emit emit) {
    for (const auto& [name, family] : families) {
        if (family.series.empty()) {
            continue;
        }
        oss << "# HELP " << name << " " << family.help << "\n";
        oss << "# TYPE " << name << " " << type << "\n";
        for (const auto& [label_text, entry] : family.series) {
            oss << name << label_text << " ";
            emit(oss, *entry.second);
            oss << "\n";
        }
    }
}

} // namespace

std::string SanitizeMetricName(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 1);
    if (name.empty() || (name.front() >= '0' && name.front() <= '9')) {
        out.push_back('_');
    }
    for (char c : name) {
        out.push_back(IsNameChar(c) ? c : '_');
    }
    return out;
}

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::string out("{");
    for (const auto& [key, value] : kv) {
        if (out.size() > 1) {
            out.push_back(',');
        }
        out.append(SanitizeMetricName(key));
        out.append("=\"");
        AppendLabelValue(out, value);
        out.push_back('"');
    }
    out.push_back('}');
    return out;
}

template <class Metric>
Metric& MetricsRegistry::SeriesLocked(std::map<std::string, Family<Metric>>& families, std::string_view name,
                                      std::string_view help, MetricLabels labels) {
    auto& family = families[SanitizeMetricName(name)];
    if (family.help.empty()) {
        family.help = std::string(help);
    }
    auto text = labels.ToPrometheusLabelText();
    auto& entry = family.series[std::move(text)];
    if (!entry.second) {
        entry.first = std::move(labels);
        entry.second = std::make_unique<Metric>();
    }
    return *entry.second;
}

Counter& MetricsRegistry::CounterMetric(std::string_view name, std::string_view help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    return SeriesLocked(counters_, name, help, std::move(labels));
}

Gauge& MetricsRegistry::GaugeMetric(std::string_view name, std::string_view help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    return SeriesLocked(gauges_, name, help, std::move(labels));
}

void MetricsRegistry::AddToCounterSeries(std::string_view name, std::string_view help, const MetricLabels& labels,
                                         std::int64_t v) {
    std::lock_guard<std::mutex> lk(mu_);
    SeriesLocked(counters_, name, help, labels).Inc(v);
}

std::int64_t MetricsRegistry::CounterSeriesValue(std::string_view name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto family = counters_.find(SanitizeMetricName(name));
    if (family == counters_.end()) {
        return 0;
    }
    auto it = family->second.series.find(labels.ToPrometheusLabelText());
    return it == family->second.series.end() ? 0 : it->second.second->Value();
}

std::size_t MetricsRegistry::RetainCounterSeries(std::string_view name, std::string_view label,
                                                 const std::set<std::string>& keep) {
    std::lock_guard<std::mutex> lk(mu_);
    auto family = counters_.find(SanitizeMetricName(name));
    if (family == counters_.end()) {
        return 0;
    }

    std::size_t dropped = 0;
    auto& series = family->second.series;
    for (auto it = series.begin(); it != series.end();) {
        auto value = it->second.first.kv.find(std::string(label));
        if (value != it->second.first.kv.end() && keep.count(value->second) == 0) {
            it = series.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;
    WriteFamilies(oss, counters_, "counter", [](std::ostringstream& o, const Counter& c) { o << c.Value(); });
    WriteFamilies(oss, gauges_, "gauge", [](std::ostringstream& o, const Gauge& g) { o << g.Value(); });
    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace clusterlb
