#include <chtest.hpp>

#include <clusterlb/core/metrics.h>

#include <set>
#include <string>

using clusterlb::MetricLabels;
using clusterlb::MetricsRegistry;

TEST_CASE("SanitizeMetricName keeps valid names and rewrites the rest") {
    REQUIRE(clusterlb::SanitizeMetricName("clusterlb_picks_total") == "clusterlb_picks_total");
    REQUIRE(clusterlb::SanitizeMetricName("node picks-total") == "node_picks_total");
    REQUIRE(clusterlb::SanitizeMetricName("9lives") == "_9lives");
    REQUIRE(clusterlb::SanitizeMetricName("") == "_");
}

TEST_CASE("Label text escapes values and sanitizes keys") {
    MetricLabels labels;
    labels.kv["node"] = "[::1]:9042";
    labels.kv["bad key"] = "say \"hi\"\\n";
    REQUIRE(labels.ToPrometheusLabelText() == "{bad_key=\"say \\\"hi\\\"\\\\n\",node=\"[::1]:9042\"}");
    REQUIRE(MetricLabels{}.ToPrometheusLabelText().empty());
}

TEST_CASE("Exposition groups series under one header per family") {
    MetricsRegistry reg;
    MetricLabels a;
    a.kv["node"] = "a:9042";
    MetricLabels b;
    b.kv["node"] = "b:9042";

    reg.AddToCounterSeries("picks_total", "Picks", a, 2);
    reg.AddToCounterSeries("picks_total", "Picks", b);
    reg.GaugeMetric("cluster_size", "Members").Set(2);

    auto text = reg.ToPrometheusText();
    REQUIRE(text == "# HELP picks_total Picks\n"
                    "# TYPE picks_total counter\n"
                    "picks_total{node=\"a:9042\"} 2\n"
                    "picks_total{node=\"b:9042\"} 1\n"
                    "# HELP cluster_size Members\n"
                    "# TYPE cluster_size gauge\n"
                    "cluster_size 2\n");
}

TEST_CASE("CounterMetric returns the same series for the same labels") {
    MetricsRegistry reg;
    MetricLabels l;
    l.kv["node"] = "a:9042";

    reg.CounterMetric("hits_total", "Hits", l).Inc();
    reg.CounterMetric("hits_total", "Hits", l).Inc(4);
    REQUIRE(reg.CounterSeriesValue("hits_total", l) == 5);
    REQUIRE(reg.CounterSeriesValue("hits_total", MetricLabels{}) == 0);
    REQUIRE(reg.CounterSeriesValue("missing_total", l) == 0);
}

TEST_CASE("RetainCounterSeries drops series outside the keep set") {
    MetricsRegistry reg;
    for (const char* node : {"a:9042", "b:9042", "c:9042"}) {
        MetricLabels l;
        l.kv["node"] = node;
        reg.AddToCounterSeries("picks_total", "Picks", l);
    }

    REQUIRE(reg.RetainCounterSeries("picks_total", "node", std::set<std::string>{"b:9042"}) == 2);
    REQUIRE(reg.RetainCounterSeries("picks_total", "node", std::set<std::string>{"b:9042"}) == 0);
    REQUIRE(reg.RetainCounterSeries("unknown_total", "node", {}) == 0);

    auto text = reg.ToPrometheusText();
    REQUIRE(text.find("a:9042") == std::string::npos);
    REQUIRE(text.find("picks_total{node=\"b:9042\"} 1") != std::string::npos);
}
