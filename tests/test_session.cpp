#include <chtest.hpp>

#include <clusterlb/cluster/host_filter.h>
#include <clusterlb/cluster/topology.h>
#include <clusterlb/core/metrics.h>
#include <clusterlb/policy/load_balancing_policy.h>
#include <clusterlb/session/session_builder.h>

#include <memory>
#include <string>
#include <vector>

using clusterlb::cluster::Node;
using clusterlb::cluster::StaticTopology;
using clusterlb::session::NodeLabels;
using clusterlb::session::SessionBuilder;

TEST_CASE("SessionBuilder requires known nodes") {
    auto s = SessionBuilder().ResolveHostnames(false).Build();
    REQUIRE(!s.ok());
    REQUIRE(s.status().code() == clusterlb::StatusCode::invalid_argument);
}

TEST_CASE("SessionBuilder reports the first bad known node") {
    auto s = SessionBuilder().KnownNode("a:1").KnownNode("b:bad").KnownNode("c:").ResolveHostnames(false).Build();
    REQUIRE(!s.ok());
    REQUIRE(s.status().code() == clusterlb::StatusCode::invalid_argument);
    REQUIRE(s.status().message().find("b:bad") != std::string::npos);
}

TEST_CASE("Session rotates through known nodes") {
    clusterlb::MetricsRegistry metrics;
    auto s = SessionBuilder()
                 .KnownNodes({"172.42.0.2", "172.42.0.3", "172.42.0.4"})
                 .Metrics(&metrics)
                 .Build();
    REQUIRE(s.ok());
    auto& session = *s.value();
    REQUIRE(session.policy().Name() == "round_robin");

    std::vector<std::string> seen;
    for (int i = 0; i < 6; ++i) {
        auto n = session.PickNode();
        REQUIRE(n.ok());
        seen.push_back(n.value().ToString());
    }
    REQUIRE(seen[0] == "172.42.0.2:9042");
    REQUIRE(seen[1] == "172.42.0.3:9042");
    REQUIRE(seen[2] == "172.42.0.4:9042");
    REQUIRE(seen[3] == seen[0]);
    REQUIRE(seen[4] == seen[1]);
    REQUIRE(seen[5] == seen[2]);

    REQUIRE(metrics.CounterSeriesValue("clusterlb_node_picks_total", NodeLabels(Node{"172.42.0.3", 9042})) == 2);
    REQUIRE(metrics.GaugeMetric("clusterlb_cluster_size", "").Value() == 3.0);
}

TEST_CASE("Session follows membership changes of an injected topology") {
    clusterlb::MetricsRegistry metrics;
    auto topo = std::make_shared<StaticTopology>(
        std::vector<Node>{Node{"a", 9042}, Node{"b", 9042}, Node{"c", 9042}, Node{"d", 9042}});
    auto rr = std::make_shared<clusterlb::policy::RoundRobinPolicy>();

    auto s = SessionBuilder().Topology(topo).LoadBalancing(rr).Metrics(&metrics).Build();
    REQUIRE(s.ok());
    auto& session = *s.value();

    for (int i = 0; i < 3; ++i) {
        REQUIRE(session.PickNode().ok());
    }
    REQUIRE(rr->cursor() == 3);

    topo->Set({Node{"a", 9042}, Node{"b", 9042}});
    auto n = session.PickNode();
    REQUIRE(n.ok());
    REQUIRE(n.value().host == "b");

    topo->Set({});
    auto none = session.PickNode();
    REQUIRE(!none.ok());
    REQUIRE(none.status().code() == clusterlb::StatusCode::no_nodes_available);
    REQUIRE(metrics.CounterMetric("clusterlb_no_nodes_available_total", "").Value() == 1);
    REQUIRE(metrics.GaugeMetric("clusterlb_cluster_size", "").Value() == 0.0);
}

TEST_CASE("Session::Execute runs work once and never on an empty cluster") {
    clusterlb::MetricsRegistry metrics;
    auto topo = std::make_shared<StaticTopology>(std::vector<Node>{Node{"a", 9042}, Node{"b", 9042}});
    auto s = SessionBuilder().Topology(topo).Metrics(&metrics).Build();
    REQUIRE(s.ok());
    auto& session = *s.value();

    int calls = 0;
    std::string target;
    auto st = session.Execute([&](const Node& node) {
        ++calls;
        target = node.host;
        return clusterlb::Status(clusterlb::StatusCode::unavailable, "connection refused");
    });
    REQUIRE(calls == 1);
    REQUIRE(target == "a");
    REQUIRE(st.code() == clusterlb::StatusCode::unavailable);

    topo->Set({});
    st = session.Execute([&](const Node&) {
        ++calls;
        return clusterlb::Status::Ok();
    });
    REQUIRE(calls == 1);
    REQUIRE(st.code() == clusterlb::StatusCode::no_nodes_available);
}

TEST_CASE("Session query plan rotates its starting node") {
    clusterlb::MetricsRegistry metrics;
    auto topo = std::make_shared<StaticTopology>(std::vector<Node>{Node{"a", 9042}, Node{"b", 9042}, Node{"c", 9042}});
    auto s = SessionBuilder().Topology(topo).Metrics(&metrics).Build();
    REQUIRE(s.ok());

    auto p1 = s.value()->QueryPlan();
    auto p2 = s.value()->QueryPlan();
    REQUIRE(p1.ok());
    REQUIRE(p2.ok());
    REQUIRE(p1.value().size() == 3);
    REQUIRE(p1.value()[0].host == "a");
    REQUIRE(p2.value()[0].host == "b");
    REQUIRE(p2.value()[2].host == "a");
}

TEST_CASE("SessionBuilder takes known nodes and policy from config") {
    clusterlb::session::SessionConfig cfg;
    cfg.known_nodes = {Node{"10.1.0.1", 9042}, Node{"10.1.0.2", 9042}};
    cfg.resolve_hostnames = false;

    auto s = SessionBuilder().FromConfig(cfg).Metrics(nullptr).Build();
    REQUIRE(s.ok());
    REQUIRE(s.value()->topology().Snapshot()->size() == 2);

    cfg.load_balancing = "random";
    auto bad = SessionBuilder().FromConfig(cfg).Build();
    REQUIRE(!bad.ok());
    REQUIRE(bad.status().code() == clusterlb::StatusCode::invalid_argument);
}

TEST_CASE("SessionBuilder accepts a list of node addresses") {
    clusterlb::MetricsRegistry metrics;
    auto s = SessionBuilder()
                 .KnownNodeAddr(Node{"10.2.0.1", 9042})
                 .KnownNodesAddr({Node{"10.2.0.2", 9042}, Node{"10.2.0.3", 19042}})
                 .ResolveHostnames(false)
                 .Metrics(&metrics)
                 .Build();
    REQUIRE(s.ok());

    auto snap = s.value()->topology().Snapshot();
    REQUIRE(snap->size() == 3);
    REQUIRE((*snap)[2] == (Node{"10.2.0.3", 19042}));
}

TEST_CASE("Session only hands out nodes accepted by the host filter") {
    clusterlb::MetricsRegistry metrics;
    auto filter = std::make_shared<clusterlb::cluster::AllowListHostFilter>(
        std::vector<Node>{Node{"10.3.0.1", 9042}, Node{"10.3.0.3", 9042}});
    auto s = SessionBuilder()
                 .KnownNodes({"10.3.0.1", "10.3.0.2", "10.3.0.3"})
                 .ResolveHostnames(false)
                 .HostFilter(filter)
                 .Metrics(&metrics)
                 .Build();
    REQUIRE(s.ok());
    auto& session = *s.value();

    std::vector<std::string> seen;
    for (int i = 0; i < 4; ++i) {
        auto n = session.PickNode();
        REQUIRE(n.ok());
        seen.push_back(n.value().host);
    }
    REQUIRE(seen[0] == "10.3.0.1");
    REQUIRE(seen[1] == "10.3.0.3");
    REQUIRE(seen[2] == "10.3.0.1");
    REQUIRE(seen[3] == "10.3.0.3");
    REQUIRE(metrics.GaugeMetric("clusterlb_cluster_size", "").Value() == 2.0);
}

TEST_CASE("Session reports no nodes when the host filter rejects every member") {
    clusterlb::MetricsRegistry metrics;
    auto topo = std::make_shared<StaticTopology>(std::vector<Node>{Node{"a", 9042}, Node{"b", 9042}});
    auto filter = std::make_shared<clusterlb::cluster::AllowListHostFilter>(std::vector<Node>{Node{"c", 9042}});
    auto s = SessionBuilder().Topology(topo).HostFilter(filter).Metrics(&metrics).Build();
    REQUIRE(s.ok());

    auto none = s.value()->PickNode();
    REQUIRE(!none.ok());
    REQUIRE(none.status().code() == clusterlb::StatusCode::no_nodes_available);

    topo->Add(Node{"c", 9042});
    auto c = s.value()->PickNode();
    REQUIRE(c.ok());
    REQUIRE(c.value().host == "c");
}

TEST_CASE("SessionBuilder rejects a null host filter") {
    auto s = SessionBuilder().KnownNode("a").ResolveHostnames(false).HostFilter(nullptr).Build();
    REQUIRE(!s.ok());
    REQUIRE(s.status().code() == clusterlb::StatusCode::invalid_argument);
}

TEST_CASE("Session drops pick counters of nodes that left the cluster") {
    clusterlb::MetricsRegistry metrics;
    auto topo = std::make_shared<StaticTopology>(std::vector<Node>{Node{"a", 9042}, Node{"b", 9042}});
    auto s = SessionBuilder().Topology(topo).Metrics(&metrics).Build();
    REQUIRE(s.ok());
    auto& session = *s.value();

    REQUIRE(session.PickNode().ok());
    REQUIRE(session.PickNode().ok());
    REQUIRE(session.PickNode().ok());
    REQUIRE(metrics.CounterSeriesValue("clusterlb_node_picks_total", NodeLabels(Node{"a", 9042})) == 2);
    REQUIRE(metrics.CounterSeriesValue("clusterlb_node_picks_total", NodeLabels(Node{"b", 9042})) == 1);

    topo->Remove(Node{"b", 9042});
    REQUIRE(session.PickNode().ok());

    REQUIRE(metrics.CounterSeriesValue("clusterlb_node_picks_total", NodeLabels(Node{"a", 9042})) == 3);
    REQUIRE(metrics.CounterSeriesValue("clusterlb_node_picks_total", NodeLabels(Node{"b", 9042})) == 0);
    REQUIRE(metrics.ToPrometheusText().find("b:9042") == std::string::npos);
}
