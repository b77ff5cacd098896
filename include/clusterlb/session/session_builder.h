#pragma once

#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

#include <clusterlb/cluster/host_filter.h>
#include <clusterlb/cluster/node.h>
#include <clusterlb/cluster/topology.h>
#include <clusterlb/core/metrics.h>
#include <clusterlb/core/status.h>
#include <clusterlb/policy/load_balancing_policy.h>
#include <clusterlb/session/session.h>
#include <clusterlb/session/session_config.h>

namespace clusterlb::session {

// Collects session options, then creates a Session with Build().
//
//   auto session = SessionBuilder()
//                      .KnownNode("172.42.0.2:9042")
//                      .KnownNode("db1.example.com")
//                      .LoadBalancing(std::make_shared<policy::RoundRobinPolicy>())
//                      .Build();
//
// Setters never fail; the first invalid argument is reported by Build().
class SessionBuilder {
public:
    SessionBuilder();

    SessionBuilder& KnownNode(std::string_view node);
    SessionBuilder& KnownNodes(const std::vector<std::string_view>& nodes);
    SessionBuilder& KnownNodeAddr(cluster::Node node);
    SessionBuilder& KnownNodesAddr(std::vector<cluster::Node> nodes);

    SessionBuilder& LoadBalancing(std::shared_ptr<policy::ILoadBalancingPolicy> policy);

    // Replaces the known node list as the membership source.
    SessionBuilder& Topology(std::shared_ptr<cluster::ITopology> topology);

    // Hides the nodes the filter rejects from selection. Applies to known
    // nodes and to an injected topology alike.
    SessionBuilder& HostFilter(std::shared_ptr<const cluster::IHostFilter> filter);

    SessionBuilder& ResolveHostnames(bool resolve);
    SessionBuilder& ResolveTimeout(std::chrono::milliseconds timeout);

    // Defaults to DefaultMetrics(). The registry must outlive the session.
    SessionBuilder& Metrics(clusterlb::MetricsRegistry* metrics);

    // Known nodes, policy name and resolve options. The log level is left to
    // the caller.
    SessionBuilder& FromConfig(const SessionConfig& cfg);

    clusterlb::Result<std::unique_ptr<Session>> Build() const;

private:
    void Fail(clusterlb::Status status);

    std::vector<cluster::Node> known_nodes_;
    std::shared_ptr<policy::ILoadBalancingPolicy> policy_;
    std::shared_ptr<cluster::ITopology> topology_;
    std::shared_ptr<const cluster::IHostFilter> host_filter_;
    bool resolve_hostnames_ = true;
    std::chrono::milliseconds resolve_timeout_{5000};
    clusterlb::MetricsRegistry* metrics_ = nullptr;
    clusterlb::Status first_error_;
};

} // namespace clusterlb::session
