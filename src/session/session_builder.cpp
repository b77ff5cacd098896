#include <clusterlb/session/session_builder.h>

#include <clusterlb/cluster/resolver.h>
#include <clusterlb/core/log.h>

namespace clusterlb::session {

SessionBuilder::SessionBuilder() : metrics_(&clusterlb::DefaultMetrics()) {}

void SessionBuilder::Fail(clusterlb::Status status) {
    if (first_error_.ok()) {
        first_error_ = std::move(status);
    }
}

SessionBuilder& SessionBuilder::KnownNode(std::string_view node) {
    auto r = cluster::ParseNode(node);
    if (!r.ok()) {
        Fail(r.status());
        return *this;
    }
    known_nodes_.push_back(std::move(r).value());
    return *this;
}

SessionBuilder& SessionBuilder::KnownNodes(const std::vector<std::string_view>& nodes) {
    for (auto node : nodes) {
        KnownNode(node);
    }
    return *this;
}

SessionBuilder& SessionBuilder::KnownNodeAddr(cluster::Node node) {
    known_nodes_.push_back(std::move(node));
    return *this;
}

SessionBuilder& SessionBuilder::KnownNodesAddr(std::vector<cluster::Node> nodes) {
    for (auto& node : nodes) {
        known_nodes_.push_back(std::move(node));
    }
    return *this;
}

SessionBuilder& SessionBuilder::HostFilter(std::shared_ptr<const cluster::IHostFilter> filter) {
    if (!filter) {
        Fail(clusterlb::Status(clusterlb::StatusCode::invalid_argument, "null host filter"));
        return *this;
    }
    host_filter_ = std::move(filter);
    return *this;
}

SessionBuilder& SessionBuilder::LoadBalancing(std::shared_ptr<policy::ILoadBalancingPolicy> policy) {
    if (!policy) {
        Fail(clusterlb::Status(clusterlb::StatusCode::invalid_argument, "null load balancing policy"));
        return *this;
    }
    policy_ = std::move(policy);
    return *this;
}

SessionBuilder& SessionBuilder::Topology(std::shared_ptr<cluster::ITopology> topology) {
    if (!topology) {
        Fail(clusterlb::Status(clusterlb::StatusCode::invalid_argument, "null topology"));
        return *this;
    }
    topology_ = std::move(topology);
    return *this;
}

SessionBuilder& SessionBuilder::ResolveHostnames(bool resolve) {
    resolve_hostnames_ = resolve;
    return *this;
}

SessionBuilder& SessionBuilder::ResolveTimeout(std::chrono::milliseconds timeout) {
    resolve_timeout_ = timeout;
    return *this;
}

SessionBuilder& SessionBuilder::Metrics(clusterlb::MetricsRegistry* metrics) {
    metrics_ = metrics != nullptr ? metrics : &clusterlb::DefaultMetrics();
    return *this;
}

SessionBuilder& SessionBuilder::FromConfig(const SessionConfig& cfg) {
    for (const auto& node : cfg.known_nodes) {
        known_nodes_.push_back(node);
    }
    auto lb = policy::MakeLoadBalancingPolicy(cfg.load_balancing);
    if (!lb.ok()) {
        Fail(lb.status());
    } else {
        policy_ = std::move(lb).value();
    }
    resolve_hostnames_ = cfg.resolve_hostnames;
    resolve_timeout_ = cfg.resolve_timeout;
    return *this;
}

clusterlb::Result<std::unique_ptr<Session>> SessionBuilder::Build() const {
    if (!first_error_.ok()) {
        return first_error_;
    }

    auto topology = topology_;
    if (!topology) {
        if (known_nodes_.empty()) {
            return clusterlb::Status(clusterlb::StatusCode::invalid_argument, "empty known nodes list");
        }

        std::vector<cluster::Node> nodes = known_nodes_;
        if (resolve_hostnames_) {
            auto resolved = cluster::ResolveNodes(known_nodes_, resolve_timeout_);
            if (!resolved.ok()) {
                return resolved.status();
            }
            nodes = std::move(resolved).value();
        }
        topology = std::make_shared<cluster::StaticTopology>(std::move(nodes));
    }
    if (host_filter_) {
        topology = std::make_shared<cluster::FilteredTopology>(std::move(topology), host_filter_);
    }

    auto lb = policy_;
    if (!lb) {
        lb = std::make_shared<policy::RoundRobinPolicy>();
    }

    auto session = std::make_unique<Session>(std::move(topology), std::move(lb), *metrics_);
    clusterlb::log::info("session created: {} nodes, policy {}",
                         session->topology().Snapshot()->size(), session->policy().Name());
    return session;
}

} // namespace clusterlb::session
