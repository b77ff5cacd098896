#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

#include <clusterlb/cluster/node.h>
#include <clusterlb/cluster/topology.h>
#include <clusterlb/core/metrics.h>
#include <clusterlb/core/status.h>
#include <clusterlb/policy/load_balancing_policy.h>

namespace clusterlb::session {

inline constexpr const char* kNodePicksMetric = "clusterlb_node_picks_total";

// {node="host:port"}
clusterlb::MetricLabels NodeLabels(const cluster::Node& node);

// Routes work to cluster nodes chosen by a load balancing policy over the
// current membership snapshot. There is no retry: a failed pick or a failed
// piece of work is returned to the caller as is.
//
// Per-node pick counters exist only for current members. When the observed
// membership changes, the counters of departed nodes are dropped, so the
// registry does not grow with node churn.
class Session {
public:
    Session(std::shared_ptr<cluster::ITopology> topology,
            std::shared_ptr<policy::ILoadBalancingPolicy> policy,
            clusterlb::MetricsRegistry& metrics);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Thread-safe
    clusterlb::Result<cluster::Node> PickNode();

    // Thread-safe
    clusterlb::Result<std::vector<cluster::Node>> QueryPlan();

    // Thread-safe. Runs work once on the picked node; work is not called
    // when no node is available.
    clusterlb::Status Execute(const std::function<clusterlb::Status(const cluster::Node&)>& work);

    cluster::ITopology& topology() const { return *topology_; }
    policy::ILoadBalancingPolicy& policy() const { return *policy_; }

private:
    cluster::NodeSnapshot Observe();
    void PruneNodeCounters(const cluster::NodeList& members);

    std::shared_ptr<cluster::ITopology> topology_;
    std::shared_ptr<policy::ILoadBalancingPolicy> policy_;
    clusterlb::MetricsRegistry& metrics_;
    clusterlb::Counter& no_nodes_;
    clusterlb::Gauge& cluster_size_;

    // Identity of the last observed snapshot; compared, never dereferenced.
    std::atomic<const cluster::NodeList*> last_seen_{nullptr};
};

} // namespace clusterlb::session
