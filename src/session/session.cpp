#include <clusterlb/session/session.h>

#include <clusterlb/core/log.h>

#include <set>
#include <string>

namespace clusterlb::session {

clusterlb::MetricLabels NodeLabels(const cluster::Node& node) {
    clusterlb::MetricLabels labels;
    labels.kv["node"] = node.ToString();
    return labels;
}

Session::Session(std::shared_ptr<cluster::ITopology> topology,
                 std::shared_ptr<policy::ILoadBalancingPolicy> policy,
                 clusterlb::MetricsRegistry& metrics)
    : topology_(std::move(topology)),
      policy_(std::move(policy)),
      metrics_(metrics),
      no_nodes_(metrics.CounterMetric("clusterlb_no_nodes_available_total",
                                      "Picks that failed because the cluster had no nodes")),
      cluster_size_(metrics.GaugeMetric("clusterlb_cluster_size", "Nodes in the last observed membership snapshot")) {}

void Session::PruneNodeCounters(const cluster::NodeList& members) {
    std::set<std::string> keep;
    for (const auto& n : members) {
        keep.insert(n.ToString());
    }
    auto dropped = metrics_.RetainCounterSeries(kNodePicksMetric, "node", keep);
    if (dropped != 0) {
        clusterlb::log::debug("dropped pick counters of {} departed nodes", dropped);
    }
}

cluster::NodeSnapshot Session::Observe() {
    auto snapshot = topology_->Snapshot();
    cluster_size_.Set(static_cast<double>(snapshot->size()));

    auto prev = last_seen_.exchange(snapshot.get(), std::memory_order_acq_rel);
    if (prev != nullptr && prev != snapshot.get()) {
        PruneNodeCounters(*snapshot);
    }
    return snapshot;
}

clusterlb::Result<cluster::Node> Session::PickNode() {
    auto snapshot = Observe();
    auto picked = policy_->Pick(*snapshot);
    if (!picked.ok()) {
        if (picked.status().code() == clusterlb::StatusCode::no_nodes_available) {
            no_nodes_.Inc();
            clusterlb::log::debug("{} pick failed: {}", policy_->Name(), picked.status().message());
        }
        return picked;
    }

    metrics_.AddToCounterSeries(kNodePicksMetric, "Nodes handed out by the load balancing policy",
                                NodeLabels(picked.value()));
    return picked;
}

clusterlb::Result<std::vector<cluster::Node>> Session::QueryPlan() {
    auto snapshot = Observe();
    auto plan = policy_->Plan(*snapshot);
    if (!plan.ok() && plan.status().code() == clusterlb::StatusCode::no_nodes_available) {
        no_nodes_.Inc();
    }
    return plan;
}

clusterlb::Status Session::Execute(const std::function<clusterlb::Status(const cluster::Node&)>& work) {
    auto node = PickNode();
    if (!node.ok()) {
        return node.status();
    }
    return work(node.value());
}

} // namespace clusterlb::session
