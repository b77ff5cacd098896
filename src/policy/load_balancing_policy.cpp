#include <clusterlb/policy/load_balancing_policy.h>

#include <string>

namespace clusterlb::policy {

std::size_t RoundRobinPolicy::Advance(std::size_t n) {
    auto cur = cursor_.load(std::memory_order_relaxed);
    while (true) {
        auto idx = cur % n;
        auto next = (idx + 1) % n;
        if (cursor_.compare_exchange_weak(cur, next, std::memory_order_acq_rel, std::memory_order_relaxed)) {
            return idx;
        }
    }
}

clusterlb::Result<cluster::Node> RoundRobinPolicy::Pick(const std::vector<cluster::Node>& nodes) {
    if (nodes.empty()) {
        return clusterlb::NoNodesAvailable();
    }
    return nodes[Advance(nodes.size())];
}

clusterlb::Result<std::vector<cluster::Node>> RoundRobinPolicy::Plan(const std::vector<cluster::Node>& nodes) {
    if (nodes.empty()) {
        return clusterlb::NoNodesAvailable();
    }

    auto n = nodes.size();
    auto start = Advance(n);

    std::vector<cluster::Node> plan;
    plan.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        plan.push_back(nodes[(start + i) % n]);
    }
    return plan;
}

clusterlb::Result<std::shared_ptr<ILoadBalancingPolicy>> MakeLoadBalancingPolicy(std::string_view name) {
    if (name == "round_robin") {
        return std::shared_ptr<ILoadBalancingPolicy>(std::make_shared<RoundRobinPolicy>());
    }
    return clusterlb::Status(clusterlb::StatusCode::invalid_argument,
                             "unknown load balancing policy: " + std::string(name));
}

} // namespace clusterlb::policy
