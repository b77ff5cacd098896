#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <clusterlb/cluster/node.h>
#include <clusterlb/cluster/topology.h>

namespace clusterlb::cluster {

// Decides which cluster members may be handed out. Filtered out nodes stay
// members; they are only hidden from selection.
class IHostFilter {
public:
    virtual ~IHostFilter() = default;

    // Thread-safe
    virtual bool Accept(const Node& node) const = 0;
};

// Accepts only the listed nodes. With match_any_port a listed node matches
// its host on every port.
class AllowListHostFilter final : public IHostFilter {
public:
    explicit AllowListHostFilter(std::vector<Node> allowed, bool match_any_port = false);

    bool Accept(const Node& node) const override;

private:
    std::vector<Node> allowed_;
    bool match_any_port_;
};

// Membership view that hides the nodes a filter rejects, keeping order. The
// filtered list is rebuilt only when the inner snapshot changes, so repeated
// calls over an unchanged membership return the same snapshot.
class FilteredTopology final : public ITopology {
public:
    FilteredTopology(std::shared_ptr<ITopology> inner, std::shared_ptr<const IHostFilter> filter);

    NodeSnapshot Snapshot() const override;

private:
    std::shared_ptr<ITopology> inner_;
    std::shared_ptr<const IHostFilter> filter_;

    mutable std::mutex mu_;
    mutable NodeSnapshot last_inner_;
    mutable NodeSnapshot last_filtered_;
};

} // namespace clusterlb::cluster
