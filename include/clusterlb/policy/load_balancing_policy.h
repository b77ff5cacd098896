#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include <clusterlb/cluster/node.h>
#include <clusterlb/core/status.h>

namespace clusterlb::policy {

class ILoadBalancingPolicy {
public:
    virtual ~ILoadBalancingPolicy() = default;

    virtual std::string_view Name() const = 0;

    // Thread-safe. Fails with no_nodes_available when nodes is empty.
    virtual clusterlb::Result<cluster::Node> Pick(const std::vector<cluster::Node>& nodes) = 0;

    // Thread-safe. Every node once, starting with the one Pick() would have
    // returned. Consumes the same single selection as Pick().
    virtual clusterlb::Result<std::vector<cluster::Node>> Plan(const std::vector<cluster::Node>& nodes) = 0;
};

// Hands out nodes one after another, wrapping at the end of the list.
//
// The cursor is shared by all callers and always stays within
// [0, max(1, nodes.size())). Each selection is a single compare-and-swap, so
// concurrent callers never receive the same slot of a rotation. The node list
// may differ between calls; a cursor past the end of a shorter list is wrapped
// before use.
class RoundRobinPolicy final : public ILoadBalancingPolicy {
public:
    std::string_view Name() const override { return "round_robin"; }

    // Thread-safe
    clusterlb::Result<cluster::Node> Pick(const std::vector<cluster::Node>& nodes) override;

    // Thread-safe
    clusterlb::Result<std::vector<cluster::Node>> Plan(const std::vector<cluster::Node>& nodes) override;

    std::size_t cursor() const { return cursor_.load(std::memory_order_acquire); }

private:
    // Returns the slot handed to this caller and leaves the cursor on the
    // following one. n must be non-zero.
    std::size_t Advance(std::size_t n);

    std::atomic<std::size_t> cursor_{0};
};

// "round_robin" is the only known name.
clusterlb::Result<std::shared_ptr<ILoadBalancingPolicy>> MakeLoadBalancingPolicy(std::string_view name);

} // namespace clusterlb::policy
