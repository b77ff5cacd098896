#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include <clusterlb/cluster/node.h>

namespace clusterlb::cluster {

using NodeList = std::vector<Node>;
using NodeSnapshot = std::shared_ptr<const NodeList>;

// Read-only view of the current cluster membership.
class ITopology {
public:
    virtual ~ITopology() = default;

    // Thread-safe. Never returns null; an empty cluster is an empty list.
    virtual NodeSnapshot Snapshot() const = 0;
};

// Membership list owned by the caller. Updates publish a new list, so a
// snapshot taken earlier is never modified.
class StaticTopology final : public ITopology {
public:
    StaticTopology();
    explicit StaticTopology(NodeList nodes);

    // Thread-safe
    void Set(NodeList nodes);

    // Thread-safe. Returns false if the node is already a member.
    bool Add(Node node);

    // Thread-safe. Returns false if the node is not a member.
    bool Remove(const Node& node);

    // Thread-safe
    std::size_t size() const;

    NodeSnapshot Snapshot() const override;

private:
    mutable std::mutex mu_;
    NodeSnapshot nodes_;
};

} // namespace clusterlb::cluster
