#include <clusterlb/cluster/topology.h>

#include <algorithm>

namespace clusterlb::cluster {

StaticTopology::StaticTopology() : nodes_(std::make_shared<const NodeList>()) {}

StaticTopology::StaticTopology(NodeList nodes) : nodes_(std::make_shared<const NodeList>(std::move(nodes))) {}

void StaticTopology::Set(NodeList nodes) {
    auto next = std::make_shared<const NodeList>(std::move(nodes));
    std::lock_guard<std::mutex> lk(mu_);
    nodes_ = std::move(next);
}

bool StaticTopology::Add(Node node) {
    std::lock_guard<std::mutex> lk(mu_);
    if (std::find(nodes_->begin(), nodes_->end(), node) != nodes_->end()) {
        return false;
    }
    auto next = std::make_shared<NodeList>(*nodes_);
    next->push_back(std::move(node));
    nodes_ = std::move(next);
    return true;
}

bool StaticTopology::Remove(const Node& node) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find(nodes_->begin(), nodes_->end(), node);
    if (it == nodes_->end()) {
        return false;
    }
    auto next = std::make_shared<NodeList>();
    next->reserve(nodes_->size() - 1);
    for (const auto& n : *nodes_) {
        if (n != node) {
            next->push_back(n);
        }
    }
    nodes_ = std::move(next);
    return true;
}

std::size_t StaticTopology::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return nodes_->size();
}

NodeSnapshot StaticTopology::Snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return nodes_;
}

} // namespace clusterlb::cluster
