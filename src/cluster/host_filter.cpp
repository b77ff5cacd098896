#include <clusterlb/cluster/host_filter.h>

#include <algorithm>

namespace clusterlb::cluster {

AllowListHostFilter::AllowListHostFilter(std::vector<Node> allowed, bool match_any_port)
    : allowed_(std::move(allowed)), match_any_port_(match_any_port) {}

bool AllowListHostFilter::Accept(const Node& node) const {
    return std::any_of(allowed_.begin(), allowed_.end(), [&](const Node& a) {
        return a.host == node.host && (match_any_port_ || a.port == node.port);
    });
}

FilteredTopology::FilteredTopology(std::shared_ptr<ITopology> inner, std::shared_ptr<const IHostFilter> filter)
    : inner_(std::move(inner)), filter_(std::move(filter)) {}

NodeSnapshot FilteredTopology::Snapshot() const {
    auto all = inner_->Snapshot();

    std::lock_guard<std::mutex> lk(mu_);
    if (all == last_inner_ && last_filtered_) {
        return last_filtered_;
    }

    auto kept = std::make_shared<NodeList>();
    for (const auto& n : *all) {
        if (filter_->Accept(n)) {
            kept->push_back(n);
        }
    }
    last_inner_ = std::move(all);
    last_filtered_ = std::move(kept);
    return last_filtered_;
}

} // namespace clusterlb::cluster
